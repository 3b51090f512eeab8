#include "polyinfer/Infer/Inference.h"
#include "polyinfer/Support/CL.h"
#include "polyinfer/Support/Colors.h"
#include "polyinfer/Types/TypeContext.h"
#include "polyinfer/Types/TypeError.h"
#include "polyinfer/Types/Unify.h"
#include <llvm/ADT/TypeSwitch.h>
#include <llvm/Support/raw_ostream.h>

#define DEBUG_TYPE "Inference.cpp"
#include "polyinfer/Support/Debug.h.inc"

namespace polyinfer {

InferenceOptions InferenceOptions::fromCommandLine() {
  InferenceOptions options;
  options.maxDepth = CL::MaxDepth;
  options.maxSteps = CL::MaxSteps;
  return options;
}

namespace {
struct DepthScope {
  DepthScope(unsigned &depth) : depth(depth) { ++depth; }
  ~DepthScope() { --depth; }
  unsigned &depth;
};
} // namespace

// Errors keep the innermost location they were given.
static llvm::Error withLocation(llvm::Error error, const Location &loc) {
  if (!loc.isValid()) {
    return error;
  }
  return llvm::handleErrors(
      std::move(error), [&](std::unique_ptr<TypeError> typeError) -> llvm::Error {
        if (!typeError->getLocation()) {
          typeError->setLocation(loc);
        }
        return llvm::Error(std::move(typeError));
      });
}

Inferencer::Inferencer(TypeContext &context, InferenceOptions options)
    : context(context), options(options) {}

Substitution Inferencer::compose(const Substitution &older,
                                 const Substitution &newer) {
  return Substitution::compose(context, older, newer);
}

void Inferencer::finalize(const Substitution &subst) {
  for (const ExprAST *node : pending) {
    auto &type = nodeTypes[node];
    type = subst.apply(context, type);
  }
  pending.clear();
}

llvm::Expected<Inferred> Inferencer::run(const ExprAST &expr,
                                         const Environment &env) {
  depth = 0;
  steps = 0;
  pending.clear();
  auto result = inferExpr(expr, env);
  if (!result) {
    pending.clear();
    return result.takeError();
  }
  finalize(result->subst);
  return result;
}

llvm::Expected<Inferred> Inferencer::infer(const ExprAST &expr,
                                           const Environment &env) {
  DBGS("Inferring: " << expr << '\n');
  return run(expr, env);
}

llvm::Expected<const Type *> Inferencer::inferType(const ExprAST &expr,
                                                   const Environment &env) {
  auto result = infer(expr, env);
  if (!result) {
    return result.takeError();
  }
  DBGS("Principal type of " << expr << " is " << *result->type << '\n');
  return result->type;
}

llvm::Expected<TypeScheme> Inferencer::inferDefinition(const ItemAST &item,
                                                       const Environment &env) {
  DBGS("Inferring definition: " << item << '\n');
  depth = 0;
  steps = 0;
  pending.clear();
  auto binding = inferBinding(item.getRecFlag(), item.getName(),
                              *item.getValue(), env);
  if (!binding) {
    pending.clear();
    return withLocation(binding.takeError(), item.loc());
  }
  finalize(binding->second);
  return std::move(binding->first);
}

llvm::Expected<Inferred> Inferencer::inferExpr(const ExprAST &expr,
                                               const Environment &env) {
  if (options.maxSteps && ++steps > options.maxSteps) {
    return withLocation(TypeError::inferenceTooComplex(TypeError::Limit::Steps,
                                                       options.maxSteps),
                        expr.loc());
  }
  DepthScope scope(depth);
  if (options.maxDepth && depth > options.maxDepth) {
    return withLocation(TypeError::inferenceTooComplex(TypeError::Limit::Depth,
                                                       options.maxDepth),
                        expr.loc());
  }

  llvm::Expected<Inferred> result =
      llvm::TypeSwitch<const ExprAST *, llvm::Expected<Inferred>>(&expr)
          .Case<LiteralExprAST>([&](auto *lit) { return inferLiteral(*lit); })
          .Case<VariableExprAST>(
              [&](auto *var) { return inferVariable(*var, env); })
          .Case<LambdaExprAST>(
              [&](auto *lambda) { return inferLambda(*lambda, env); })
          .Case<ApplicationExprAST>([&](auto *application) {
            return inferApplication(*application, env);
          })
          .Case<LetExprAST>([&](auto *let) { return inferLet(*let, env); })
          .Case<IfExprAST>([&](auto *ifExpr) { return inferIf(*ifExpr, env); });
  if (!result) {
    return withLocation(result.takeError(), expr.loc());
  }
  DBGS(ExprAST::getName(expr) << " : " << *result->type << " with "
                              << result->subst << '\n');
  nodeTypes[&expr] = result->type;
  pending.push_back(&expr);
  return result;
}

llvm::Expected<Inferred> Inferencer::inferLiteral(const LiteralExprAST &lit) {
  switch (lit.getLiteralKind()) {
  case LiteralExprAST::Bool:
    return Inferred{context.getBoolType(), {}};
  case LiteralExprAST::Int:
    return Inferred{context.getIntType(), {}};
  case LiteralExprAST::Unit:
    return Inferred{context.getUnitType(), {}};
  }
  llvm_unreachable("Unknown literal kind");
}

llvm::Expected<Inferred> Inferencer::inferVariable(const VariableExprAST &var,
                                                   const Environment &env) {
  const TypeScheme *scheme = env.lookup(var.getName());
  if (!scheme) {
    return TypeError::undefinedVariable(var.getName());
  }
  return Inferred{instantiate(context, *scheme), {}};
}

llvm::Expected<Inferred> Inferencer::inferLambda(const LambdaExprAST &lambda,
                                                 const Environment &env) {
  const Type *param = context.freshTypeVariable();
  auto body = inferExpr(*lambda.getBody(),
                        env.extend(lambda.getParameter(), TypeScheme(param)));
  if (!body) {
    return body.takeError();
  }
  const Type *type =
      context.getFunctionType(body->subst.apply(context, param), body->type);
  return Inferred{type, std::move(body->subst)};
}

llvm::Expected<Inferred>
Inferencer::inferApplication(const ApplicationExprAST &application,
                             const Environment &env) {
  auto function = inferExpr(*application.getFunction(), env);
  if (!function) {
    return function.takeError();
  }
  const Substitution &s1 = function->subst;
  auto argument =
      inferExpr(*application.getArgument(), s1.apply(context, env));
  if (!argument) {
    return argument.takeError();
  }
  const Substitution &s2 = argument->subst;
  const Type *result = context.freshTypeVariable();
  auto s3 = unify(context, s2.apply(context, function->type),
                  context.getFunctionType(argument->type, result));
  if (!s3) {
    return s3.takeError();
  }
  return Inferred{s3->apply(context, result), compose(compose(s1, s2), *s3)};
}

llvm::Expected<Inferencer::Binding>
Inferencer::inferBinding(RecFlag recFlag, llvm::StringRef name,
                         const ExprAST &value, const Environment &env) {
  if (recFlag == RecFlag::Nonrecursive) {
    auto inferred = inferExpr(value, env);
    if (!inferred) {
      return inferred.takeError();
    }
    TypeScheme scheme =
        generalize(inferred->type, inferred->subst.apply(context, env));
    return Binding{std::move(scheme), std::move(inferred->subst)};
  }

  // The name is monomorphic inside its own definition.
  const Type *self = context.freshTypeVariable();
  auto inferred = inferExpr(value, env.extend(name, TypeScheme(self)));
  if (!inferred) {
    return inferred.takeError();
  }
  const Substitution &s1 = inferred->subst;
  auto s2 = unify(context, s1.apply(context, self), inferred->type);
  if (!s2) {
    return s2.takeError();
  }
  Substitution subst = compose(s1, *s2);
  TypeScheme scheme = generalize(subst.apply(context, inferred->type),
                                 subst.apply(context, env));
  return Binding{std::move(scheme), std::move(subst)};
}

llvm::Expected<Inferred> Inferencer::inferLet(const LetExprAST &let,
                                              const Environment &env) {
  auto binding =
      inferBinding(let.getRecFlag(), let.getName(), *let.getValue(), env);
  if (!binding) {
    return binding.takeError();
  }
  auto &[scheme, s1] = *binding;
  DBGS("let " << let.getName() << " : " << scheme << '\n');
  auto body = inferExpr(*let.getBody(),
                        s1.apply(context, env).extend(let.getName(), scheme));
  if (!body) {
    return body.takeError();
  }
  return Inferred{body->type, compose(s1, body->subst)};
}

llvm::Expected<Inferred> Inferencer::inferIf(const IfExprAST &ifExpr,
                                             const Environment &env) {
  auto condition = inferExpr(*ifExpr.getCondition(), env);
  if (!condition) {
    return condition.takeError();
  }
  auto s2 = unify(context, condition->type, context.getBoolType());
  if (!s2) {
    return withLocation(s2.takeError(), ifExpr.getCondition()->loc());
  }
  Substitution subst = compose(condition->subst, *s2);

  auto thenBranch = inferExpr(*ifExpr.getThen(), subst.apply(context, env));
  if (!thenBranch) {
    return thenBranch.takeError();
  }
  subst = compose(subst, thenBranch->subst);

  auto elseBranch = inferExpr(*ifExpr.getElse(), subst.apply(context, env));
  if (!elseBranch) {
    return elseBranch.takeError();
  }
  subst = compose(subst, elseBranch->subst);

  auto s5 = unify(context, elseBranch->subst.apply(context, thenBranch->type),
                  elseBranch->type);
  if (!s5) {
    return withLocation(s5.takeError(), ifExpr.getElse()->loc());
  }
  return Inferred{s5->apply(context, elseBranch->type), compose(subst, *s5)};
}

static void indent(llvm::raw_ostream &os, unsigned level) {
  for (unsigned i = 0; i < level; ++i)
    os << "  ";
}

static void dumpTypedNode(llvm::raw_ostream &os, const ExprAST &expr,
                          const Inferencer &inferencer,
                          TypeVariableNames &names, unsigned level) {
  indent(os, level);
  os << ExprAST::getName(expr);
  llvm::SmallVector<const ExprAST *> children;
  llvm::TypeSwitch<const ExprAST *>(&expr)
      .Case<LiteralExprAST>([&](auto *lit) { os << ' ' << *lit; })
      .Case<VariableExprAST>([&](auto *var) { os << " '" << var->getName() << "'"; })
      .Case<LambdaExprAST>([&](auto *lambda) {
        os << " '" << lambda->getParameter() << "'";
        children.push_back(lambda->getBody());
      })
      .Case<ApplicationExprAST>([&](auto *application) {
        children.push_back(application->getFunction());
        children.push_back(application->getArgument());
      })
      .Case<LetExprAST>([&](auto *let) {
        os << (let->isRecursive() ? " rec" : "") << " '" << let->getName() << "'";
        children.push_back(let->getValue());
        children.push_back(let->getBody());
      })
      .Case<IfExprAST>([&](auto *ifExpr) {
        children.push_back(ifExpr->getCondition());
        children.push_back(ifExpr->getThen());
        children.push_back(ifExpr->getElse());
      });
  if (const Type *type = inferencer.getType(expr)) {
    os << " : " << ANSIColors::magenta();
    names.print(os, type);
    os << ANSIColors::reset();
  }
  os << '\n';
  for (const ExprAST *child : children) {
    dumpTypedNode(os, *child, inferencer, names, level + 1);
  }
}

void Inferencer::dumpTypedTree(llvm::raw_ostream &os, const ExprAST &expr,
                               unsigned level) const {
  TypeVariableNames names;
  dumpTypedNode(os, expr, *this, names, level);
}

} // namespace polyinfer
