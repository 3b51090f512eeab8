#include "polyinfer/AST/AST.h"
#include "llvm/ADT/TypeSwitch.h"
#include "llvm/Support/ErrorHandling.h"
#include "llvm/Support/raw_ostream.h"

namespace polyinfer {

llvm::StringRef ExprAST::getName(ExprKind kind) {
  switch (kind) {
  case Expr_Literal: return "Literal";
  case Expr_Variable: return "Variable";
  case Expr_Lambda: return "Lambda";
  case Expr_Application: return "Application";
  case Expr_Let: return "Let";
  case Expr_If: return "If";
  }
  llvm_unreachable("Unknown expression kind");
}

llvm::StringRef ExprAST::getName(const ExprAST &node) {
  return getName(node.getKind());
}

namespace {

// Precedence of the context an expression is printed in.
enum class Context {
  Top,      // anything goes
  Function, // left of an application: fun/let/if need parentheses
  Argument, // right of an application: applications need them too
};

void print(llvm::raw_ostream &os, const ExprAST &node, Context context);

void printLiteral(llvm::raw_ostream &os, const LiteralExprAST &lit) {
  switch (lit.getLiteralKind()) {
  case LiteralExprAST::Bool:
    os << (lit.getBoolValue() ? "true" : "false");
    return;
  case LiteralExprAST::Int:
    if (lit.getIntValue() < 0)
      os << '(' << lit.getIntValue() << ')';
    else
      os << lit.getIntValue();
    return;
  case LiteralExprAST::Unit:
    os << "()";
    return;
  }
}

void printBinding(llvm::raw_ostream &os, llvm::StringRef keyword, RecFlag recFlag,
                  llvm::StringRef name, const ExprAST &value) {
  os << keyword << ' ';
  if (recFlag == RecFlag::Recursive)
    os << "rec ";
  os << name << " = ";
  print(os, value, Context::Top);
}

void print(llvm::raw_ostream &os, const ExprAST &node, Context context) {
  const bool isCompound = !llvm::isa<LiteralExprAST, VariableExprAST>(node);
  const bool needsParens =
      isCompound && context != Context::Top &&
      !(llvm::isa<ApplicationExprAST>(node) && context == Context::Function);
  if (needsParens)
    os << '(';
  llvm::TypeSwitch<const ExprAST *>(&node)
      .Case<LiteralExprAST>([&](auto *lit) { printLiteral(os, *lit); })
      .Case<VariableExprAST>([&](auto *var) { os << var->getName(); })
      .Case<LambdaExprAST>([&](auto *lambda) {
        os << "fun " << lambda->getParameter() << " -> ";
        print(os, *lambda->getBody(), Context::Top);
      })
      .Case<ApplicationExprAST>([&](auto *application) {
        print(os, *application->getFunction(), Context::Function);
        os << ' ';
        print(os, *application->getArgument(), Context::Argument);
      })
      .Case<LetExprAST>([&](auto *let) {
        printBinding(os, "let", let->getRecFlag(), let->getName(), *let->getValue());
        os << " in ";
        print(os, *let->getBody(), Context::Top);
      })
      .Case<IfExprAST>([&](auto *ifExpr) {
        os << "if ";
        print(os, *ifExpr->getCondition(), Context::Top);
        os << " then ";
        print(os, *ifExpr->getThen(), Context::Top);
        os << " else ";
        print(os, *ifExpr->getElse(), Context::Top);
      });
  if (needsParens)
    os << ')';
}

} // namespace

llvm::raw_ostream& operator<<(llvm::raw_ostream &os, const ExprAST &node) {
  print(os, node, Context::Top);
  return os;
}

llvm::raw_ostream& operator<<(llvm::raw_ostream &os, const ItemAST &item) {
  if (item.isDefinition())
    printBinding(os, "let", item.getRecFlag(), item.getName(), *item.getValue());
  else
    os << *item.getValue();
  return os;
}

llvm::raw_ostream& operator<<(llvm::raw_ostream &os, const CompilationUnitAST &unit) {
  for (const auto &item : unit.getItems())
    os << *item << "\n";
  return os;
}

// Indented tree dump, one node per line
static void indent(llvm::raw_ostream &os, unsigned level) {
  for (unsigned i = 0; i < level; ++i)
    os << "  ";
}

static void dumpLocation(llvm::raw_ostream &os, const Location &loc) {
  if (loc.isValid())
    os << " <" << loc.line << ':' << loc.column << '>';
}

static void dumpExpr(llvm::raw_ostream &os, const ExprAST &node, unsigned level) {
  indent(os, level);
  os << ExprAST::getName(node);
  llvm::TypeSwitch<const ExprAST *>(&node)
      .Case<LiteralExprAST>([&](auto *lit) {
        os << ' ';
        printLiteral(os, *lit);
        dumpLocation(os, node.loc());
        os << '\n';
      })
      .Case<VariableExprAST>([&](auto *var) {
        os << " '" << var->getName() << "'";
        dumpLocation(os, node.loc());
        os << '\n';
      })
      .Case<LambdaExprAST>([&](auto *lambda) {
        os << " '" << lambda->getParameter() << "'";
        dumpLocation(os, node.loc());
        os << '\n';
        dumpExpr(os, *lambda->getBody(), level + 1);
      })
      .Case<ApplicationExprAST>([&](auto *application) {
        dumpLocation(os, node.loc());
        os << '\n';
        dumpExpr(os, *application->getFunction(), level + 1);
        dumpExpr(os, *application->getArgument(), level + 1);
      })
      .Case<LetExprAST>([&](auto *let) {
        os << (let->isRecursive() ? " rec" : "") << " '" << let->getName() << "'";
        dumpLocation(os, node.loc());
        os << '\n';
        dumpExpr(os, *let->getValue(), level + 1);
        dumpExpr(os, *let->getBody(), level + 1);
      })
      .Case<IfExprAST>([&](auto *ifExpr) {
        dumpLocation(os, node.loc());
        os << '\n';
        dumpExpr(os, *ifExpr->getCondition(), level + 1);
        dumpExpr(os, *ifExpr->getThen(), level + 1);
        dumpExpr(os, *ifExpr->getElse(), level + 1);
      });
}

void dumpAST(llvm::raw_ostream &os, const CompilationUnitAST &unit) {
  os << "CompilationUnit " << unit.loc().filename << "\n";
  for (const auto &item : unit.getItems()) {
    indent(os, 1);
    if (item->isDefinition())
      os << "Definition" << (item->isRecursive() ? " rec" : "") << " '"
         << item->getName() << "'";
    else
      os << "Expression";
    dumpLocation(os, item->loc());
    os << '\n';
    dumpExpr(os, *item->getValue(), 2);
  }
}

namespace ast {

ExprPtr var(std::string name) {
  return std::make_unique<VariableExprAST>(Location{}, std::move(name));
}

ExprPtr lambda(std::string parameter, ExprPtr body) {
  return std::make_unique<LambdaExprAST>(Location{}, std::move(parameter), std::move(body));
}

ExprPtr app(ExprPtr function, ExprPtr argument) {
  return std::make_unique<ApplicationExprAST>(Location{}, std::move(function),
                                              std::move(argument));
}

ExprPtr let(std::string name, ExprPtr value, ExprPtr body) {
  return std::make_unique<LetExprAST>(Location{}, RecFlag::Nonrecursive, std::move(name),
                                      std::move(value), std::move(body));
}

ExprPtr letrec(std::string name, ExprPtr value, ExprPtr body) {
  return std::make_unique<LetExprAST>(Location{}, RecFlag::Recursive, std::move(name),
                                      std::move(value), std::move(body));
}

ExprPtr ifThenElse(ExprPtr condition, ExprPtr thenBranch, ExprPtr elseBranch) {
  return std::make_unique<IfExprAST>(Location{}, std::move(condition),
                                     std::move(thenBranch), std::move(elseBranch));
}

ExprPtr intLit(int64_t value) {
  return LiteralExprAST::getInt(Location{}, value);
}

ExprPtr boolLit(bool value) {
  return LiteralExprAST::getBool(Location{}, value);
}

ExprPtr unitLit() {
  return LiteralExprAST::getUnit(Location{});
}

} // namespace ast

} // namespace polyinfer
