#pragma once

#include "polyinfer/AST/AST.h"
#include "polyinfer/Infer/Environment.h"
#include "polyinfer/Types/Substitution.h"
#include "polyinfer/Types/Type.h"
#include "polyinfer/Types/TypeScheme.h"
#include <llvm/ADT/DenseMap.h>
#include <llvm/ADT/SmallVector.h>
#include <llvm/Support/Error.h>
#include <llvm/Support/raw_ostream.h>
#include <utility>

namespace polyinfer {

class TypeContext;

/// Resource ceilings of one inference. Zero disables a ceiling.
struct InferenceOptions {
  /// Maximum nesting depth of the traversal.
  unsigned maxDepth = 1024;
  /// Maximum number of expression nodes visited by one call to infer.
  unsigned maxSteps = 1000000;

  /// Options as given by -max-depth and -max-steps.
  static InferenceOptions fromCommandLine();
};

/// Result of inferring one expression: its type, with `subst` already
/// applied, and the substitution accumulated while inferring it.
struct Inferred {
  const Type *type;
  Substitution subst;
};

/// Algorithm W. An Inferencer allocates fresh variables from the context it
/// was created with, and remembers the type of every node it has
/// successfully inferred so the typed tree can be shown afterwards.
class Inferencer {
public:
  Inferencer(TypeContext &context, InferenceOptions options = {});

  llvm::Expected<Inferred> infer(const ExprAST &expr, const Environment &env);

  /// Principal type of `expr` under `env`.
  llvm::Expected<const Type *> inferType(const ExprAST &expr, const Environment &env);

  /// Scheme bound by a top-level `let [rec] name = value`, generalized over
  /// `env`.
  llvm::Expected<TypeScheme> inferDefinition(const ItemAST &item, const Environment &env);

  /// Final type of a node of a successfully inferred tree, or null.
  const Type *getType(const ExprAST &expr) const { return nodeTypes.lookup(&expr); }
  unsigned getNumTypedNodes() const { return nodeTypes.size(); }

  /// Forget the node types of earlier trees, before those trees are freed.
  void clearNodeTypes() { nodeTypes.clear(); }

  /// The tree with the final type of every node, one node per line.
  void dumpTypedTree(llvm::raw_ostream &os, const ExprAST &expr,
                     unsigned level = 0) const;

  TypeContext &getContext() { return context; }
  const InferenceOptions &getOptions() const { return options; }

private:
  /// A binding of `name` to `value` for let-expressions and definitions:
  /// the generalized scheme plus the substitution of the value.
  using Binding = std::pair<TypeScheme, Substitution>;

  llvm::Expected<Inferred> run(const ExprAST &expr, const Environment &env);
  llvm::Expected<Inferred> inferExpr(const ExprAST &expr, const Environment &env);
  llvm::Expected<Inferred> inferLiteral(const LiteralExprAST &lit);
  llvm::Expected<Inferred> inferVariable(const VariableExprAST &var, const Environment &env);
  llvm::Expected<Inferred> inferLambda(const LambdaExprAST &lambda, const Environment &env);
  llvm::Expected<Inferred> inferApplication(const ApplicationExprAST &application,
                                            const Environment &env);
  llvm::Expected<Inferred> inferLet(const LetExprAST &let, const Environment &env);
  llvm::Expected<Inferred> inferIf(const IfExprAST &ifExpr, const Environment &env);
  llvm::Expected<Binding> inferBinding(RecFlag recFlag, llvm::StringRef name,
                                       const ExprAST &value, const Environment &env);
  Substitution compose(const Substitution &older, const Substitution &newer);
  void finalize(const Substitution &subst);

  TypeContext &context;
  InferenceOptions options;
  unsigned depth = 0;
  unsigned steps = 0;
  llvm::DenseMap<const ExprAST *, const Type *> nodeTypes;
  llvm::SmallVector<const ExprAST *> pending;
};

} // namespace polyinfer
