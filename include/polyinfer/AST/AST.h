#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Casting.h>
#include <llvm/Support/raw_ostream.h>
#include "polyinfer/AST/Location.h"

namespace polyinfer {

class ExprAST;
class ItemAST;
class CompilationUnitAST;
llvm::raw_ostream& operator<<(llvm::raw_ostream &os, const ExprAST &node);
llvm::raw_ostream& operator<<(llvm::raw_ostream &os, const ItemAST &item);
llvm::raw_ostream& operator<<(llvm::raw_ostream &os, const CompilationUnitAST &unit);

enum class RecFlag {
  Nonrecursive,
  Recursive
};

/// Base class for all expression nodes
class ExprAST {
public:
  enum ExprKind {
    Expr_Literal,
    Expr_Variable,
    Expr_Lambda,
    Expr_Application,
    Expr_Let,
    Expr_If,
  };

  ExprAST(ExprKind kind, Location loc = {}) : kind(kind), location(std::move(loc)) {}
  virtual ~ExprAST() = default;

  ExprKind getKind() const { return kind; }
  const Location& loc() const { return location; }
  static llvm::StringRef getName(ExprKind kind);
  static llvm::StringRef getName(const ExprAST &node);

private:
  const ExprKind kind;
  Location location;
};

using ExprPtr = std::unique_ptr<ExprAST>;

/// Literal of one of the base types (e.g., 1, true, ())
class LiteralExprAST : public ExprAST {
public:
  enum LiteralKind {
    Bool,
    Int,
    Unit,
  };

  static std::unique_ptr<LiteralExprAST> getBool(Location loc, bool value) {
    return std::unique_ptr<LiteralExprAST>(new LiteralExprAST(std::move(loc), Bool, value));
  }
  static std::unique_ptr<LiteralExprAST> getInt(Location loc, int64_t value) {
    return std::unique_ptr<LiteralExprAST>(new LiteralExprAST(std::move(loc), Int, value));
  }
  static std::unique_ptr<LiteralExprAST> getUnit(Location loc) {
    return std::unique_ptr<LiteralExprAST>(new LiteralExprAST(std::move(loc), Unit, 0));
  }

  LiteralKind getLiteralKind() const { return literalKind; }
  bool getBoolValue() const { return value != 0; }
  int64_t getIntValue() const { return value; }

  static bool classof(const ExprAST* node) {
    return node->getKind() == Expr_Literal;
  }

private:
  LiteralExprAST(Location loc, LiteralKind literalKind, int64_t value)
    : ExprAST(Expr_Literal, std::move(loc)), literalKind(literalKind), value(value) {}
  LiteralKind literalKind;
  int64_t value;
};

/// Variable reference (e.g., x)
class VariableExprAST : public ExprAST {
  std::string name;
public:
  VariableExprAST(Location loc, std::string name)
    : ExprAST(Expr_Variable, std::move(loc)), name(std::move(name)) {}

  const std::string& getName() const { return name; }

  static bool classof(const ExprAST* node) {
    return node->getKind() == Expr_Variable;
  }
};

/// Single-parameter function (e.g., fun x -> x)
class LambdaExprAST : public ExprAST {
  std::string parameter;
  ExprPtr body;
public:
  LambdaExprAST(Location loc, std::string parameter, ExprPtr body)
    : ExprAST(Expr_Lambda, std::move(loc)), parameter(std::move(parameter)),
      body(std::move(body)) {}

  const std::string& getParameter() const { return parameter; }
  const ExprAST* getBody() const { return body.get(); }

  static bool classof(const ExprAST* node) {
    return node->getKind() == Expr_Lambda;
  }
};

/// Function application (e.g., f x)
class ApplicationExprAST : public ExprAST {
  ExprPtr function;
  ExprPtr argument;
public:
  ApplicationExprAST(Location loc, ExprPtr function, ExprPtr argument)
    : ExprAST(Expr_Application, std::move(loc)), function(std::move(function)),
      argument(std::move(argument)) {}

  const ExprAST* getFunction() const { return function.get(); }
  const ExprAST* getArgument() const { return argument.get(); }

  static bool classof(const ExprAST* node) {
    return node->getKind() == Expr_Application;
  }
};

/// Let expression (e.g., let x = 1 in x, let rec f = fun n -> f n in f)
class LetExprAST : public ExprAST {
  RecFlag recFlag;
  std::string name;
  ExprPtr value;
  ExprPtr body;
public:
  LetExprAST(Location loc, RecFlag recFlag, std::string name, ExprPtr value, ExprPtr body)
    : ExprAST(Expr_Let, std::move(loc)), recFlag(recFlag), name(std::move(name)),
      value(std::move(value)), body(std::move(body)) {}

  bool isRecursive() const { return recFlag == RecFlag::Recursive; }
  RecFlag getRecFlag() const { return recFlag; }
  const std::string& getName() const { return name; }
  const ExprAST* getValue() const { return value.get(); }
  const ExprAST* getBody() const { return body.get(); }

  static bool classof(const ExprAST* node) {
    return node->getKind() == Expr_Let;
  }
};

/// If expression (e.g., if c then a else b)
class IfExprAST : public ExprAST {
  ExprPtr condition;
  ExprPtr thenBranch;
  ExprPtr elseBranch;
public:
  IfExprAST(Location loc, ExprPtr condition, ExprPtr thenBranch, ExprPtr elseBranch)
    : ExprAST(Expr_If, std::move(loc)), condition(std::move(condition)),
      thenBranch(std::move(thenBranch)), elseBranch(std::move(elseBranch)) {}

  const ExprAST* getCondition() const { return condition.get(); }
  const ExprAST* getThen() const { return thenBranch.get(); }
  const ExprAST* getElse() const { return elseBranch.get(); }

  static bool classof(const ExprAST* node) {
    return node->getKind() == Expr_If;
  }
};

/// Top-level item: a definition `let [rec] x = e` or a bare expression
class ItemAST {
public:
  enum ItemKind {
    Item_Definition,
    Item_Expression,
  };

  static std::unique_ptr<ItemAST> getDefinition(Location loc, RecFlag recFlag,
                                                std::string name, ExprPtr value) {
    return std::unique_ptr<ItemAST>(new ItemAST(std::move(loc), Item_Definition,
                                                recFlag, std::move(name), std::move(value)));
  }
  static std::unique_ptr<ItemAST> getExpression(Location loc, ExprPtr value) {
    return std::unique_ptr<ItemAST>(new ItemAST(std::move(loc), Item_Expression,
                                                RecFlag::Nonrecursive, "", std::move(value)));
  }

  ItemKind getKind() const { return kind; }
  bool isDefinition() const { return kind == Item_Definition; }
  bool isRecursive() const { return recFlag == RecFlag::Recursive; }
  RecFlag getRecFlag() const { return recFlag; }
  const std::string& getName() const { return name; }
  const ExprAST* getValue() const { return value.get(); }
  ExprPtr takeValue() { return std::move(value); }
  const Location& loc() const { return location; }

private:
  ItemAST(Location loc, ItemKind kind, RecFlag recFlag, std::string name, ExprPtr value)
    : kind(kind), recFlag(recFlag), name(std::move(name)), value(std::move(value)),
      location(std::move(loc)) {}
  ItemKind kind;
  RecFlag recFlag;
  std::string name;
  ExprPtr value;
  Location location;
};

/// A whole source file or REPL entry
class CompilationUnitAST {
  std::vector<std::unique_ptr<ItemAST>> items;
  Location location;
public:
  CompilationUnitAST(Location loc, std::vector<std::unique_ptr<ItemAST>> items)
    : items(std::move(items)), location(std::move(loc)) {}

  const std::vector<std::unique_ptr<ItemAST>>& getItems() const { return items; }
  const Location& loc() const { return location; }
};

/// Indented tree dump, as printed by -dparsetree.
void dumpAST(llvm::raw_ostream &os, const CompilationUnitAST &unit);

/// Builders for constructing trees without a parser.
namespace ast {
ExprPtr var(std::string name);
ExprPtr lambda(std::string parameter, ExprPtr body);
/// Curried application: app(f, a, b) is (f a) b.
ExprPtr app(ExprPtr function, ExprPtr argument);
template <typename... Rest>
ExprPtr app(ExprPtr function, ExprPtr argument, Rest&&... rest) {
  return app(app(std::move(function), std::move(argument)), std::forward<Rest>(rest)...);
}
ExprPtr let(std::string name, ExprPtr value, ExprPtr body);
ExprPtr letrec(std::string name, ExprPtr value, ExprPtr body);
ExprPtr ifThenElse(ExprPtr condition, ExprPtr thenBranch, ExprPtr elseBranch);
ExprPtr intLit(int64_t value);
ExprPtr boolLit(bool value);
ExprPtr unitLit();
} // namespace ast

} // namespace polyinfer
