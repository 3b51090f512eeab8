#pragma once

#include <llvm/ADT/DenseMap.h>
#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Casting.h>
#include <llvm/Support/raw_ostream.h>
#include <set>
#include <string>

namespace polyinfer {

using TypeVarId = unsigned;
using TypeVarSet = std::set<TypeVarId>;

struct Type;
struct BaseType;
struct FunctionType;
struct TypeVariable;
class TypeContext;

/// Passkey for the type constructors; only a TypeContext can make one.
class TypeKey {
  friend class TypeContext;
  TypeKey() = default;
};

/// A monotype. Types are immutable and owned by the TypeContext that created
/// them; a context uniques them, so structurally equal types of one context
/// share the same address.
struct Type {
  enum Kind {
    Bool,
    Int,
    Unit,
    Function,
    Variable,
  };
  Type(const Type &) = delete;
  Type &operator=(const Type &) = delete;
  virtual ~Type() = default;
  Kind getKind() const { return kind; }
  friend llvm::raw_ostream &operator<<(llvm::raw_ostream &os, const Type &type);

protected:
  Type(Kind kind) : kind(kind) {}

private:
  const Kind kind;
};

/// Structural equality. Types from the same context compare by address.
bool operator==(const Type &a, const Type &b);
inline bool operator!=(const Type &a, const Type &b) { return !(a == b); }

/// Bool, Int and Unit.
struct BaseType : public Type {
  llvm::StringRef getName() const;
  static inline bool classof(const Type *type) {
    return type->getKind() == Kind::Bool || type->getKind() == Kind::Int ||
           type->getKind() == Kind::Unit;
  }
  BaseType(TypeKey, Kind kind) : Type(kind) {}
};

struct FunctionType : public Type {
  const Type *getParam() const { return param; }
  const Type *getResult() const { return result; }
  static inline bool classof(const Type *type) {
    return type->getKind() == Kind::Function;
  }
  FunctionType(TypeKey, const Type *param, const Type *result)
      : Type(Kind::Function), param(param), result(result) {}

private:
  const Type *param;
  const Type *result;
};

struct TypeVariable : public Type {
  TypeVarId getId() const { return id; }
  static inline bool classof(const Type *type) {
    return type->getKind() == Kind::Variable;
  }
  TypeVariable(TypeKey, TypeVarId id) : Type(Kind::Variable), id(id) {}

private:
  TypeVarId id;
};

TypeVarSet freeTypeVariables(const Type *type);
bool occursIn(TypeVarId var, const Type *type);

/// True if `a` and `b` are equal up to a consistent, bijective renaming of
/// their type variables.
bool alphaEquivalent(const Type *a, const Type *b);

/// Display names for type variables: 'a, 'b, ... 'z, 'a1, ... handed out in
/// order of first appearance. One instance is shared by every type printed in
/// the same message so that a variable keeps its name across them.
class TypeVariableNames {
public:
  std::string getName(TypeVarId var);
  static std::string getRawName(TypeVarId var);
  llvm::raw_ostream &print(llvm::raw_ostream &os, const Type *type);

private:
  llvm::DenseMap<TypeVarId, unsigned> names;
};

/// Render with display names ('a, 'b, ...), or with raw ids when
/// -raw-type-vars is given.
std::string showType(const Type *type);

} // namespace polyinfer
