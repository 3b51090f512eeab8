#pragma once

#include "polyinfer/Types/Type.h"
#include <llvm/Support/raw_ostream.h>
#include <string>

namespace polyinfer {

class Environment;
class TypeContext;

/// A polytype `forall vars. body`. The quantified variables are always a
/// subset of the free variables of the body; the constructor drops any that
/// are not.
struct TypeScheme {
  TypeScheme(const Type *body) : body(body) {}
  TypeScheme(TypeVarSet vars, const Type *body);

  const TypeVarSet &getVars() const { return vars; }
  const Type *getBody() const { return body; }
  bool isMonomorphic() const { return vars.empty(); }
  friend llvm::raw_ostream &operator<<(llvm::raw_ostream &os, const TypeScheme &scheme);

private:
  TypeVarSet vars;
  const Type *body;
};

TypeVarSet freeTypeVariables(const TypeScheme &scheme);

/// Quantify over the variables of `type` that are not free in `env`.
TypeScheme generalize(const Type *type, const Environment &env);

/// Replace every quantified variable with a fresh one from `context`.
const Type *instantiate(TypeContext &context, const TypeScheme &scheme);

/// The body printed with display names; quantifiers are implicit, as in
/// `'a -> 'a`.
std::string showScheme(const TypeScheme &scheme);

} // namespace polyinfer
