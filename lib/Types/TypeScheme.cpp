#include "polyinfer/Types/TypeScheme.h"
#include "polyinfer/Infer/Environment.h"
#include "polyinfer/Types/Substitution.h"
#include "polyinfer/Types/TypeContext.h"
#include <algorithm>
#include <iterator>
#define DEBUG_TYPE "TypeScheme.cpp"
#include "polyinfer/Support/Debug.h.inc"

namespace polyinfer {

static TypeVarSet difference(const TypeVarSet &a, const TypeVarSet &b) {
  TypeVarSet result;
  std::set_difference(a.begin(), a.end(), b.begin(), b.end(),
                      std::inserter(result, result.end()));
  return result;
}

TypeScheme::TypeScheme(TypeVarSet quantified, const Type *body) : body(body) {
  if (quantified.empty()) {
    return;
  }
  const auto free = polyinfer::freeTypeVariables(body);
  std::set_intersection(quantified.begin(), quantified.end(), free.begin(),
                        free.end(), std::inserter(vars, vars.end()));
}

TypeVarSet freeTypeVariables(const TypeScheme &scheme) {
  return difference(freeTypeVariables(scheme.getBody()), scheme.getVars());
}

TypeScheme generalize(const Type *type, const Environment &env) {
  auto vars = difference(freeTypeVariables(type), env.freeTypeVariables());
  TypeScheme scheme(std::move(vars), type);
  DBGS("generalized " << *type << " to " << scheme << '\n');
  return scheme;
}

const Type *instantiate(TypeContext &context, const TypeScheme &scheme) {
  if (scheme.isMonomorphic()) {
    return scheme.getBody();
  }
  Substitution fresh;
  for (TypeVarId var : scheme.getVars()) {
    // Binding a variable to a fresh one can never fail the occurs check.
    fresh = Substitution::compose(
        context, fresh,
        llvm::cantFail(Substitution::bind(var, context.freshTypeVariable())));
  }
  const Type *instance = fresh.apply(context, scheme.getBody());
  DBGS("instantiated " << scheme << " to " << *instance << '\n');
  return instance;
}

std::string showScheme(const TypeScheme &scheme) {
  return showType(scheme.getBody());
}

llvm::raw_ostream &operator<<(llvm::raw_ostream &os, const TypeScheme &scheme) {
  if (!scheme.isMonomorphic()) {
    os << "forall";
    for (TypeVarId var : scheme.getVars()) {
      os << ' ' << TypeVariableNames::getRawName(var);
    }
    os << ". ";
  }
  return os << *scheme.getBody();
}

} // namespace polyinfer
