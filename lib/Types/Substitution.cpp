#include "polyinfer/Types/Substitution.h"
#include "polyinfer/Infer/Environment.h"
#include "polyinfer/Types/TypeContext.h"
#include "polyinfer/Types/TypeError.h"
#include <llvm/ADT/STLExtras.h>
#define DEBUG_TYPE "Substitution.cpp"
#include "polyinfer/Support/Debug.h.inc"

namespace polyinfer {

llvm::Expected<Substitution> Substitution::bind(TypeVarId var,
                                                const Type *type) {
  if (auto *tv = llvm::dyn_cast<TypeVariable>(type); tv && tv->getId() == var) {
    return Substitution();
  }
  if (occursIn(var, type)) {
    return TypeError::occursCheckFailure(var, type);
  }
  MapTy map;
  map[var] = type;
  return Substitution(std::move(map));
}

Substitution Substitution::compose(TypeContext &context,
                                   const Substitution &older,
                                   const Substitution &newer) {
  if (older.empty()) {
    return newer;
  }
  if (newer.empty()) {
    return older;
  }
  MapTy map;
  map.reserve(older.size() + newer.size());
  for (const auto &[var, type] : older.map) {
    map[var] = newer.apply(context, type);
  }
  for (const auto &[var, type] : newer.map) {
    map.try_emplace(var, type);
  }
  Substitution composed(std::move(map));
  DBGS("composed " << older << " with " << newer << " into " << composed << '\n');
  return composed;
}

const Type *Substitution::apply(TypeContext &context, const Type *type,
                                const TypeVarSet *bound) const {
  if (auto *tv = llvm::dyn_cast<TypeVariable>(type)) {
    if (bound && bound->count(tv->getId())) {
      return type;
    }
    if (const Type *replacement = map.lookup(tv->getId())) {
      return replacement;
    }
    return type;
  }
  if (auto *func = llvm::dyn_cast<FunctionType>(type)) {
    const Type *param = apply(context, func->getParam(), bound);
    const Type *result = apply(context, func->getResult(), bound);
    if (param == func->getParam() && result == func->getResult()) {
      return type;
    }
    return context.getFunctionType(param, result);
  }
  return type;
}

const Type *Substitution::apply(TypeContext &context, const Type *type) const {
  if (empty()) {
    return type;
  }
  return apply(context, type, nullptr);
}

TypeScheme Substitution::apply(TypeContext &context,
                               const TypeScheme &scheme) const {
  if (empty()) {
    return scheme;
  }
  const auto &vars = scheme.getVars();
  return TypeScheme(vars, apply(context, scheme.getBody(),
                                vars.empty() ? nullptr : &vars));
}

Environment Substitution::apply(TypeContext &context,
                                const Environment &env) const {
  if (empty()) {
    return env;
  }
  return env.map(
      [&](const TypeScheme &scheme) { return apply(context, scheme); });
}

TypeVarSet Substitution::getDomain() const {
  TypeVarSet domain;
  for (const auto &entry : map) {
    domain.insert(entry.first);
  }
  return domain;
}

llvm::SmallVector<std::pair<TypeVarId, const Type *>>
Substitution::getBindings() const {
  llvm::SmallVector<std::pair<TypeVarId, const Type *>> bindings(map.begin(),
                                                                 map.end());
  llvm::sort(bindings, [](const auto &a, const auto &b) {
    return a.first < b.first;
  });
  return bindings;
}

llvm::raw_ostream &operator<<(llvm::raw_ostream &os, const Substitution &sub) {
  os << '{';
  llvm::interleaveComma(sub.getBindings(), os, [&](const auto &binding) {
    os << TypeVariableNames::getRawName(binding.first) << " := "
       << *binding.second;
  });
  return os << '}';
}

} // namespace polyinfer
