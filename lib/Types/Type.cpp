#include "polyinfer/Types/Type.h"
#include "polyinfer/Support/CL.h"
#include <llvm/ADT/STLExtras.h>
#include <llvm/ADT/TypeSwitch.h>
#define DEBUG_TYPE "Type.cpp"
#include "polyinfer/Support/Debug.h.inc"

namespace polyinfer {

bool operator==(const Type &a, const Type &b) {
  if (&a == &b) {
    return true;
  }
  if (a.getKind() != b.getKind()) {
    return false;
  }
  if (auto *fa = llvm::dyn_cast<FunctionType>(&a)) {
    auto *fb = llvm::cast<FunctionType>(&b);
    return *fa->getParam() == *fb->getParam() &&
           *fa->getResult() == *fb->getResult();
  }
  if (auto *va = llvm::dyn_cast<TypeVariable>(&a)) {
    return va->getId() == llvm::cast<TypeVariable>(&b)->getId();
  }
  return true;
}

llvm::StringRef BaseType::getName() const {
  switch (getKind()) {
  case Kind::Bool:
    return "bool";
  case Kind::Int:
    return "int";
  case Kind::Unit:
    return "unit";
  default:
    llvm_unreachable("not a base type");
  }
}

static void collectFreeTypeVariables(const Type *type, TypeVarSet &vars) {
  if (auto *tv = llvm::dyn_cast<TypeVariable>(type)) {
    vars.insert(tv->getId());
  } else if (auto *func = llvm::dyn_cast<FunctionType>(type)) {
    collectFreeTypeVariables(func->getParam(), vars);
    collectFreeTypeVariables(func->getResult(), vars);
  }
}

TypeVarSet freeTypeVariables(const Type *type) {
  TypeVarSet vars;
  collectFreeTypeVariables(type, vars);
  return vars;
}

bool occursIn(TypeVarId var, const Type *type) {
  return llvm::TypeSwitch<const Type *, bool>(type)
      .Case<TypeVariable>([&](auto *tv) { return tv->getId() == var; })
      .Case<FunctionType>([&](auto *func) {
        return occursIn(var, func->getParam()) ||
               occursIn(var, func->getResult());
      })
      .Default([](auto *) { return false; });
}

static bool alphaEquivalent(const Type *a, const Type *b,
                            llvm::DenseMap<TypeVarId, TypeVarId> &forward,
                            llvm::DenseMap<TypeVarId, TypeVarId> &backward) {
  if (a->getKind() != b->getKind()) {
    return false;
  }
  if (auto *va = llvm::dyn_cast<TypeVariable>(a)) {
    auto idA = va->getId(), idB = llvm::cast<TypeVariable>(b)->getId();
    auto [fwd, insertedForward] = forward.try_emplace(idA, idB);
    auto [bwd, insertedBackward] = backward.try_emplace(idB, idA);
    return fwd->second == idB && bwd->second == idA;
  }
  if (auto *fa = llvm::dyn_cast<FunctionType>(a)) {
    auto *fb = llvm::cast<FunctionType>(b);
    return alphaEquivalent(fa->getParam(), fb->getParam(), forward, backward) &&
           alphaEquivalent(fa->getResult(), fb->getResult(), forward, backward);
  }
  return true;
}

bool alphaEquivalent(const Type *a, const Type *b) {
  llvm::DenseMap<TypeVarId, TypeVarId> forward, backward;
  return alphaEquivalent(a, b, forward, backward);
}

std::string TypeVariableNames::getName(TypeVarId var) {
  auto [it, inserted] = names.try_emplace(var, names.size());
  const unsigned index = it->second;
  std::string name = "'";
  name += static_cast<char>('a' + index % 26);
  if (index >= 26) {
    name += std::to_string(index / 26);
  }
  return name;
}

std::string TypeVariableNames::getRawName(TypeVarId var) {
  return "'t" + std::to_string(var);
}

template <typename NameFn>
static llvm::raw_ostream &printType(llvm::raw_ostream &os, const Type *type,
                                    NameFn &&nameOf) {
  if (auto *base = llvm::dyn_cast<BaseType>(type)) {
    return os << base->getName();
  }
  if (auto *tv = llvm::dyn_cast<TypeVariable>(type)) {
    return os << nameOf(tv->getId());
  }
  auto *func = llvm::cast<FunctionType>(type);
  const bool parenthesize = llvm::isa<FunctionType>(func->getParam());
  if (parenthesize) {
    os << '(';
  }
  printType(os, func->getParam(), nameOf);
  if (parenthesize) {
    os << ')';
  }
  os << " -> ";
  return printType(os, func->getResult(), nameOf);
}

llvm::raw_ostream &TypeVariableNames::print(llvm::raw_ostream &os,
                                            const Type *type) {
  if (CL::RawTypeVariables) {
    return printType(os, type, &TypeVariableNames::getRawName);
  }
  return printType(os, type, [this](TypeVarId var) { return getName(var); });
}

llvm::raw_ostream &operator<<(llvm::raw_ostream &os, const Type &type) {
  return printType(os, &type, &TypeVariableNames::getRawName);
}

std::string showType(const Type *type) {
  std::string str;
  llvm::raw_string_ostream ss(str);
  TypeVariableNames names;
  names.print(ss, type);
  return ss.str();
}

} // namespace polyinfer
