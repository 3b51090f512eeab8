#include "polyinfer/Types/TypeContext.h"
#include <algorithm>
#include <llvm/ADT/STLExtras.h>
#define DEBUG_TYPE "TypeContext.cpp"
#include "polyinfer/Support/Debug.h.inc"

namespace polyinfer {

TypeContext::TypeContext() {
  boolType = create<BaseType>(Type::Kind::Bool);
  intType = create<BaseType>(Type::Kind::Int);
  unitType = create<BaseType>(Type::Kind::Unit);
}

const FunctionType *TypeContext::getFunctionType(const Type *param,
                                                 const Type *result) {
  auto &entry = functionTypes[{param, result}];
  if (!entry) {
    entry = create<FunctionType>(param, result);
  }
  return entry;
}

const FunctionType *
TypeContext::getFunctionType(llvm::ArrayRef<const Type *> types) {
  assert(types.size() >= 2 && "function type needs a parameter and a result");
  const Type *result = types.back();
  for (auto *param : llvm::reverse(types.drop_back())) {
    result = getFunctionType(param, result);
  }
  return llvm::cast<FunctionType>(result);
}

const TypeVariable *TypeContext::getTypeVariable(TypeVarId id) {
  auto &entry = typeVariables[id];
  if (!entry) {
    entry = create<TypeVariable>(id);
    // Fresh variables must never collide with an explicitly requested one.
    nextTypeVariableId = std::max(nextTypeVariableId, id + 1);
  }
  return entry;
}

const TypeVariable *TypeContext::freshTypeVariable() {
  auto *tv = getTypeVariable(nextTypeVariableId);
  DBGS("fresh type variable: " << *tv << '\n');
  return tv;
}

} // namespace polyinfer
