#include "polyinfer/Infer/Prelude.h"
#include "polyinfer/Types/TypeContext.h"
#include "polyinfer/Types/TypeScheme.h"
#define DEBUG_TYPE "Prelude.cpp"
#include "polyinfer/Support/Debug.h.inc"

namespace polyinfer {

void declarePrelude(TypeContext &context, Environment &env) {
  TRACE();
  const Type *intType = context.getIntType();
  const Type *boolType = context.getBoolType();
  const Type *intBinary = context.getFunctionType({intType, intType, intType});
  const Type *intCompare = context.getFunctionType({intType, intType, boolType});
  const Type *boolBinary = context.getFunctionType({boolType, boolType, boolType});

  for (auto name : {"add", "sub", "mul"}) {
    env.insert(name, TypeScheme(intBinary));
  }
  for (auto name : {"eq", "lt"}) {
    env.insert(name, TypeScheme(intCompare));
  }
  env.insert("not", TypeScheme(context.getFunctionType(boolType, boolType)));
  for (auto name : {"and", "or"}) {
    env.insert(name, TypeScheme(boolBinary));
  }

  const TypeVariable *a = context.freshTypeVariable();
  env.insert("ignore",
             TypeScheme({a->getId()}, context.getFunctionType(a, context.getUnitType())));
}

} // namespace polyinfer
