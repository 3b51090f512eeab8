#pragma once

#include "polyinfer/Types/Type.h"
#include <llvm/ADT/ArrayRef.h>
#include <llvm/ADT/DenseMap.h>
#include <memory>
#include <type_traits>
#include <utility>
#include <vector>

namespace polyinfer {

/// Owns and uniques every type of one inference session, and hands out fresh
/// type variables from a monotonic counter. A context is not thread-safe:
/// concurrent sessions each use their own context.
class TypeContext {
public:
  TypeContext();
  TypeContext(const TypeContext &) = delete;
  TypeContext &operator=(const TypeContext &) = delete;

  const BaseType *getBoolType() const { return boolType; }
  const BaseType *getIntType() const { return intType; }
  const BaseType *getUnitType() const { return unitType; }
  const FunctionType *getFunctionType(const Type *param, const Type *result);

  /// Curried function type: {a, b, c} is a -> b -> c.
  const FunctionType *getFunctionType(llvm::ArrayRef<const Type *> types);

  const TypeVariable *getTypeVariable(TypeVarId id);
  const TypeVariable *freshTypeVariable();

  /// Id the next fresh variable will get.
  TypeVarId peekNextTypeVariableId() const { return nextTypeVariableId; }

  size_t getNumTypes() const { return typeArena.size(); }

private:
  template <typename T, typename... Args>
  T* create(Args&&... args) {
    static_assert(std::is_base_of_v<Type, T>,
                  "TypeContext should only be used to create Type subclasses");
    auto type = std::make_unique<T>(TypeKey(), std::forward<Args>(args)...);
    T *result = type.get();
    typeArena.push_back(std::move(type));
    return result;
  }

  std::vector<std::unique_ptr<Type>> typeArena;
  const BaseType *boolType;
  const BaseType *intType;
  const BaseType *unitType;
  llvm::DenseMap<std::pair<const Type *, const Type *>, const FunctionType *>
      functionTypes;
  llvm::DenseMap<TypeVarId, const TypeVariable *> typeVariables;
  TypeVarId nextTypeVariableId = 0;
};

} // namespace polyinfer
