#pragma once

#include "polyinfer/Types/Type.h"
#include "polyinfer/Types/TypeScheme.h"
#include <llvm/ADT/DenseMap.h>
#include <llvm/ADT/SmallVector.h>
#include <llvm/Support/Error.h>
#include <llvm/Support/raw_ostream.h>
#include <utility>

namespace polyinfer {

class Environment;
class TypeContext;

/// A finite mapping from type variables to types. Substitutions are
/// immutable values; composing two of them produces a third. No binding
/// maps a variable to a type in which it occurs.
class Substitution {
public:
  using MapTy = llvm::DenseMap<TypeVarId, const Type *>;

  Substitution() = default;

  /// {var := type}, the empty substitution when `type` is `var` itself, or
  /// an OccursCheckFailure when `var` occurs in `type`.
  static llvm::Expected<Substitution> bind(TypeVarId var, const Type *type);

  /// The substitution that applies `older` and then `newer`:
  /// apply(compose(s1, s2), t) == apply(s2, apply(s1, t)).
  static Substitution compose(TypeContext &context, const Substitution &older,
                              const Substitution &newer);

  const Type *lookup(TypeVarId var) const { return map.lookup(var); }
  bool empty() const { return map.empty(); }
  size_t size() const { return map.size(); }

  const Type *apply(TypeContext &context, const Type *type) const;
  /// Bound variables of the scheme are left untouched.
  TypeScheme apply(TypeContext &context, const TypeScheme &scheme) const;
  Environment apply(TypeContext &context, const Environment &env) const;

  TypeVarSet getDomain() const;
  /// Bindings ordered by variable id.
  llvm::SmallVector<std::pair<TypeVarId, const Type *>> getBindings() const;

  friend llvm::raw_ostream &operator<<(llvm::raw_ostream &os, const Substitution &sub);

private:
  explicit Substitution(MapTy map) : map(std::move(map)) {}
  const Type *apply(TypeContext &context, const Type *type,
                    const TypeVarSet *bound) const;

  MapTy map;
};

} // namespace polyinfer
