#pragma once

#include "polyinfer/Types/TypeScheme.h"
#include <llvm/ADT/SmallVector.h>
#include <llvm/ADT/StringMap.h>
#include <llvm/ADT/StringRef.h>
#include <llvm/Support/raw_ostream.h>

namespace polyinfer {

/// Typing environment, a mapping from names to type schemes. Environments
/// are values: `extend` returns a new environment in which the binding
/// shadows any outer one, and never modifies the receiver.
class Environment {
public:
  Environment() = default;

  const TypeScheme *lookup(llvm::StringRef name) const;
  bool contains(llvm::StringRef name) const { return bindings.count(name); }
  size_t size() const { return bindings.size(); }
  bool empty() const { return bindings.empty(); }

  Environment extend(llvm::StringRef name, TypeScheme scheme) const;

  /// In-place insertion, for building an initial environment.
  void insert(llvm::StringRef name, TypeScheme scheme);

  TypeVarSet freeTypeVariables() const;

  /// Bound names in lexicographic order.
  llvm::SmallVector<llvm::StringRef> getNames() const;

  /// Rebuild with `fn` applied to every scheme.
  template <typename F>
  Environment map(F &&fn) const {
    Environment result;
    for (const auto &entry : bindings) {
      result.bindings.insert({entry.getKey(), fn(entry.getValue())});
    }
    return result;
  }

  friend llvm::raw_ostream &operator<<(llvm::raw_ostream &os, const Environment &env);

private:
  llvm::StringMap<TypeScheme> bindings;
};

} // namespace polyinfer
