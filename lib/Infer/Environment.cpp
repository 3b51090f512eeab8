#include "polyinfer/Infer/Environment.h"
#include <llvm/ADT/STLExtras.h>
#define DEBUG_TYPE "Environment.cpp"
#include "polyinfer/Support/Debug.h.inc"

namespace polyinfer {

const TypeScheme *Environment::lookup(llvm::StringRef name) const {
  auto it = bindings.find(name);
  if (it == bindings.end()) {
    DBGS("not found: " << name << '\n');
    return nullptr;
  }
  return &it->getValue();
}

Environment Environment::extend(llvm::StringRef name, TypeScheme scheme) const {
  Environment extended = *this;
  extended.insert(name, std::move(scheme));
  return extended;
}

void Environment::insert(llvm::StringRef name, TypeScheme scheme) {
  DBGS("declaring " << name << " : " << scheme << '\n');
  bindings.erase(name);
  bindings.insert({name, std::move(scheme)});
}

TypeVarSet Environment::freeTypeVariables() const {
  TypeVarSet vars;
  for (const auto &entry : bindings) {
    auto free = polyinfer::freeTypeVariables(entry.getValue());
    vars.insert(free.begin(), free.end());
  }
  return vars;
}

llvm::SmallVector<llvm::StringRef> Environment::getNames() const {
  llvm::SmallVector<llvm::StringRef> names;
  for (const auto &entry : bindings) {
    names.push_back(entry.getKey());
  }
  llvm::sort(names);
  return names;
}

llvm::raw_ostream &operator<<(llvm::raw_ostream &os, const Environment &env) {
  os << '{';
  llvm::interleaveComma(env.getNames(), os, [&](llvm::StringRef name) {
    os << name << " : " << *env.lookup(name);
  });
  return os << '}';
}

} // namespace polyinfer
