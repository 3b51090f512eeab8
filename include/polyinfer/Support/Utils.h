#pragma once
#include <string>
#include <optional>
#include "polyinfer/AST/Location.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/raw_ostream.h"

namespace polyinfer {
llvm::Expected<std::string> slurpFile(const std::string &path);

/// An error printed as `location: error: message`.
struct Diagnostic {
  std::string message;
  std::optional<Location> location;
  friend llvm::raw_ostream &operator<<(llvm::raw_ostream &os, const Diagnostic &diag);
};

} // namespace polyinfer
