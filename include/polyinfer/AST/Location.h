#pragma once

#include <string>
#include <llvm/Support/raw_ostream.h>

namespace polyinfer {

/// Location in source code
struct Location {
  std::string filename;
  unsigned line = 0, column = 0;

  bool isValid() const { return line != 0; }
  friend llvm::raw_ostream &operator<<(llvm::raw_ostream &os, const Location &loc) {
    os << (loc.filename.empty() ? "<unknown>" : loc.filename);
    if (loc.isValid()) {
      os << ':' << loc.line << ':' << loc.column;
    }
    return os;
  }
};

} // namespace polyinfer
