#pragma once

#include <memory>
#include <string>
#include "polyinfer/AST/AST.h"
#include "polyinfer/AST/Location.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

namespace polyinfer {

/// Syntax error at the token where parsing stopped. Logs as
/// `<file>:<line>:<col>: <message>`.
class ParseError : public llvm::ErrorInfo<ParseError> {
public:
  static char ID;
  ParseError(Location location, std::string message)
      : location(std::move(location)), message(std::move(message)) {}

  const Location &getLocation() const { return location; }
  llvm::StringRef getMessage() const { return message; }

  void log(llvm::raw_ostream &os) const override {
    os << location << ": " << message;
  }
  std::error_code convertToErrorCode() const override {
    return llvm::inconvertibleErrorCode();
  }

private:
  Location location;
  std::string message;
};

/// Parse a whole source text, stopping at the first error.
llvm::Expected<std::unique_ptr<CompilationUnitAST>>
parse(llvm::StringRef source, llvm::StringRef filename);

} // namespace polyinfer
