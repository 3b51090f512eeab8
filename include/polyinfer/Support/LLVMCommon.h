#pragma once
#include "llvm/Support/Error.h"
#include "llvm/Support/ErrorHandling.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/SmallVector.h"
#include <optional>
#include <string>

using llvm::ArrayRef;
using llvm::SmallVector;
using llvm::StringRef;
using llvm::Expected;
using std::optional;
using std::nullopt;

// Unwrap a result that is known to succeed, aborting with the error message
// otherwise.
template <typename T>
T must(llvm::Expected<T> result, std::string message="Unexpected failure") {
  if (!result) {
    message += ": " + llvm::toString(result.takeError());
    llvm::report_fatal_error(llvm::StringRef(message));
  }
  return std::move(*result);
}
inline void must(llvm::Error error, std::string message="Unexpected failure") {
  if (error) {
    message += ": " + llvm::toString(std::move(error));
    llvm::report_fatal_error(llvm::StringRef(message));
  }
}
