#include "polyinfer/Support/Utils.h"
#include "polyinfer/Support/CL.h"
#include "polyinfer/Support/Colors.h"
#include <llvm/Support/MemoryBuffer.h>
#include <llvm/Support/raw_ostream.h>
#define DEBUG_TYPE "utils"
#include "polyinfer/Support/Debug.h.inc"

namespace polyinfer {

llvm::Expected<std::string> slurpFile(const std::string &path) {
  DBGS("reading " << path << '\n');
  auto buffer = llvm::MemoryBuffer::getFileOrSTDIN(path);
  if (auto ec = buffer.getError()) {
    return llvm::createStringError(ec, "Failed to open file: " + path);
  }
  return (*buffer)->getBuffer().str();
}

namespace ANSIColors {
using namespace polyinfer::CL;
const char* red() { return Color ? "\033[31m" : ""; }
const char* magenta() { return Color ? "\033[35m" : ""; }
const char* reset() { return Color ? "\033[0m" : ""; }
const char* bold() { return Color ? "\033[1m" : ""; }
const char* faint() { return Color ? "\033[2m" : ""; }
const char* italic() { return Color ? "\033[3m" : ""; }
} // namespace ANSIColors

llvm::raw_ostream &operator<<(llvm::raw_ostream &os, const Diagnostic &diag) {
  if (diag.location) {
    os << *diag.location << ": ";
  }
  os << ANSIColors::red() << "error: " << ANSIColors::reset() << diag.message;

  return os;
}

} // namespace polyinfer
