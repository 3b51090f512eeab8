#include "llvm/Support/raw_ostream.h"
#include "llvm/Support/CommandLine.h"
#include "polyinfer/Support/CL.h"
#define DEBUG_TYPE ""
#include "polyinfer/Support/Debug.h.inc"

using namespace llvm;
static cl::opt<std::string> debugOnly("Lonly", cl::desc("Enable debug type"), cl::init(""),
                                      cl::cat(polyinfer::CL::PolyInferOptions));

namespace polyinfer {
  bool debug_enabled(const std::string &debug_type) {
    return CL::Debug || (!debugOnly.empty() && debugOnly == debug_type);
  }
}
