#include "polyinfer/Infer/Inference.h"
#include "polyinfer/Infer/Session.h"
#include "polyinfer/PolyInferConfig.h"
#include "polyinfer/Support/CL.h"
#include "polyinfer/Support/LLVMCommon.h"
#include "polyinfer/Support/Repl.h"
#include "polyinfer/Support/Utils.h"
#include <llvm/Support/CommandLine.h>
#include <llvm/Support/PrettyStackTrace.h>
#include <llvm/Support/Process.h>
#include <llvm/Support/raw_ostream.h>

#define DEBUG_TYPE "polyinfer"
#include "polyinfer/Support/Debug.h.inc"

using namespace polyinfer;

using namespace llvm;
static cl::list<std::string> inputFilenames(cl::Positional,
                                            cl::desc("<input file name>"),
                                            cl::ZeroOrMore,
                                            cl::value_desc("filename"),
                                            cl::cat(polyinfer::CL::PolyInferOptions));

static void printVersion(llvm::raw_ostream &os) {
  os << "polyinfer version " << POLYINFER_VERSION << " (LLVM "
     << POLYINFER_LLVM_VERSION << ")\n";
}

int main(int argc, char* argv[]) {
  llvm::EnablePrettyStackTrace();
  // Color only when someone is looking; -no-color still wins.
  CL::Color = llvm::sys::Process::StandardOutHasColors() &&
              llvm::sys::Process::StandardErrHasColors();
  llvm::cl::SetVersionPrinter(printVersion);
  llvm::cl::HideUnrelatedOptions(CL::PolyInferOptions);
  llvm::cl::ParseCommandLineOptions(argc, argv, "Hindley-Milner type inference for a small ML\n");
  TRACE();
  if (inputFilenames.empty() && !CL::Repl) {
    llvm::errs() << "No input file provided, and not running REPL.\n"
                 << "Run " << argv[0] << " --help for more information.\n";
    return 1;
  }

  Session session(InferenceOptions::fromCommandLine(), CL::Freestanding);
  for (auto &filepath : inputFilenames) {
    session.loadSourceFile(filepath);
    if (CL::DParseTree) {
      session.showParseTree(llvm::outs());
    }
    const bool failed = session.anyFatalErrors();
    if (CL::DTypedTree && !failed) {
      session.showTypedTree(llvm::outs());
    }
    // Items before the first error still report their types.
    if (!CL::Quiet) {
      session.showResults(llvm::outs());
    }
    if (failed) {
      llvm::outs().flush();
      session.showErrors();
      return 1;
    }
  }
  if (CL::DumpTypes) {
    session.dumpTypes(llvm::outs());
  }
  if (CL::Repl) {
    runRepl(argc, argv, session);
  }

  return 0;
}
