#include "polyinfer/Support/CL.h"

using namespace llvm;

namespace polyinfer::CL {
bool Debug = false;
bool Color = true;
bool DumpTypes = false;
bool DParseTree = false;
bool DTypedTree = false;
bool Repl = false;
bool InRLWrap = false;
bool Quiet = false;
bool Freestanding = false;
bool RawTypeVariables = false;
unsigned MaxDepth = 1024;
unsigned MaxSteps = 1000000;

llvm::cl::OptionCategory PolyInferOptions("PolyInfer Options", "");
}

using namespace polyinfer::CL;

static cl::opt<bool, true> quiet("quiet", cl::desc("Only print errors, not inferred types"),
                                 cl::location(Quiet), cl::cat(PolyInferOptions));

static cl::alias quietAlias("q", cl::desc("Only print errors, not inferred types"),
                       cl::aliasopt(quiet), cl::cat(PolyInferOptions));

static cl::opt<bool, true> repl("repl", cl::desc("Run the REPL"),
                               cl::location(Repl), cl::cat(PolyInferOptions));
static cl::alias replAlias("r", cl::desc("Run the REPL"),
                      cl::aliasopt(repl), cl::cat(PolyInferOptions));

static cl::opt<bool, true>
    inRLWrap("in-rlwrap",
             cl::desc("Internal option meaning the executable is already "
                      "running itself under rlwrap"),
             cl::location(InRLWrap), cl::cat(PolyInferOptions));

static cl::opt<bool, true> debug("L", cl::desc("Enable debug mode"),
                                 cl::location(Debug), cl::cat(PolyInferOptions));

static cl::opt<bool, true> dumpTypes("dtypes", cl::desc("Dump the top-level environment"),
                                     cl::location(DumpTypes),
                                     cl::cat(PolyInferOptions));

static cl::alias dumpTypesAlias("d", cl::desc("Dump the top-level environment"),
                            cl::aliasopt(dumpTypes), cl::cat(PolyInferOptions));

static cl::opt<bool>
    freestanding("freestanding", cl::desc("Do not load the prelude"),
                 cl::cb<void, bool>([](bool value) { Freestanding = value; }),
                 cl::cat(PolyInferOptions));
static cl::alias freestandingAlias("f", cl::desc("Do not load the prelude"),
                              cl::aliasopt(freestanding), cl::cat(PolyInferOptions));

static cl::opt<bool, true> clDParseTree("dparsetree",
                                  cl::desc("Enable parse tree dump"),
                                  cl::location(DParseTree),
                                  cl::cat(PolyInferOptions));

static cl::opt<bool, true> clDTypedTree("dtypedtree",
                                  cl::desc("Enable typed tree dump"),
                                  cl::location(DTypedTree),
                                  cl::cat(PolyInferOptions));

static cl::opt<bool, true>
    clRawTypeVariables("raw-type-vars",
                       cl::desc("Print type variables with their internal ids"),
                       cl::location(RawTypeVariables),
                       cl::cat(PolyInferOptions));

static cl::opt<unsigned, true>
    clMaxDepth("max-depth",
               cl::desc("Maximum expression nesting depth during inference"),
               cl::location(MaxDepth), cl::cat(PolyInferOptions));

static cl::opt<unsigned, true>
    clMaxSteps("max-steps",
               cl::desc("Maximum number of inference steps per item (0 for no limit)"),
               cl::location(MaxSteps), cl::cat(PolyInferOptions));

static cl::opt<bool> clNoColor("no-color",
                                  cl::desc("Disable color output"),
                                  cl::cb<void, bool>([](bool value) { Color = !value; }),
                                  cl::cat(PolyInferOptions));
