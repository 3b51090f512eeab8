#pragma once
#include <llvm/Support/CommandLine.h>
namespace polyinfer::CL {
extern bool Debug, Color, DumpTypes, DParseTree, DTypedTree, Repl, InRLWrap,
    Quiet, Freestanding, RawTypeVariables;
extern unsigned MaxDepth, MaxSteps;
extern llvm::cl::OptionCategory PolyInferOptions;
}
