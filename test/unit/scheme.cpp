#include "polyinfer/Infer/Environment.h"
#include "polyinfer/Types/TypeContext.h"
#include "polyinfer/Types/TypeScheme.h"
#include <llvm/Support/raw_ostream.h>

using namespace polyinfer;

static void printVars(llvm::StringRef label, const TypeVarSet &vars) {
  llvm::outs() << label << ":";
  for (auto var : vars) {
    llvm::outs() << ' ' << var;
  }
  llvm::outs() << "\n";
}

int main() {
  TypeContext context;
  auto *i = context.getIntType();
  auto *t0 = context.freshTypeVariable();
  auto *t1 = context.freshTypeVariable();
  auto *id = context.getFunctionType(t0, t0);
  auto *pair = context.getFunctionType({t0, t1, t0});

  // Quantifiers not free in the body are dropped.
  TypeScheme mono(i);
  TypeScheme trimmed({0, 7}, id);
  llvm::outs() << mono << " mono=" << mono.isMonomorphic() << "\n";
  llvm::outs() << trimmed << "\n";
  printVars("scheme ftv", freeTypeVariables(TypeScheme({1}, pair)));

  Environment empty;
  auto general = generalize(pair, empty);
  llvm::outs() << "general: " << general << "\n";

  Environment env;
  env.insert("y", TypeScheme(t1));
  auto partial = generalize(pair, env);
  llvm::outs() << "partial: " << partial << "\n";
  llvm::outs() << "closed: " << generalize(i, empty) << "\n";

  // Instances use fresh variables and keep the free ones.
  auto *first = instantiate(context, general);
  auto *second = instantiate(context, general);
  llvm::outs() << *first << "\n" << *second << "\n";
  llvm::outs() << *instantiate(context, partial) << "\n";
  llvm::outs() << "mono instance is body: " << (instantiate(context, mono) == i)
               << "\n";
  llvm::outs() << "alpha: " << alphaEquivalent(first, pair) << "\n";

  llvm::outs() << showScheme(partial) << "\n";
  return 0;
}
// CHECK: int mono=1
// CHECK-NEXT: forall 't0. 't0 -> 't0
// CHECK-NEXT: scheme ftv: 0
// CHECK-NEXT: general: forall 't0 't1. 't0 -> 't1 -> 't0
// CHECK-NEXT: partial: forall 't0. 't0 -> 't1 -> 't0
// CHECK-NEXT: closed: int
// CHECK-NEXT: 't2 -> 't3 -> 't2
// CHECK-NEXT: 't4 -> 't5 -> 't4
// CHECK-NEXT: 't6 -> 't1 -> 't6
// CHECK-NEXT: mono instance is body: 1
// CHECK-NEXT: alpha: 1
// CHECK-NEXT: 'a -> 'b -> 'a
