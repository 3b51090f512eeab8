#include "polyinfer/Support/CL.h"
#include "polyinfer/Types/Type.h"
#include "polyinfer/Types/TypeContext.h"
#include <llvm/ADT/SmallVector.h>
#include <llvm/Support/raw_ostream.h>

using namespace polyinfer;

static void printVars(const TypeVarSet &vars) {
  llvm::outs() << "ftv:";
  for (auto var : vars) {
    llvm::outs() << ' ' << var;
  }
  llvm::outs() << "\n";
}

int main() {
  TypeContext context;
  auto *i = context.getIntType();
  auto *b = context.getBoolType();
  auto *u = context.getUnitType();
  llvm::outs() << *i << "\n" << *b << "\n" << *u << "\n";

  auto *t0 = context.freshTypeVariable();
  auto *t1 = context.freshTypeVariable();
  auto *f = context.getFunctionType(t0, t1);
  llvm::outs() << *f << "\n";

  auto *hof = context.getFunctionType({f, t0, t1});
  llvm::outs() << *hof << "\n";
  llvm::outs() << showType(hof) << "\n";
  llvm::outs() << showType(context.getFunctionType({i, i, b})) << "\n";

  llvm::outs() << "uniqued: " << (context.getFunctionType(t0, t1) == f) << "\n";
  llvm::outs() << "same variable: " << (context.getTypeVariable(0) == t0) << "\n";

  printVars(freeTypeVariables(hof));
  printVars(freeTypeVariables(i));
  llvm::outs() << "occurs 't0: " << occursIn(0, hof) << "\n";
  llvm::outs() << "occurs 't5: " << occursIn(5, hof) << "\n";

  {
    TypeContext other;
    auto *g = other.getFunctionType(other.getTypeVariable(0), other.getTypeVariable(1));
    llvm::outs() << "equal across contexts: " << (*g == *f) << "\n";
    llvm::outs() << "equal to int: " << (*g == *i) << "\n";
  }

  auto *t2 = context.freshTypeVariable();
  auto *t3 = context.freshTypeVariable();
  llvm::outs() << "alpha renamed: "
               << alphaEquivalent(context.getFunctionType(t2, t3), f) << "\n";
  llvm::outs() << "alpha collapsed: "
               << alphaEquivalent(context.getFunctionType(t0, t0), f) << "\n";
  llvm::outs() << "alpha split: "
               << alphaEquivalent(f, context.getFunctionType(t0, t0)) << "\n";

  auto *t10 = context.getTypeVariable(10);
  llvm::outs() << *t10 << " then " << *context.freshTypeVariable() << "\n";

  llvm::SmallVector<const Type *> many;
  for (int n = 0; n < 29; ++n) {
    many.push_back(context.freshTypeVariable());
  }
  llvm::outs() << showType(context.getFunctionType(many)) << "\n";

  CL::RawTypeVariables = true;
  llvm::outs() << showType(hof) << "\n";
  CL::RawTypeVariables = false;

  return 0;
}
// CHECK: int
// CHECK-NEXT: bool
// CHECK-NEXT: unit
// CHECK-NEXT: 't0 -> 't1
// CHECK-NEXT: ('t0 -> 't1) -> 't0 -> 't1
// CHECK-NEXT: ('a -> 'b) -> 'a -> 'b
// CHECK-NEXT: int -> int -> bool
// CHECK-NEXT: uniqued: 1
// CHECK-NEXT: same variable: 1
// CHECK-NEXT: ftv: 0 1
// CHECK-NEXT: ftv:
// CHECK-NEXT: occurs 't0: 1
// CHECK-NEXT: occurs 't5: 0
// CHECK-NEXT: equal across contexts: 1
// CHECK-NEXT: equal to int: 0
// CHECK-NEXT: alpha renamed: 1
// CHECK-NEXT: alpha collapsed: 0
// CHECK-NEXT: alpha split: 0
// CHECK-NEXT: 't10 then 't11
// CHECK-NEXT: 'a -> 'b -> 'c -> 'd -> 'e -> 'f -> 'g -> 'h -> 'i -> 'j -> 'k -> 'l -> 'm -> 'n -> 'o -> 'p -> 'q -> 'r -> 's -> 't -> 'u -> 'v -> 'w -> 'x -> 'y -> 'z -> 'a1 -> 'b1 -> 'c1
// CHECK-NEXT: ('t0 -> 't1) -> 't0 -> 't1
