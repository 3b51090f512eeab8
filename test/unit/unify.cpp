#include "polyinfer/Types/TypeContext.h"
#include "polyinfer/Types/TypeError.h"
#include "polyinfer/Types/Unify.h"
#include <llvm/Support/raw_ostream.h>

using namespace polyinfer;

static void check(TypeContext &context, const Type *a, const Type *b) {
  llvm::outs() << *a << " ~ " << *b << ": ";
  auto subst = unify(context, a, b);
  if (!subst) {
    llvm::outs() << "error: " << llvm::toString(subst.takeError()) << "\n";
    return;
  }
  llvm::outs() << *subst;
  const Type *left = subst->apply(context, a);
  const Type *right = subst->apply(context, b);
  if (left != right) {
    llvm::outs() << " NOT A UNIFIER";
  }
  if (subst->apply(context, left) != left) {
    llvm::outs() << " NOT IDEMPOTENT";
  }
  llvm::outs() << "\n";
}

int main() {
  TypeContext context;
  auto *i = context.getIntType();
  auto *b = context.getBoolType();
  auto *u = context.getUnitType();
  auto *t0 = context.freshTypeVariable();
  auto *t1 = context.freshTypeVariable();
  auto *t2 = context.freshTypeVariable();
  auto *t3 = context.freshTypeVariable();

  check(context, i, i);
  check(context, t0, t0);
  check(context, t0, i);
  check(context, b, t1);
  check(context, t0, t1);
  check(context, t1, t0);
  check(context, context.getFunctionType(t0, t0),
        context.getFunctionType(i, t1));
  check(context, context.getFunctionType({t0, t1, t0}),
        context.getFunctionType({t2, b, t3}));
  check(context, context.getFunctionType(t0, t1),
        context.getFunctionType(t1, context.getFunctionType(t2, t3)));

  // Failures.
  check(context, i, b);
  check(context, u, context.getFunctionType(i, i));
  check(context, context.getFunctionType(i, b), context.getFunctionType(i, i));
  check(context, t0, context.getFunctionType(t0, t1));
  check(context, context.getFunctionType(t0, t1), t1);
  check(context, context.getFunctionType(t0, t0),
        context.getFunctionType(i, b));

  auto mismatch = unify(context, i, b);
  llvm::handleAllErrors(mismatch.takeError(), [&](const TypeError &error) {
    llvm::outs() << TypeError::getKindName(error.getKind()) << ": "
                 << *error.getExpected() << " / " << *error.getActual() << "\n";
  });
  return 0;
}
// CHECK: int ~ int: {}
// CHECK-NEXT: 't0 ~ 't0: {}
// CHECK-NEXT: 't0 ~ int: {'t0 := int}
// CHECK-NEXT: bool ~ 't1: {'t1 := bool}
// CHECK-NEXT: 't0 ~ 't1: {'t0 := 't1}
// CHECK-NEXT: 't1 ~ 't0: {'t1 := 't0}
// CHECK-NEXT: 't0 -> 't0 ~ int -> 't1: {'t0 := int, 't1 := int}
// CHECK-NEXT: 't0 -> 't1 -> 't0 ~ 't2 -> bool -> 't3: {'t0 := 't3, 't1 := bool, 't2 := 't3}
// CHECK-NEXT: 't0 -> 't1 ~ 't1 -> 't2 -> 't3: {'t0 := 't2 -> 't3, 't1 := 't2 -> 't3}
// CHECK-NEXT: int ~ bool: error: type mismatch: expected int but got bool
// CHECK-NEXT: unit ~ int -> int: error: type mismatch: expected unit but got int -> int
// CHECK-NEXT: int -> bool ~ int -> int: error: type mismatch: expected bool but got int
// CHECK-NEXT: 't0 ~ 't0 -> 't1: error: occurs check failed: 'a occurs in 'a -> 'b
// CHECK-NEXT: 't0 -> 't1 ~ 't1: error: occurs check failed: 'a occurs in 'b -> 'a
// CHECK-NEXT: 't0 -> 't0 ~ int -> bool: error: type mismatch: expected int but got bool
// CHECK-NEXT: TypeMismatch: int / bool
