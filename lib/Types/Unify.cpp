#include "polyinfer/Types/Unify.h"
#include "polyinfer/Types/TypeContext.h"
#include "polyinfer/Types/TypeError.h"
#define DEBUG_TYPE "Unify.cpp"
#include "polyinfer/Support/Debug.h.inc"

namespace polyinfer {

// Robinson-style unification producing an explicit substitution, see
// _A Theory of Type Polymorphism in Programming_ by Robin Milner. Function
// types unify component-wise: the substitution found for the parameters is
// applied to both results before they are unified, and the two
// substitutions are composed in that order.
llvm::Expected<Substitution> unify(TypeContext &context, const Type *a,
                                   const Type *b) {
  DBGS("Unifying: " << *a << " and " << *b << '\n');
  if (*a == *b) {
    return Substitution();
  }
  if (auto *tva = llvm::dyn_cast<TypeVariable>(a)) {
    return Substitution::bind(tva->getId(), b);
  }
  if (auto *tvb = llvm::dyn_cast<TypeVariable>(b)) {
    return Substitution::bind(tvb->getId(), a);
  }
  auto *fa = llvm::dyn_cast<FunctionType>(a);
  auto *fb = llvm::dyn_cast<FunctionType>(b);
  if (fa && fb) {
    auto params = unify(context, fa->getParam(), fb->getParam());
    if (!params) {
      return params.takeError();
    }
    auto results = unify(context, params->apply(context, fa->getResult()),
                         params->apply(context, fb->getResult()));
    if (!results) {
      return results.takeError();
    }
    return Substitution::compose(context, *params, *results);
  }
  if (a->getKind() == b->getKind()) {
    assert(llvm::isa<BaseType>(a) && "only base types are left to compare");
    return Substitution();
  }
  return TypeError::typeMismatch(a, b);
}

} // namespace polyinfer
