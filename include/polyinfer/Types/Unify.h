#pragma once

#include "polyinfer/Types/Substitution.h"
#include "polyinfer/Types/Type.h"
#include <llvm/Support/Error.h>

namespace polyinfer {

class TypeContext;

/// Most general unifier of `expected` and `actual`. When both are variables
/// the left one is bound, so results are reproducible. Fails with
/// TypeMismatch(expected, actual) or OccursCheckFailure.
llvm::Expected<Substitution> unify(TypeContext &context, const Type *expected,
                                   const Type *actual);

} // namespace polyinfer
