#pragma once

#include "polyinfer/Infer/Environment.h"

namespace polyinfer {

class TypeContext;

/// Add the builtin functions to `env`:
///   add, sub, mul : int -> int -> int
///   eq, lt        : int -> int -> bool
///   not           : bool -> bool
///   and, or       : bool -> bool -> bool
///   ignore        : 'a -> unit
void declarePrelude(TypeContext &context, Environment &env);

} // namespace polyinfer
