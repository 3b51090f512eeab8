#include "polyinfer/Types/TypeError.h"
#include "polyinfer/Support/CL.h"
#define DEBUG_TYPE "TypeError.cpp"
#include "polyinfer/Support/Debug.h.inc"

namespace polyinfer {

char TypeError::ID = 0;

llvm::Error TypeError::undefinedVariable(llvm::StringRef name) {
  DBGS("undefined variable " << name << '\n');
  return llvm::make_error<TypeError>(Kind::UndefinedVariable,
                                     Details{.name = name.str()});
}

llvm::Error TypeError::typeMismatch(const Type *expected, const Type *actual) {
  DBGS("type mismatch " << *expected << " vs " << *actual << '\n');
  return llvm::make_error<TypeError>(
      Kind::TypeMismatch, Details{.expected = expected, .actual = actual});
}

llvm::Error TypeError::occursCheckFailure(TypeVarId var, const Type *type) {
  DBGS("occurs check " << TypeVariableNames::getRawName(var) << " in " << *type << '\n');
  return llvm::make_error<TypeError>(
      Kind::OccursCheckFailure, Details{.actual = type, .variable = var});
}

llvm::Error TypeError::inferenceTooComplex(Limit limit, unsigned value) {
  DBGS("inference too complex, limit " << value << '\n');
  return llvm::make_error<TypeError>(
      Kind::InferenceTooComplex, Details{.limit = limit, .limitValue = value});
}

llvm::StringRef TypeError::getKindName(Kind kind) {
  switch (kind) {
  case Kind::UndefinedVariable:
    return "UndefinedVariable";
  case Kind::TypeMismatch:
    return "TypeMismatch";
  case Kind::OccursCheckFailure:
    return "OccursCheckFailure";
  case Kind::InferenceTooComplex:
    return "InferenceTooComplex";
  }
  llvm_unreachable("unknown type error kind");
}

void TypeError::log(llvm::raw_ostream &os) const {
  TypeVariableNames names;
  switch (kind) {
  case Kind::UndefinedVariable:
    os << "undefined variable '" << details.name << "'";
    break;
  case Kind::TypeMismatch:
    os << "type mismatch: expected ";
    names.print(os, details.expected) << " but got ";
    names.print(os, details.actual);
    break;
  case Kind::OccursCheckFailure: {
    os << "occurs check failed: ";
    // Name the variable first so it reads 'a in the type as well.
    if (CL::RawTypeVariables) {
      os << TypeVariableNames::getRawName(details.variable);
    } else {
      os << names.getName(details.variable);
    }
    os << " occurs in ";
    names.print(os, details.actual);
    break;
  }
  case Kind::InferenceTooComplex:
    os << "inference too complex: "
       << (details.limit == Limit::Depth ? "nesting depth" : "number of steps")
       << " exceeds " << details.limitValue;
    break;
  }
}

std::error_code TypeError::convertToErrorCode() const {
  return llvm::inconvertibleErrorCode();
}

} // namespace polyinfer
