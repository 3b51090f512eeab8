#pragma once

#include "polyinfer/AST/Location.h"
#include "polyinfer/Types/Type.h"
#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Error.h>
#include <optional>
#include <string>

namespace polyinfer {

/// The error every fallible step of inference reports through
/// llvm::Expected. Types referenced by an error are owned by the TypeContext
/// of the failing session, so the error must be rendered (or dropped) before
/// that context goes away.
class TypeError : public llvm::ErrorInfo<TypeError> {
public:
  enum class Kind {
    UndefinedVariable,
    TypeMismatch,
    OccursCheckFailure,
    InferenceTooComplex,
  };
  enum class Limit {
    Depth,
    Steps,
  };
  static char ID;

  /// Payload of an error; which fields are meaningful depends on the kind.
  struct Details {
    std::string name;
    const Type *expected = nullptr;
    const Type *actual = nullptr;
    TypeVarId variable = 0;
    Limit limit = Limit::Depth;
    unsigned limitValue = 0;
  };

  TypeError(Kind kind, Details details)
      : kind(kind), details(std::move(details)) {}

  static llvm::Error undefinedVariable(llvm::StringRef name);
  static llvm::Error typeMismatch(const Type *expected, const Type *actual);
  static llvm::Error occursCheckFailure(TypeVarId var, const Type *type);
  static llvm::Error inferenceTooComplex(Limit limit, unsigned value);

  Kind getKind() const { return kind; }
  llvm::StringRef getName() const { return details.name; }
  const Type *getExpected() const { return details.expected; }
  const Type *getActual() const { return details.actual; }
  TypeVarId getVariable() const { return details.variable; }
  const Type *getType() const { return details.actual; }
  Limit getLimit() const { return details.limit; }
  unsigned getLimitValue() const { return details.limitValue; }

  const std::optional<Location> &getLocation() const { return location; }
  void setLocation(Location loc) { location = std::move(loc); }

  void log(llvm::raw_ostream &os) const override;
  std::error_code convertToErrorCode() const override;

  static llvm::StringRef getKindName(Kind kind);

private:
  Kind kind;
  Details details;
  std::optional<Location> location;
};

} // namespace polyinfer
