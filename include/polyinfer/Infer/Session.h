#pragma once

#include "polyinfer/AST/AST.h"
#include "polyinfer/Infer/Environment.h"
#include "polyinfer/Infer/Inference.h"
#include "polyinfer/Support/Utils.h"
#include "polyinfer/Types/TypeContext.h"
#include "polyinfer/Types/TypeScheme.h"
#include <llvm/ADT/ArrayRef.h>
#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Error.h>
#include <llvm/Support/raw_ostream.h>
#include <memory>
#include <string>
#include <vector>

namespace polyinfer {

/// What one top-level item produced: the definition `val name : scheme`, or
/// an expression `- : scheme` when `name` is empty.
struct ItemResult {
  std::string name;
  TypeScheme scheme;
  bool isDefinition() const { return !name.empty(); }
  friend llvm::raw_ostream &operator<<(llvm::raw_ostream &os, const ItemResult &result);
};

/// A sequence of sources inferred against one growing top-level environment.
/// Every item is inferred in order; a definition extends the environment
/// with its generalized scheme. The first error of a source is recorded as a
/// diagnostic and stops the rest of that source.
struct Session {
  Session(InferenceOptions options = {}, bool freestanding = false);

  // Load a string directly as if it were a source file.
  void loadSource(llvm::StringRef source, llvm::StringRef filename = "<string>");

  // Read and load a file, or stdin when `filepath` is "-".
  void loadSourceFile(llvm::StringRef filepath);

  const TypeScheme *lookup(llvm::StringRef name) const { return env.lookup(name); }
  llvm::raw_ostream &showType(llvm::raw_ostream &os, llvm::StringRef name);

  /// `val name : type` for every name defined by the loaded sources, in
  /// order of definition.
  void dumpTypes(llvm::raw_ostream &os);

  /// Results of the items of the last loaded source.
  void showResults(llvm::raw_ostream &os) const;
  llvm::ArrayRef<ItemResult> getResults() const { return results; }

  void showParseTree(llvm::raw_ostream &os) const;
  void showTypedTree(llvm::raw_ostream &os) const;

  [[nodiscard]] bool anyFatalErrors() const;
  void showErrors();
  void clearErrors() { diagnostics.clear(); }
  llvm::ArrayRef<Diagnostic> getDiagnostics() const { return diagnostics; }

  const Environment &getEnvironment() const { return env; }
  TypeContext &getContext() { return context; }
  const Inferencer &getInferencer() const { return inferencer; }
  const CompilationUnitAST *getLastUnit() const { return lastUnit.get(); }

  /// Forget every definition, keeping only the prelude.
  void reset();

private:
  void recordError(llvm::Error error);
  void inferItem(const ItemAST &item);
  void forgetLastSource();

  TypeContext context;
  InferenceOptions options;
  bool freestanding;
  Inferencer inferencer;
  Environment env;
  std::vector<std::string> definedNames;
  std::vector<ItemResult> results;
  std::vector<Diagnostic> diagnostics;
  /// Tree of the last source, when it parsed. The inferencer's node types
  /// refer only to this tree.
  std::unique_ptr<CompilationUnitAST> lastUnit;
};

} // namespace polyinfer
