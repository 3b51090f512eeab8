#include "polyinfer/Infer/Session.h"
#include "polyinfer/Infer/Prelude.h"
#include "polyinfer/Parse/Parse.h"
#include "polyinfer/Support/Colors.h"
#include "polyinfer/Types/TypeError.h"
#include <llvm/ADT/STLExtras.h>
#include <llvm/Support/raw_ostream.h>

#define DEBUG_TYPE "Session.cpp"
#include "polyinfer/Support/Debug.h.inc"

namespace polyinfer {

llvm::raw_ostream &operator<<(llvm::raw_ostream &os, const ItemResult &result) {
  if (result.isDefinition()) {
    os << "val " << result.name;
  } else {
    os << "-";
  }
  return os << " : " << showScheme(result.scheme);
}

Session::Session(InferenceOptions options, bool freestanding)
    : options(options), freestanding(freestanding), inferencer(context, options) {
  if (!freestanding) {
    declarePrelude(context, env);
  }
}

void Session::reset() {
  TRACE();
  env = Environment();
  if (!freestanding) {
    declarePrelude(context, env);
  }
  definedNames.clear();
  diagnostics.clear();
  forgetLastSource();
}

void Session::forgetLastSource() {
  results.clear();
  inferencer.clearNodeTypes();
  lastUnit.reset();
}

void Session::recordError(llvm::Error error) {
  llvm::handleAllErrors(
      std::move(error),
      [&](const TypeError &typeError) {
        DBGS("type error: " << TypeError::getKindName(typeError.getKind()) << '\n');
        diagnostics.push_back(
            {typeError.message(), typeError.getLocation()});
      },
      [&](const ParseError &parseError) {
        diagnostics.push_back({parseError.getMessage().str(),
                               parseError.getLocation()});
      },
      [&](const llvm::ErrorInfoBase &other) {
        diagnostics.push_back({other.message(), std::nullopt});
      });
}

void Session::inferItem(const ItemAST &item) {
  DBGS("Item: " << item << '\n');
  if (item.isDefinition()) {
    auto scheme = inferencer.inferDefinition(item, env);
    if (!scheme) {
      return recordError(scheme.takeError());
    }
    env.insert(item.getName(), *scheme);
    if (!llvm::is_contained(definedNames, item.getName())) {
      definedNames.push_back(item.getName());
    }
    results.push_back({item.getName(), std::move(*scheme)});
    return;
  }
  auto type = inferencer.inferType(*item.getValue(), env);
  if (!type) {
    return recordError(type.takeError());
  }
  results.push_back({"", generalize(*type, env)});
}

void Session::loadSource(llvm::StringRef source, llvm::StringRef filename) {
  DBGS("Loading " << filename << '\n');
  forgetLastSource();
  auto unit = parse(source, filename);
  if (!unit) {
    return recordError(unit.takeError());
  }
  lastUnit = std::move(*unit);
  const size_t errorsBefore = diagnostics.size();
  for (const auto &item : lastUnit->getItems()) {
    inferItem(*item);
    if (diagnostics.size() != errorsBefore) {
      return;
    }
  }
}

void Session::loadSourceFile(llvm::StringRef filepath) {
  TRACE();
  auto source = slurpFile(filepath.str());
  if (!source) {
    forgetLastSource();
    return recordError(source.takeError());
  }
  loadSource(*source, filepath == "-" ? "<stdin>" : filepath);
}

llvm::raw_ostream &Session::showType(llvm::raw_ostream &os, llvm::StringRef name) {
  if (const TypeScheme *scheme = lookup(name)) {
    os << name << " : " << showScheme(*scheme);
  } else {
    os << "Type unknown for symbol: '" << name << "'";
  }
  return os;
}

void Session::dumpTypes(llvm::raw_ostream &os) {
  for (const auto &name : definedNames) {
    if (const TypeScheme *scheme = lookup(name)) {
      os << ItemResult{name, *scheme} << '\n';
    }
  }
}

void Session::showResults(llvm::raw_ostream &os) const {
  for (const auto &result : results) {
    os << result << '\n';
  }
}

void Session::showParseTree(llvm::raw_ostream &os) const {
  if (lastUnit) {
    dumpAST(os, *lastUnit);
  }
}

void Session::showTypedTree(llvm::raw_ostream &os) const {
  if (!lastUnit) {
    return;
  }
  for (const auto &item : lastUnit->getItems()) {
    if (item->isDefinition()) {
      os << "Definition" << (item->isRecursive() ? " rec" : "") << " '"
         << item->getName() << "'";
      if (const TypeScheme *scheme = lookup(item->getName())) {
        os << " : " << ANSIColors::magenta() << showScheme(*scheme)
           << ANSIColors::reset();
      }
      os << '\n';
    } else {
      os << "Expression\n";
    }
    inferencer.dumpTypedTree(os, *item->getValue(), 1);
  }
}

bool Session::anyFatalErrors() const { return !diagnostics.empty(); }

void Session::showErrors() {
  for (const auto &diag : diagnostics) {
    llvm::errs() << diag << "\n";
  }
}

} // namespace polyinfer
