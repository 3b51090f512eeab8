#include "polyinfer/Support/Repl.h"
#include "polyinfer/Infer/Session.h"
#include "polyinfer/Support/CL.h"
#include "polyinfer/Support/Colors.h"
#include "polyinfer/Support/LLVMCommon.h"
#include <cstdlib>
#include <iostream>
#include <llvm/ADT/STLExtras.h>
#include <llvm/ADT/StringExtras.h>
#include <llvm/Support/FileSystem.h>
#include <llvm/Support/Process.h>
#include <llvm/Support/Program.h>
#include <memory>
#include <string_view>
#include <unistd.h>
#include <vector>

#define DEBUG_TYPE "repl"
#include "polyinfer/Support/Debug.h.inc"

namespace polyinfer {

/// The part of `source` before 1-based `line` and `column`.
static StringRef sourceBefore(StringRef source, unsigned line, unsigned column) {
  size_t offset = 0;
  for (unsigned i = 1; i < line; ++i) {
    offset = source.find('\n', offset);
    if (offset == StringRef::npos) {
      return source;
    }
    ++offset;
  }
  return source.take_front(offset + column - 1);
}

/// Items of the last source that were inferred before its first error. They
/// stay in scope, so they belong in the source history.
static StringRef acceptedSource(const Session &session, StringRef source) {
  const CompilationUnitAST *unit = session.getLastUnit();
  if (!unit) {
    return "";
  }
  const size_t accepted = session.getResults().size();
  if (accepted >= unit->getItems().size()) {
    return source;
  }
  const Location &rejected = unit->getItems()[accepted]->loc();
  return sourceBefore(source, rejected.line, rejected.column);
}

static void runUnderRlwrap(int argc, char **argv) {
  auto rlwrap = llvm::sys::findProgramByName("rlwrap");
  if (!rlwrap) {
    DBGS("rlwrap not found\n");
    return;
  }
  std::string exe = llvm::sys::fs::getMainExecutable(argv[0], nullptr);
  SmallVector<std::string> newArgs = {*rlwrap, "--no-warnings",
                                      "--complete-filenames", exe};
  for (int i = 1; i < argc; i++) {
    newArgs.emplace_back(argv[i]);
  }
  newArgs.push_back("--in-rlwrap");
  DBGS("Running under rlwrap: " << llvm::join(newArgs, " ") << '\n');
  SmallVector<char *> newArgsC;
  for (auto &arg : newArgs) {
    newArgsC.push_back(arg.data());
  }
  newArgsC.push_back(nullptr);
  execvp(newArgsC[0], newArgsC.data());
  // Only reached when exec failed; keep going without line editing.
  DBGS("Failed to exec rlwrap\n");
}

struct Command {
  virtual void callback(Session &session, ArrayRef<std::string> args) = 0;

  llvm::raw_ostream& help(llvm::raw_ostream &os) const { return os << help(); }
  llvm::raw_ostream& name(llvm::raw_ostream &os) const { return os << name(); }

  virtual std::string_view help() const = 0;
  virtual std::string_view name() const = 0;
  virtual ~Command() = default;
};

struct TypeCommand : public Command {
  void callback(Session &session, ArrayRef<std::string> args) override {
    if (args.size() != 1) {
      llvm::errs() << "Usage: #type <symbol>\n";
      return;
    }
    session.showType(llvm::outs(), args[0]) << "\n";
  }
  std::string_view help() const override {
    return "Show the type of a symbol";
  }
  std::string_view name() const override {
    return "type";
  }
};

struct EnvCommand : public Command {
  void callback(Session &session, ArrayRef<std::string> args) override {
    for (auto name : session.getEnvironment().getNames()) {
      session.showType(llvm::outs() << "val ", name) << "\n";
    }
  }
  std::string_view help() const override {
    return "Show every name in scope with its type";
  }
  std::string_view name() const override {
    return "env";
  }
};

struct ShowASTCommand : public Command {
  void callback(Session &session, ArrayRef<std::string> args) override {
    session.showParseTree(llvm::outs());
  }
  std::string_view help() const override {
    return "Show the parse tree of the last entry";
  }
  std::string_view name() const override {
    return "parsetree";
  }
};

struct ShowTypedASTCommand : public Command {
  void callback(Session &session, ArrayRef<std::string> args) override {
    session.showTypedTree(llvm::outs());
  }
  std::string_view help() const override {
    return "Show the typed tree of the last entry";
  }
  std::string_view name() const override {
    return "typedtree";
  }
};

struct ShowSourceCommand : public Command {
  std::string &sourceSoFar;
  ShowSourceCommand(std::string &sourceSoFar) : sourceSoFar(sourceSoFar) {}
  void callback(Session &session, ArrayRef<std::string> args) override {
    llvm::outs() << sourceSoFar << '\n';
  }
  std::string_view help() const override {
    return "Show the code typed into the repl so far";
  }
  std::string_view name() const override {
    return "source";
  }
};

struct HelpCommand : public Command {
  HelpCommand(std::vector<std::unique_ptr<Command>> &commands) : commands(commands) {}
  void callback(Session &session, ArrayRef<std::string> args) override {
    llvm::outs() << "Available commands:\n";
    for (const auto &cmd : commands) {
      cmd->name(llvm::outs() << "  #" << ANSIColors::bold())
          << ANSIColors::reset() << ": ";
      cmd->help(llvm::outs()) << '\n';
    }
  }
  std::string_view help() const override {
    return "Show available commands";
  }
  std::string_view name() const override {
    return "help";
  }
private:
  std::vector<std::unique_ptr<Command>> &commands;
};

struct QuietCommand : public Command {
  bool &quiet;
  QuietCommand(bool &quiet) : quiet(quiet) {}
  void callback(Session &session, ArrayRef<std::string> args) override {
    quiet = !quiet;
  }
  std::string_view help() const override {
    return "Toggle printing the inferred types after each entry";
  }
  std::string_view name() const override {
    return "quiet";
  }
};

struct ClearCommand : public Command {
  std::string &sourceSoFar;
  ClearCommand(std::string &sourceSoFar) : sourceSoFar(sourceSoFar) {}
  void callback(Session &session, ArrayRef<std::string> args) override {
    sourceSoFar = "";
    session.reset();
  }
  std::string_view help() const override {
    return "Forget every definition made so far";
  }
  std::string_view name() const override {
    return "clear";
  }
};

[[noreturn]] static void exitRepl(bool interactive, bool hadErrors) {
  if (interactive) {
    llvm::outs() << ANSIColors::faint() << ANSIColors::italic() << "Goodbye!\n"
                 << ANSIColors::reset();
  }
  llvm::outs().flush();
  std::exit(hadErrors);
}

[[noreturn]] void runRepl(int argc, char **argv, Session &session) {
  const bool interactive = llvm::sys::Process::StandardInIsUserInput();
  if (interactive && !CL::InRLWrap) {
    runUnderRlwrap(argc, argv);
  }
  std::string sourceSoFar;
  std::vector<std::unique_ptr<Command>> commands;
  commands.emplace_back(std::make_unique<TypeCommand>());
  commands.emplace_back(std::make_unique<EnvCommand>());
  commands.emplace_back(std::make_unique<ShowASTCommand>());
  commands.emplace_back(std::make_unique<ShowTypedASTCommand>());
  commands.emplace_back(std::make_unique<ShowSourceCommand>(sourceSoFar));
  commands.emplace_back(std::make_unique<HelpCommand>(commands));
  commands.emplace_back(std::make_unique<QuietCommand>(CL::Quiet));
  commands.emplace_back(std::make_unique<ClearCommand>(sourceSoFar));

  bool hadErrors = false;
  if (interactive) {
    llvm::outs() << ANSIColors::bold() << "PolyInfer REPL" << ANSIColors::reset() << "\n"
                 << ANSIColors::faint() << ANSIColors::italic()
                 << "(type an empty line by itself to finish the entry, or #help "
                    "for more commands)\n"
                 << ANSIColors::reset();
  }
  auto prompt = [&](llvm::StringRef text) {
    if (interactive) {
      llvm::outs() << ANSIColors::faint() << text << ANSIColors::reset();
    }
    llvm::outs().flush();
  };
  std::string line;
  while (true) {
    std::string source = "";
    prompt("> ");
    while (std::getline(std::cin, line)) {
      if (line == "") {
        break;
      }
      if (StringRef(line).startswith("#")) {
        SmallVector<StringRef> args;
        StringRef(line).drop_front().split(args, ' ', -1, /*KeepEmpty=*/false);
        if (args.empty()) {
          prompt("> ");
          continue;
        }
        auto it = llvm::find_if(commands, [&](const auto &c) {
          return std::string_view(args.front().data(), args.front().size()) == c->name();
        });
        if (it == commands.end()) {
          llvm::errs() << "Unknown command: " << args.front() << '\n';
          prompt("> ");
          continue;
        }
        DBGS("Running command: " << line << '\n');
        SmallVector<std::string> rest;
        for (auto arg : llvm::drop_begin(args)) {
          rest.push_back(arg.str());
        }
        (*it)->callback(session, rest);
        source = "";
        prompt("> ");
        continue;
      }
      source += line + '\n';
      prompt(". ");
    }
    if (source.empty()) {
      if (std::cin.eof() || std::cin.fail() || std::cin.bad()) {
        exitRepl(interactive, hadErrors);
      }
      continue;
    }
    session.loadSource(source, "<repl>");
    const bool failed = session.anyFatalErrors();
    if (CL::DTypedTree && !failed) {
      session.showTypedTree(llvm::outs());
    }
    if (!CL::Quiet) {
      session.showResults(llvm::outs());
    }
    if (failed) {
      llvm::outs().flush();
      session.showErrors();
      session.clearErrors();
      hadErrors = true;
      sourceSoFar += acceptedSource(session, source).str();
      continue;
    }
    sourceSoFar += source;
  }
}

} // namespace polyinfer
