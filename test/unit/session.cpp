#include "polyinfer/Infer/Session.h"
#include "polyinfer/Support/CL.h"
#include <llvm/Support/raw_ostream.h>

using namespace polyinfer;

static void showDiagnostics(Session &session) {
  for (const auto &diag : session.getDiagnostics()) {
    llvm::outs() << diag << "\n";
  }
  session.clearErrors();
}

int main() {
  CL::Color = false;
  Session session;
  llvm::outs() << "prelude add: " << (session.lookup("add") != nullptr) << "\n";

  session.loadSource("let id x = x\n"
                     "let k x y = x\n"
                     "id 3\n"
                     "k true\n");
  session.showResults(llvm::outs());
  session.showType(llvm::outs(), "id") << "\n";
  session.showType(llvm::outs(), "nope") << "\n";

  // Later sources see earlier definitions, and may shadow them.
  session.loadSource("let id = 5\nlet three = add 1 2\n;; k id");
  session.showResults(llvm::outs());
  llvm::outs() << "-- types\n";
  session.dumpTypes(llvm::outs());

  session.loadSource("let two = add 1 1");
  session.showParseTree(llvm::outs());
  session.showTypedTree(llvm::outs());

  // The first error stops the rest of its source.
  session.loadSource("let bad = fun x -> x x\nlet after = 1\n", "err.pi");
  llvm::outs() << "errors: " << session.anyFatalErrors()
               << " after: " << (session.lookup("after") != nullptr)
               << " results: " << session.getResults().size() << "\n";
  showDiagnostics(session);
  llvm::outs() << "errors: " << session.anyFatalErrors() << "\n";

  session.loadSource("let ok = 1\nif ok then 1 else 2\nlet never = 2", "cond.pi");
  showDiagnostics(session);
  llvm::outs() << "ok: " << (session.lookup("ok") != nullptr)
               << " never: " << (session.lookup("never") != nullptr) << "\n";

  session.loadSource("if true then 1 else false", "branch.pi");
  showDiagnostics(session);
  session.loadSource("let = 1", "syntax.pi");
  showDiagnostics(session);
  session.loadSource("fun x -> y", "unbound.pi");
  showDiagnostics(session);
  session.loadSourceFile("/nonexistent/input.pi");
  llvm::outs() << "missing file: " << session.getDiagnostics().size() << "\n";
  session.clearErrors();

  session.reset();
  llvm::outs() << "after reset: " << (session.lookup("id") != nullptr) << " "
               << (session.lookup("add") != nullptr) << "\n";
  session.dumpTypes(llvm::outs());
  llvm::outs() << "-- end\n";

  Session freestanding(InferenceOptions{}, /*freestanding=*/true);
  llvm::outs() << "freestanding env: " << freestanding.getEnvironment().size()
               << "\n";
  freestanding.loadSource("add 1 2");
  showDiagnostics(freestanding);
  freestanding.loadSource("let compose f g x = f (g x)");
  freestanding.showResults(llvm::outs());

  Session shallow(InferenceOptions{2, 0});
  shallow.loadSource("fun a -> fun b -> a");
  showDiagnostics(shallow);
  shallow.loadSource("fun a -> a");
  shallow.showResults(llvm::outs());

  // Only the tree of the last source and its node types are kept.
  Session trees;
  trees.loadSource("let a = add 1 2\nlet c = a");
  llvm::outs() << "typed nodes: " << trees.getInferencer().getNumTypedNodes();
  trees.loadSource("let b = true");
  llvm::outs() << " " << trees.getInferencer().getNumTypedNodes();
  trees.reset();
  llvm::outs() << " " << trees.getInferencer().getNumTypedNodes() << " "
               << (trees.getLastUnit() == nullptr) << "\n";
  return 0;
}
// CHECK: prelude add: 1
// CHECK-NEXT: val id : 'a -> 'a
// CHECK-NEXT: val k : 'a -> 'b -> 'a
// CHECK-NEXT: - : int
// CHECK-NEXT: - : 'a -> bool
// CHECK-NEXT: id : 'a -> 'a
// CHECK-NEXT: Type unknown for symbol: 'nope'
// CHECK-NEXT: val id : int
// CHECK-NEXT: val three : int
// CHECK-NEXT: - : 'a -> int
// CHECK-NEXT: -- types
// CHECK-NEXT: val id : int
// CHECK-NEXT: val k : 'a -> 'b -> 'a
// CHECK-NEXT: val three : int
// CHECK-NEXT: CompilationUnit <string>
// CHECK-NEXT:   Definition 'two' <1:1>
// CHECK-NEXT:     Application <1:11>
// CHECK-NEXT:       Application <1:11>
// CHECK-NEXT:         Variable 'add' <1:11>
// CHECK-NEXT:         Literal 1 <1:15>
// CHECK-NEXT:       Literal 1 <1:17>
// CHECK-NEXT: Definition 'two' : int
// CHECK-NEXT:   Application : int
// CHECK-NEXT:     Application : int -> int
// CHECK-NEXT:       Variable 'add' : int -> int -> int
// CHECK-NEXT:       Literal 1 : int
// CHECK-NEXT:     Literal 1 : int
// CHECK-NEXT: errors: 1 after: 0 results: 0
// CHECK-NEXT: err.pi:1:20: error: occurs check failed: 'a occurs in 'a -> 'b
// CHECK-NEXT: errors: 0
// CHECK-NEXT: cond.pi:2:4: error: type mismatch: expected int but got bool
// CHECK-NEXT: ok: 1 never: 0
// CHECK-NEXT: branch.pi:1:21: error: type mismatch: expected int but got bool
// CHECK-NEXT: syntax.pi:1:5: error: expected identifier after 'let', got '='
// CHECK-NEXT: unbound.pi:1:10: error: undefined variable 'y'
// CHECK-NEXT: missing file: 1
// CHECK-NEXT: after reset: 0 1
// CHECK-NEXT: -- end
// CHECK-NEXT: freestanding env: 0
// CHECK-NEXT: <string>:1:1: error: undefined variable 'add'
// CHECK-NEXT: val compose : ('a -> 'b) -> ('c -> 'a) -> 'c -> 'b
// CHECK-NEXT: <string>:1:19: error: inference too complex: nesting depth exceeds 2
// CHECK-NEXT: - : 'a -> 'a
// CHECK-NEXT: typed nodes: 6 1 0 1
