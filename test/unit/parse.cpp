#include "polyinfer/AST/AST.h"
#include "polyinfer/Parse/Parse.h"
#include <llvm/Support/raw_ostream.h>

using namespace polyinfer;

static void roundTrip(llvm::StringRef source) {
  auto unit = parse(source, "test.pi");
  if (!unit) {
    llvm::outs() << "error: " << llvm::toString(unit.takeError()) << "\n";
    return;
  }
  llvm::outs() << **unit;
}

int main() {
  roundTrip("1");
  roundTrip("f x y");
  roundTrip("f (g x) (fun y -> y)");
  roundTrip("(fun x -> x) 1");
  roundTrip("fun x y z -> x z (y z)");
  roundTrip("let id = fun x -> x in id id");
  roundTrip("let rec loop n = loop n in loop");
  roundTrip("if true then () else ignore false");
  roundTrip("let x = 1\nlet y = 2 ;; add x y");
  roundTrip("-- comment only\nf -- trailing\n  x");
  roundTrip("(((x)))");

  // A line starting in column 1 begins a new item, except inside parentheses.
  roundTrip("let id x = x\nid 3\nid\n  true");
  roundTrip("(f\nx)");

  // Errors carry the position of the offending token.
  roundTrip("let x = in x");
  roundTrip("fun -> x");
  roundTrip("fun x x");
  roundTrip("(f x");
  roundTrip("if c then a");
  roundTrip("f x\n  $ y");
  roundTrip("1 - 2");
  roundTrip("x ; y");
  roundTrip("99999999999999999999");
  roundTrip("let f = let g = 1 in g\nf ()");
  roundTrip("fun x -> let y = x");
  roundTrip(")");
  roundTrip("let y\xC3\xA9 = 1");

  auto unit = parse("let twice f x = f (f x)\n"
                    "let rec count n = if eq n 0 then 0 else count (sub n 1)\n"
                    "twice (fun x -> x) true\n",
                    "tree.pi");
  if (!unit) {
    llvm::outs() << "error: " << llvm::toString(unit.takeError()) << "\n";
    return 1;
  }
  dumpAST(llvm::outs(), **unit);
  return 0;
}
// CHECK: 1
// CHECK-NEXT: f x y
// CHECK-NEXT: f (g x) (fun y -> y)
// CHECK-NEXT: (fun x -> x) 1
// CHECK-NEXT: fun x -> fun y -> fun z -> x z (y z)
// CHECK-NEXT: let id = fun x -> x in id id
// CHECK-NEXT: let rec loop = fun n -> loop n in loop
// CHECK-NEXT: if true then () else ignore false
// CHECK-NEXT: let x = 1
// CHECK-NEXT: let y = 2
// CHECK-NEXT: add x y
// CHECK-NEXT: f x
// CHECK-NEXT: x
// CHECK-NEXT: let id = fun x -> x
// CHECK-NEXT: id 3
// CHECK-NEXT: id true
// CHECK-NEXT: f x
// CHECK-NEXT: error: test.pi:1:9: expected expression, got 'in'
// CHECK-NEXT: error: test.pi:1:5: expected parameter after 'fun', got '->'
// CHECK-NEXT: error: test.pi:1:7: expected '->', got end of input
// CHECK-NEXT: error: test.pi:1:4: expected ')', got end of input
// CHECK-NEXT: error: test.pi:1:11: expected 'else', got end of input
// CHECK-NEXT: error: test.pi:2:3: expected expression, got invalid token (unexpected character '$')
// CHECK-NEXT: error: test.pi:1:3: expected expression, got invalid token (expected '>' after '-')
// CHECK-NEXT: error: test.pi:1:3: expected expression, got invalid token (expected ';;')
// CHECK-NEXT: error: test.pi:1:1: expected expression, got invalid token (integer literal out of range: 99999999999999999999)
// CHECK-NEXT: let f = let g = 1 in g
// CHECK-NEXT: f ()
// CHECK-NEXT: error: test.pi:1:18: expected 'in' after binding of 'y', got end of input
// CHECK-NEXT: error: test.pi:1:1: expected expression, got ')'
// CHECK-NEXT: error: test.pi:1:6: expected '=' in binding of 'y', got invalid token (unexpected character 'é')
// CHECK-NEXT: CompilationUnit tree.pi
// CHECK-NEXT:   Definition 'twice' <1:1>
// CHECK-NEXT:     Lambda 'f' <1:11>
// CHECK-NEXT:       Lambda 'x' <1:13>
// CHECK-NEXT:         Application <1:17>
// CHECK-NEXT:           Variable 'f' <1:17>
// CHECK-NEXT:           Application <1:20>
// CHECK-NEXT:             Variable 'f' <1:20>
// CHECK-NEXT:             Variable 'x' <1:22>
// CHECK-NEXT:   Definition rec 'count' <2:1>
// CHECK-NEXT:     Lambda 'n' <2:15>
// CHECK-NEXT:       If <2:19>
// CHECK-NEXT:         Application <2:22>
// CHECK-NEXT:           Application <2:22>
// CHECK-NEXT:             Variable 'eq' <2:22>
// CHECK-NEXT:             Variable 'n' <2:25>
// CHECK-NEXT:           Literal 0 <2:27>
// CHECK-NEXT:         Literal 0 <2:34>
// CHECK-NEXT:         Application <2:41>
// CHECK-NEXT:           Variable 'count' <2:41>
// CHECK-NEXT:           Application <2:48>
// CHECK-NEXT:             Application <2:48>
// CHECK-NEXT:               Variable 'sub' <2:48>
// CHECK-NEXT:               Variable 'n' <2:52>
// CHECK-NEXT:             Literal 1 <2:54>
// CHECK-NEXT:   Expression <3:1>
// CHECK-NEXT:     Application <3:1>
// CHECK-NEXT:       Application <3:1>
// CHECK-NEXT:         Variable 'twice' <3:1>
// CHECK-NEXT:         Lambda 'x' <3:8>
// CHECK-NEXT:           Variable 'x' <3:17>
// CHECK-NEXT:       Literal true <3:20>
