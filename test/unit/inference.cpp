#include "polyinfer/AST/AST.h"
#include "polyinfer/Infer/Environment.h"
#include "polyinfer/Infer/Inference.h"
#include "polyinfer/Infer/Prelude.h"
#include "polyinfer/Support/CL.h"
#include "polyinfer/Support/LLVMCommon.h"
#include "polyinfer/Types/TypeContext.h"
#include "polyinfer/Types/TypeError.h"
#include <llvm/Support/raw_ostream.h>

using namespace polyinfer;
using namespace polyinfer::ast;

static void show(llvm::StringRef label, const ExprAST &expr,
                 const Environment &env = {}, InferenceOptions options = {}) {
  TypeContext context;
  Inferencer inferencer(context, options);
  llvm::outs() << label << ": ";
  auto type = inferencer.inferType(expr, env);
  if (!type) {
    llvm::outs() << "error: " << llvm::toString(type.takeError()) << "\n";
    return;
  }
  llvm::outs() << showType(*type) << "\n";
}

static Environment withPrelude(TypeContext &context) {
  Environment env;
  declarePrelude(context, env);
  return env;
}

int main() {
  CL::Color = false;

  // let id = fun x -> x in id 5
  auto idApplied = let("id", lambda("x", var("x")), app(var("id"), intLit(5)));
  show("let-bound identity", *idApplied);
  {
    TypeContext context;
    Inferencer inferencer(context);
    Environment env = Environment().extend("x", TypeScheme(context.getIntType()));
    llvm::outs() << "variable from environment: "
                 << showType(must(inferencer.inferType(*var("x"), env))) << "\n";
    auto idTrue = let("id", lambda("x", var("x")), app(var("id"), boolLit(true)));
    llvm::outs() << "let-bound identity on bool: "
                 << showType(must(inferencer.inferType(*idTrue, env))) << "\n";
  }
  show("self application", *lambda("x", app(var("x"), var("x"))));
  show("branch mismatch",
       *ifThenElse(boolLit(true), intLit(1), boolLit(false)));
  show("lambda-bound stays monomorphic",
       *lambda("f", let("g", var("f"), app(var("g"), intLit(1)))));
  show("unbound", *lambda("x", var("y")));
  show("const", *lambda("x", lambda("y", var("x"))));
  show("unit", *unitLit());
  show("apply", *lambda("f", lambda("x", app(var("f"), var("x")))));

  // let id = fun x -> x in if id true then id 1 else id 2
  show("polymorphic use",
       *let("id", lambda("x", var("x")),
            ifThenElse(app(var("id"), boolLit(true)), app(var("id"), intLit(1)),
                       app(var("id"), intLit(2)))));
  show("polymorphic argument rejected",
       *lambda("f", ifThenElse(app(var("f"), boolLit(true)),
                               app(var("f"), intLit(1)), intLit(2))));
  show("condition must be bool", *ifThenElse(intLit(1), intLit(2), intLit(3)));
  show("applying a non-function", *app(intLit(1), intLit(2)));

  {
    TypeContext context;
    Environment env = withPrelude(context);
    Inferencer inferencer(context);
    // let rec fact = fun n -> if eq n 0 then 1 else mul n (fact (sub n 1)) in fact
    auto fact = letrec(
        "fact",
        lambda("n", ifThenElse(app(var("eq"), var("n"), intLit(0)), intLit(1),
                               app(var("mul"), var("n"),
                                   app(var("fact"),
                                       app(var("sub"), var("n"), intLit(1)))))),
        var("fact"));
    auto type = inferencer.inferType(*fact, env);
    llvm::outs() << "factorial: " << showType(must(std::move(type))) << "\n";

    auto unused = inferencer.inferType(*app(var("ignore"), intLit(3)), env);
    llvm::outs() << "ignore: " << showType(must(std::move(unused))) << "\n";
    auto notInt = inferencer.inferType(*app(var("not"), intLit(3)), env);
    if (!notInt) {
      llvm::outs() << "not 3: " << llvm::toString(notInt.takeError()) << "\n";
    }
  }

  show("recursive use is monomorphic",
       *letrec("f",
               lambda("x", ifThenElse(boolLit(true), var("x"),
                                      app(var("f"), intLit(1)))),
               var("f")));
  show("recursive binding generalized",
       *letrec("f", lambda("x", var("x")),
               ifThenElse(app(var("f"), boolLit(true)), app(var("f"), intLit(1)),
                          intLit(0))));
  show("nonrecursive let does not see itself",
       *let("f", lambda("x", app(var("f"), var("x"))), var("f")));

  // Resource ceilings.
  auto nested = lambda("a", lambda("b", lambda("c", var("a"))));
  show("depth 3", *nested, {}, InferenceOptions{3, 0});
  show("depth 4", *nested, {}, InferenceOptions{4, 0});
  auto redex = app(lambda("x", var("x")), intLit(1));
  show("steps 3", *redex, {}, InferenceOptions{0, 3});
  show("steps 4", *redex, {}, InferenceOptions{0, 4});
  {
    TypeContext context;
    Inferencer inferencer(context, InferenceOptions{3, 0});
    auto tooDeep = inferencer.inferType(*nested, Environment());
    llvm::handleAllErrors(tooDeep.takeError(), [](const TypeError &error) {
      llvm::outs() << TypeError::getKindName(error.getKind()) << " limit "
                   << error.getLimitValue() << "\n";
    });
  }

  // Fresh contexts produce the same types; one context produces renamed ones.
  {
    TypeContext first, second;
    Inferencer a(first), b(second);
    auto ta = must(a.inferType(*idApplied, Environment()));
    auto tb = must(b.inferType(*idApplied, Environment()));
    llvm::outs() << "deterministic: " << (*ta == *tb) << "\n";
    auto compose = lambda(
        "f", lambda("g", lambda("x", app(var("f"), app(var("g"), var("x"))))));
    auto c1 = must(a.inferType(*compose, Environment()));
    auto c2 = must(a.inferType(*compose, Environment()));
    llvm::outs() << "renamed: " << (c1 != c2) << " " << alphaEquivalent(c1, c2)
                 << "\n";
  }

  // Top-level definitions are generalized against the given environment.
  {
    TypeContext context;
    Inferencer inferencer(context);
    auto composeDef = ItemAST::getDefinition(
        Location{}, RecFlag::Nonrecursive, "compose",
        lambda("f", lambda("g", lambda("x", app(var("f"),
                                                  app(var("g"), var("x")))))));
    auto scheme = must(inferencer.inferDefinition(*composeDef, Environment()));
    llvm::outs() << "val compose : " << showScheme(scheme) << " quantified "
                 << scheme.getVars().size() << "\n";

    auto loopDef = ItemAST::getDefinition(
        Location{"defs.pi", 4, 1}, RecFlag::Recursive, "loop",
        lambda("x", app(var("loop"), var("x"))));
    auto loop = must(inferencer.inferDefinition(*loopDef, Environment()));
    llvm::outs() << "val loop : " << showScheme(loop) << "\n";

    auto badDef = ItemAST::getDefinition(
        Location{"defs.pi", 7, 1}, RecFlag::Nonrecursive, "bad",
        lambda("x", app(var("x"), var("x"))));
    auto bad = inferencer.inferDefinition(*badDef, Environment());
    llvm::handleAllErrors(bad.takeError(), [](const TypeError &error) {
      llvm::outs() << *error.getLocation() << ": " << error.message() << "\n";
    });
  }

  // Typed tree of the first example.
  {
    TypeContext context;
    Inferencer inferencer(context);
    must(inferencer.inferType(*idApplied, Environment()));
    inferencer.dumpTypedTree(llvm::outs(), *idApplied);
    llvm::outs() << "lambda node: "
                 << *inferencer.getType(
                        *llvm::cast<LetExprAST>(*idApplied).getValue())
                 << "\n";
  }
  return 0;
}
// CHECK: let-bound identity: int
// CHECK-NEXT: variable from environment: int
// CHECK-NEXT: let-bound identity on bool: bool
// CHECK-NEXT: self application: error: occurs check failed: 'a occurs in 'a -> 'b
// CHECK-NEXT: branch mismatch: error: type mismatch: expected int but got bool
// CHECK-NEXT: lambda-bound stays monomorphic: (int -> 'a) -> 'a
// CHECK-NEXT: unbound: error: undefined variable 'y'
// CHECK-NEXT: const: 'a -> 'b -> 'a
// CHECK-NEXT: unit: unit
// CHECK-NEXT: apply: ('a -> 'b) -> 'a -> 'b
// CHECK-NEXT: polymorphic use: int
// CHECK-NEXT: polymorphic argument rejected: error: type mismatch: expected bool but got int
// CHECK-NEXT: condition must be bool: error: type mismatch: expected int but got bool
// CHECK-NEXT: applying a non-function: error: type mismatch: expected int but got int -> 'a
// CHECK-NEXT: factorial: int -> int
// CHECK-NEXT: ignore: unit
// CHECK-NEXT: not 3: type mismatch: expected bool but got int
// CHECK-NEXT: recursive use is monomorphic: int -> int
// CHECK-NEXT: recursive binding generalized: int
// CHECK-NEXT: nonrecursive let does not see itself: error: undefined variable 'f'
// CHECK-NEXT: depth 3: error: inference too complex: nesting depth exceeds 3
// CHECK-NEXT: depth 4: 'a -> 'b -> 'c -> 'a
// CHECK-NEXT: steps 3: error: inference too complex: number of steps exceeds 3
// CHECK-NEXT: steps 4: int
// CHECK-NEXT: InferenceTooComplex limit 3
// CHECK-NEXT: deterministic: 1
// CHECK-NEXT: renamed: 1 1
// CHECK-NEXT: val compose : ('a -> 'b) -> ('c -> 'a) -> 'c -> 'b quantified 3
// CHECK-NEXT: val loop : 'a -> 'b
// CHECK-NEXT: defs.pi:7:1: occurs check failed: 'a occurs in 'a -> 'b
// CHECK-NEXT: Let 'id' : int
// CHECK-NEXT:   Lambda 'x' : 'a -> 'a
// CHECK-NEXT:     Variable 'x' : 'a
// CHECK-NEXT:   Application : int
// CHECK-NEXT:     Variable 'id' : int -> int
// CHECK-NEXT:     Literal 5 : int
// CHECK-NEXT: lambda node: 't0 -> 't0
