#include "polyinfer/Parse/Parse.h"
#include "polyinfer/AST/AST.h"
#include "polyinfer/Parse/Lex.h"
#include "llvm/ADT/STLExtras.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/Support/raw_ostream.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

#define DEBUG_TYPE "parse"
#include "polyinfer/Support/Debug.h.inc"

#define SSWRAP(...)                                                            \
  [&] {                                                                        \
    std::string str;                                                           \
    llvm::raw_string_ostream ss(str);                                          \
    ss << __VA_ARGS__;                                                         \
    return ss.str();                                                           \
  }()

#define FAIL(...)                                                              \
  do {                                                                         \
    error(SSWRAP(__VA_ARGS__));                                                \
    return nullptr;                                                            \
  } while (0)

#define ORFAIL(expr, ...)                                                      \
  if (!(expr)) {                                                               \
    FAIL(__VA_ARGS__);                                                         \
  }

namespace polyinfer {

char ParseError::ID = 0;

namespace {

/// Nesting the recursive descent accepts before giving up.
constexpr unsigned maxNestingDepth = 10000;

class Parser {
public:
  Parser(Lexer &lexer) : lexer(lexer) {
    // Prime the first token
    getNextToken();
  }

  llvm::Expected<std::unique_ptr<CompilationUnitAST>> parseCompilationUnit() {
    DBGS("Parsing compilation unit\n");
    auto loc = createLocation();
    std::vector<std::unique_ptr<ItemAST>> items;
    while (curTok != tok_eof) {
      if (curTok == tok_semisemi) {
        getNextToken(); // Consume ';;'
        continue;
      }
      auto item = parseItem();
      if (!item) {
        return takeError();
      }
      items.push_back(std::move(item));
    }
    return std::make_unique<CompilationUnitAST>(loc, std::move(items));
  }

private:
  Lexer &lexer;
  Token curTok = tok_eof;
  unsigned depth = 0;
  unsigned parenDepth = 0;

  /// First failure, with the position of the token it happened at.
  std::optional<ParseError> firstError;

  struct DepthScope {
    DepthScope(unsigned &depth) : depth(depth) { ++depth; }
    ~DepthScope() { --depth; }
    unsigned &depth;
  };

  Token getNextToken() {
    Token newToken = lexer.getNextToken();
    DBGS("Next token: " << getTokenName(newToken) << " at line "
                        << lexer.getLastLocation().line << ", col "
                        << lexer.getLastLocation().col << "\n");
    return curTok = newToken;
  }

  Location createLocation() {
    auto lexLoc = lexer.getLastLocation();
    return Location{*lexLoc.file, lexLoc.line, lexLoc.col};
  }

  void error(std::string message) {
    if (firstError) {
      return;
    }
    if (curTok == tok_error) {
      message += " (" + lexer.getErrorMessage().str() + ")";
    }
    firstError.emplace(createLocation(), std::move(message));
    DBGS("error: " << firstError->getMessage() << "\n");
  }

  llvm::Error takeError() {
    if (!firstError) {
      return llvm::make_error<ParseError>(createLocation(), "parse error");
    }
    return llvm::make_error<ParseError>(firstError->getLocation(),
                                        firstError->getMessage().str());
  }

  static bool isAtomStart(Token tok) {
    return tok == tok_identifier || tok == tok_integer_literal ||
           tok == tok_true || tok == tok_false || tok == tok_parenthese_open;
  }

  /// Outside parentheses, a token in column 1 begins the next item.
  bool startsNewItem() {
    return parenDepth == 0 && lexer.getLastLocation().col == 1;
  }

  // 'let' ['rec'] ident ident* '=' expr ['in' expr]
  // Without 'in' the result is a top-level definition, which is only
  // accepted when `topLevel` is set.
  std::unique_ptr<ItemAST> parseLetItem(bool topLevel) {
    auto loc = createLocation();
    getNextToken(); // Consume 'let'
    RecFlag recFlag = RecFlag::Nonrecursive;
    if (curTok == tok_rec) {
      recFlag = RecFlag::Recursive;
      getNextToken(); // Consume 'rec'
    }
    ORFAIL(curTok == tok_identifier,
           "expected identifier after 'let', got " << getTokenName(curTok));
    std::string name = lexer.getIdentifier().str();
    getNextToken();

    llvm::SmallVector<std::pair<std::string, Location>> parameters;
    while (curTok == tok_identifier) {
      parameters.emplace_back(lexer.getIdentifier().str(), createLocation());
      getNextToken();
    }
    ORFAIL(curTok == tok_equal,
           "expected '=' in binding of '" << name << "', got " << getTokenName(curTok));
    getNextToken(); // Consume '='

    auto value = parseExpr();
    if (!value) {
      return nullptr;
    }
    // let f x y = e is let f = fun x -> fun y -> e
    for (auto &[parameter, paramLoc] : llvm::reverse(parameters)) {
      value = std::make_unique<LambdaExprAST>(paramLoc, parameter, std::move(value));
    }

    if (curTok != tok_in) {
      ORFAIL(topLevel, "expected 'in' after binding of '" << name << "', got "
                                                         << getTokenName(curTok));
      return ItemAST::getDefinition(loc, recFlag, std::move(name), std::move(value));
    }
    getNextToken(); // Consume 'in'
    auto body = parseExpr();
    if (!body) {
      return nullptr;
    }
    auto let = std::make_unique<LetExprAST>(loc, recFlag, std::move(name),
                                            std::move(value), std::move(body));
    return ItemAST::getExpression(loc, std::move(let));
  }

  std::unique_ptr<ItemAST> parseItem() {
    DBGS("Parsing item\n");
    if (curTok == tok_let) {
      return parseLetItem(/*topLevel=*/true);
    }
    auto loc = createLocation();
    auto expr = parseExpr();
    if (!expr) {
      return nullptr;
    }
    return ItemAST::getExpression(loc, std::move(expr));
  }

  ExprPtr parseExpr() {
    DepthScope scope(depth);
    ORFAIL(depth <= maxNestingDepth,
           "expression nesting depth exceeds " << maxNestingDepth);
    switch (curTok) {
    case tok_fun:
      return parseLambda();
    case tok_let: {
      auto item = parseLetItem(/*topLevel=*/false);
      if (!item) {
        return nullptr;
      }
      return item->takeValue();
    }
    case tok_if:
      return parseIf();
    default:
      return parseApplication();
    }
  }

  // 'fun' ident+ '->' expr
  ExprPtr parseLambda() {
    auto loc = createLocation();
    getNextToken(); // Consume 'fun'
    llvm::SmallVector<std::pair<std::string, Location>> parameters;
    while (curTok == tok_identifier) {
      parameters.emplace_back(lexer.getIdentifier().str(), createLocation());
      getNextToken();
    }
    ORFAIL(!parameters.empty(),
           "expected parameter after 'fun', got " << getTokenName(curTok));
    ORFAIL(curTok == tok_arrow, "expected '->', got " << getTokenName(curTok));
    getNextToken(); // Consume '->'
    auto body = parseExpr();
    if (!body) {
      return nullptr;
    }
    for (size_t i = parameters.size(); i-- > 1;) {
      body = std::make_unique<LambdaExprAST>(parameters[i].second,
                                             std::move(parameters[i].first),
                                             std::move(body));
    }
    return std::make_unique<LambdaExprAST>(loc, std::move(parameters[0].first),
                                           std::move(body));
  }

  // 'if' expr 'then' expr 'else' expr
  ExprPtr parseIf() {
    auto loc = createLocation();
    getNextToken(); // Consume 'if'
    auto condition = parseExpr();
    if (!condition) {
      return nullptr;
    }
    ORFAIL(curTok == tok_then, "expected 'then', got " << getTokenName(curTok));
    getNextToken(); // Consume 'then'
    auto thenBranch = parseExpr();
    if (!thenBranch) {
      return nullptr;
    }
    ORFAIL(curTok == tok_else, "expected 'else', got " << getTokenName(curTok));
    getNextToken(); // Consume 'else'
    auto elseBranch = parseExpr();
    if (!elseBranch) {
      return nullptr;
    }
    return std::make_unique<IfExprAST>(loc, std::move(condition),
                                       std::move(thenBranch), std::move(elseBranch));
  }

  // atom atom*, left associative; stops at an atom that starts a new item
  ExprPtr parseApplication() {
    auto loc = createLocation();
    auto function = parseAtom();
    if (!function) {
      return nullptr;
    }
    while (isAtomStart(curTok) && !startsNewItem()) {
      auto argument = parseAtom();
      if (!argument) {
        return nullptr;
      }
      function = std::make_unique<ApplicationExprAST>(loc, std::move(function),
                                                      std::move(argument));
    }
    return function;
  }

  ExprPtr parseAtom() {
    auto loc = createLocation();
    switch (curTok) {
    case tok_identifier: {
      auto var = std::make_unique<VariableExprAST>(loc, lexer.getIdentifier().str());
      getNextToken();
      return var;
    }
    case tok_integer_literal: {
      auto lit = LiteralExprAST::getInt(loc, lexer.getIntegerLiteral());
      getNextToken();
      return lit;
    }
    case tok_true:
    case tok_false: {
      auto lit = LiteralExprAST::getBool(loc, curTok == tok_true);
      getNextToken();
      return lit;
    }
    case tok_parenthese_open: {
      getNextToken(); // Consume '('
      if (curTok == tok_parenthese_close) {
        getNextToken(); // Consume ')'
        return LiteralExprAST::getUnit(loc);
      }
      ++parenDepth;
      auto expr = parseExpr();
      --parenDepth;
      if (!expr) {
        return nullptr;
      }
      ORFAIL(curTok == tok_parenthese_close,
             "expected ')', got " << getTokenName(curTok));
      getNextToken(); // Consume ')'
      return expr;
    }
    default:
      FAIL("expected expression, got " << getTokenName(curTok));
    }
  }
};

} // namespace

llvm::Expected<std::unique_ptr<CompilationUnitAST>>
parse(llvm::StringRef source, llvm::StringRef filename) {
  DBGS("Source:\n" << source << "\n");
  LexerBuffer lexer(source.begin(), source.end(), filename.str());
  Parser parser(lexer);
  return parser.parseCompilationUnit();
}

} // namespace polyinfer
