#pragma once

#include <cassert>
#include <cctype>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <string>
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/raw_ostream.h"

#define DEBUG_TYPE "lex"
#include "polyinfer/Support/Debug.h.inc"

namespace polyinfer {

/// Position of the first character of a token
struct LexLocation {
  std::shared_ptr<std::string> file; ///< filename
  unsigned line;                     ///< line number, from 1
  unsigned col;                      ///< column number, from 1
};

/// Token types returned by the lexer
enum Token : int {
  // Single character tokens use their ASCII value
  tok_parenthese_open = '(',
  tok_parenthese_close = ')',
  tok_equal = '=',

  tok_eof = -1,
  tok_error = -2,

  // Identifiers and literals
  tok_identifier = -3,
  tok_integer_literal = -4,

  // Keywords
  tok_let = -5,
  tok_rec = -6,
  tok_in = -7,
  tok_fun = -8,
  tok_if = -9,
  tok_then = -10,
  tok_else = -11,
  tok_true = -12,
  tok_false = -13,

  // Multi-character punctuation
  tok_arrow = -14,     // ->
  tok_semisemi = -15,  // ;;
};

inline llvm::StringRef getTokenName(Token tok) {
  switch (tok) {
  case tok_parenthese_open: return "'('";
  case tok_parenthese_close: return "')'";
  case tok_equal: return "'='";
  case tok_eof: return "end of input";
  case tok_error: return "invalid token";
  case tok_identifier: return "identifier";
  case tok_integer_literal: return "integer literal";
  case tok_let: return "'let'";
  case tok_rec: return "'rec'";
  case tok_in: return "'in'";
  case tok_fun: return "'fun'";
  case tok_if: return "'if'";
  case tok_then: return "'then'";
  case tok_else: return "'else'";
  case tok_true: return "'true'";
  case tok_false: return "'false'";
  case tok_arrow: return "'->'";
  case tok_semisemi: return "';;'";
  }
  return "unknown token";
}

/// Lexer for the expression language. Comments run from `--` to the end of
/// the line.
class Lexer {
public:
  /// Create a lexer for the given filename.
  Lexer(std::string filename)
      : lastLocation({std::make_shared<std::string>(std::move(filename)), 0, 0}) {}
  virtual ~Lexer() = default;

  /// Move to the next token in the stream and return it
  Token getNextToken() { return curTok = getTok(); }

  /// Return the current identifier (current token is tok_identifier)
  llvm::StringRef getIdentifier() {
    assert(curTok == tok_identifier);
    return identifierStr;
  }

  /// Return the current integer literal (current token is tok_integer_literal)
  int64_t getIntegerLiteral() {
    assert(curTok == tok_integer_literal);
    return integerLiteral;
  }

  /// Why the current token is tok_error
  llvm::StringRef getErrorMessage() { return errorMessage; }

  /// Return the location of the current token
  LexLocation getLastLocation() { return lastLocation; }

protected:
  /// Delegate to a derived class fetching the next line. Returns an empty
  /// string to signal end of file (EOF). Lines are expected to end with "\n"
  virtual llvm::StringRef readNextLine() = 0;

  /// Get the next character from the input, as an unsigned byte or EOF
  int getNextChar() {
    // The current line buffer should not be empty unless it is the end of file.
    if (curLineBuffer.empty())
      return EOF;
    ++curCol;
    char nextchar = curLineBuffer.front();
    curLineBuffer = curLineBuffer.drop_front();
    if (curLineBuffer.empty())
      curLineBuffer = readNextLine();
    if (nextchar == '\n') {
      ++curLineNum;
      curCol = 0;
    }
    return static_cast<unsigned char>(nextchar);
  }

  /// Look ahead at the next character without consuming it
  int peekNextChar() {
    if (curLineBuffer.empty())
      return EOF;
    return static_cast<unsigned char>(curLineBuffer.front());
  }

  /// Skip whitespace and comments
  void skipWhitespace() {
    while (true) {
      while (isspace(lastChar))
        lastChar = getNextChar();
      if (lastChar != '-' || peekNextChar() != '-')
        return;
      while (lastChar != '\n' && lastChar != EOF)
        lastChar = getNextChar();
    }
  }

  Token error(std::string message) {
    errorMessage = std::move(message);
    DBGS("lex error: " << errorMessage << "\n");
    return tok_error;
  }

  /// Parse and return the next token
  Token getTok() {
    skipWhitespace();

    // Save the current location before reading the token characters
    lastLocation.line = curLineNum;
    lastLocation.col = curCol;

    if (lastChar == EOF)
      return tok_eof;

    if (lastChar == '(' || lastChar == ')' || lastChar == '=') {
      Token thisChar = static_cast<Token>(lastChar);
      lastChar = getNextChar();
      return thisChar;
    }

    if (lastChar == '-') {
      lastChar = getNextChar();
      if (lastChar != '>')
        return error("expected '>' after '-'");
      lastChar = getNextChar();
      return tok_arrow;
    }

    if (lastChar == ';') {
      lastChar = getNextChar();
      if (lastChar != ';')
        return error("expected ';;'");
      lastChar = getNextChar();
      return tok_semisemi;
    }

    // Identifier: [A-Za-z_][A-Za-z0-9_']*
    if (isalpha(lastChar) || lastChar == '_') {
      identifierStr = "";
      do {
        identifierStr += static_cast<char>(lastChar);
        lastChar = getNextChar();
      } while (isalnum(lastChar) || lastChar == '_' || lastChar == '\'');

      if (identifierStr == "let") return tok_let;
      if (identifierStr == "rec") return tok_rec;
      if (identifierStr == "in") return tok_in;
      if (identifierStr == "fun") return tok_fun;
      if (identifierStr == "if") return tok_if;
      if (identifierStr == "then") return tok_then;
      if (identifierStr == "else") return tok_else;
      if (identifierStr == "true") return tok_true;
      if (identifierStr == "false") return tok_false;
      DBGS("got identifier: " << identifierStr << "\n");
      return tok_identifier;
    }

    // Integer: [0-9]+
    if (isdigit(lastChar)) {
      std::string numStr;
      do {
        numStr += static_cast<char>(lastChar);
        lastChar = getNextChar();
      } while (isdigit(lastChar));
      if (llvm::StringRef(numStr).getAsInteger(10, integerLiteral))
        return error("integer literal out of range: " + numStr);
      DBGS("got integer literal: " << integerLiteral << "\n");
      return tok_integer_literal;
    }

    // Unknown character - advance to avoid infinite loop. A UTF-8 lead byte
    // takes its continuation bytes with it.
    std::string unknown(1, static_cast<char>(lastChar));
    unsigned continuations = lastChar >= 0xF0 ? 3
                             : lastChar >= 0xE0 ? 2
                             : lastChar >= 0xC0 ? 1
                                                : 0;
    lastChar = getNextChar();
    while (continuations-- > 0 && lastChar >= 0x80 && lastChar < 0xC0) {
      unknown += static_cast<char>(lastChar);
      lastChar = getNextChar();
    }
    return error("unexpected character '" + unknown + "'");
  }

  /// The current token in the stream
  Token curTok = tok_eof;

  /// Location information for the current token
  LexLocation lastLocation;

  /// Identifier value when token is an identifier
  std::string identifierStr;

  /// Integer literal value when token is an integer
  int64_t integerLiteral = 0;

  /// Message for the last tok_error
  std::string errorMessage;

  /// The last character read from the input
  int lastChar = ' ';

  /// Current line number in the input
  unsigned curLineNum = 0;

  /// Current column number in the input
  unsigned curCol = 0;

  /// Buffer for the current line of input
  llvm::StringRef curLineBuffer = "\n";
};

/// A lexer implementation operating on a buffer in memory
class LexerBuffer final : public Lexer {
public:
  LexerBuffer(const char *begin, const char *end, std::string filename)
      : Lexer(std::move(filename)), current(begin), end(end) {}

private:
  /// Provide one line at a time to the Lexer, return an empty string when
  /// reaching the end of the buffer.
  llvm::StringRef readNextLine() override {
    auto *begin = current;
    while (current < end && *current != '\n')
      ++current;
    if (current < end)
      ++current;
    return llvm::StringRef{begin, static_cast<size_t>(current - begin)};
  }
  const char *current, *end;
};

} // namespace polyinfer

#undef DEBUG_TYPE
