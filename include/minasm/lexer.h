#ifndef MINASM_LEXER_H
#define MINASM_LEXER_H

#include <cstddef>
#include <string>

#include "llvm/ADT/StringRef.h"

namespace minasm {
//===----------------------------------------------------------------------===//
// Lexer
//===----------------------------------------------------------------------===//
// The lexer returns tokens [0-255] if it is an unknown character, otherwise one
// of these for known things.
enum Token {
  tok_eof = -1,

  // primary
  tok_identifier = -2,
  tok_number = -3,

  // keywords
  tok_if = -4,
  tok_goto = -5,
  tok_stop = -6,
  tok_abs = -7,

  // operators
  tok_eqeq = -8
};

/// Tokenizes a single statement body. Unlike a file lexer it never crosses a
/// line: the loader hands it one code fragment at a time.
class Lexer {
public:
  explicit Lexer(llvm::StringRef source) : source(source) {}

  int gettok();

  llvm::StringRef getNumStr() const { return numStr; }
  std::size_t getTokColumn() const { return tokColumn; }
  /// Whitespace skipped right before the current token, exactly as written.
  llvm::StringRef getSpaceBefore() const { return spaceBefore; }

  /// Text of the token last returned by gettok().
  std::string getTokText(int tok) const;

private:
  int peekChar() const;
  int nextChar();

  llvm::StringRef source;
  std::size_t pos = 0;
  std::size_t tokColumn = 0;
  llvm::StringRef spaceBefore;

  std::string identifierStr; // Filled in if tok_identifier or a keyword
  std::string numStr;        // Filled in if tok_number
};

/// Human readable name of a token code, for diagnostics and pattern dumps.
std::string tokenName(int tok);

} // end namespace minasm
#endif // MINASM_LEXER_H
