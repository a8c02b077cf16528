#include <cctype>
#include <cstdio>

#include "minasm/lexer.h"

using namespace minasm;

int Lexer::peekChar() const {
  if (pos >= source.size())
    return EOF;
  return static_cast<unsigned char>(source[pos]);
}

int Lexer::nextChar() {
  int c = peekChar();
  if (c != EOF)
    ++pos;
  return c;
}

/// gettok - Return the next token from the statement text.
int Lexer::gettok() {
  std::size_t spaceStart = pos;
  while (isspace(peekChar())) // Skip any whitespace
    nextChar();

  spaceBefore = source.slice(spaceStart, pos);
  tokColumn = pos + 1;
  int lastChar = nextChar();

  if (isalpha(lastChar)) { // identifier: [a-zA-Z][a-zA-Z0-9]*
    identifierStr = static_cast<char>(lastChar);
    while (isalnum(peekChar()))
      identifierStr += static_cast<char>(nextChar());

    if (identifierStr == "if") return tok_if;
    if (identifierStr == "goto") return tok_goto;
    if (identifierStr == "stop") return tok_stop;
    if (identifierStr == "abs") return tok_abs;
    return tok_identifier;
  }

  if (isdigit(lastChar)) { // Number: [0-9]+
    numStr = static_cast<char>(lastChar);
    while (isdigit(peekChar()))
      numStr += static_cast<char>(nextChar());
    return tok_number;
  }

  if (lastChar == '=' && peekChar() == '=') {
    nextChar();
    return tok_eqeq;
  }

  // Check for end of input.
  if (lastChar == EOF)
    return tok_eof;

  // Otherwise, just return the character as its ascii value.
  return lastChar;
}

std::string Lexer::getTokText(int tok) const {
  switch (tok) {
  case tok_identifier:
  case tok_if:
  case tok_goto:
  case tok_stop:
  case tok_abs:
    return identifierStr;
  case tok_number:
    return numStr;
  default:
    return tokenName(tok);
  }
}

std::string minasm::tokenName(int tok) {
  switch (tok) {
  case tok_eof:        return "<eof>";
  case tok_identifier: return "<identifier>";
  case tok_number:     return "<number>";
  case tok_if:         return "if";
  case tok_goto:       return "goto";
  case tok_stop:       return "stop";
  case tok_abs:        return "abs";
  case tok_eqeq:       return "==";
  default:
    return std::string(1, static_cast<char>(tok));
  }
}
