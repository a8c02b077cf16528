#ifndef MINASM_PARSER_H
#define MINASM_PARSER_H

#include <memory>
#include <string>
#include <vector>

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include "minasm/ast.h"

namespace minasm {

/// Extension levels: each level enables one more optional instruction form.
enum ExtensionLevel : int {
  EXT_None = -1,
  EXT_Transfer = 0, // x = y
  EXT_Add = 1,      // x = x + y
  EXT_AbsDiff = 2   // z = abs(x - y)
};

/// A token of a statement together with its spelling.
struct LexedToken {
  int tok;
  std::string text;
  std::string spaceBefore;
};

/// Split a statement into tokens, without the trailing tok_eof.
std::vector<LexedToken> tokenize(llvm::StringRef code);

/// Classifies one statement body into an Instruction.
///
/// Patterns are written in statement syntax with two kinds of holes: `$N`
/// binds a single-letter identifier to slot N (a slot used twice must bind
/// the same letter) and `#` binds a line number. Spacing between tokens
/// must be exactly what the pattern text has. Patterns are tried in table
/// order and the first full match wins.
class Recognizer {
public:
  explicit Recognizer(int extensionLevel = EXT_None);

  int getExtensionLevel() const { return extensionLevel; }

  /// Returns the instruction for `code` at program line `line`, or an
  /// UnrecognizedStatement ParseError. Only surrounding whitespace is
  /// ignored.
  llvm::Expected<std::unique_ptr<Instruction>> recognize(LineNumber line,
                                                         llvm::StringRef code) const;

  /// Pattern texts currently enabled, in priority order.
  std::vector<std::string> getPatterns() const;

  struct Captures {
    Identifier vars[3] = {0, 0, 0};
    LineNumber target = 0;
  };
  using BuildFn = std::unique_ptr<Instruction> (*)(LineNumber, const Captures &);

private:
  struct Element {
    enum ElemKind { Token, Var, Target } kind;
    int tok;                 // for Token
    std::string text;        // for Token identifiers and numbers
    unsigned slot;           // for Var
    std::string spaceBefore; // required whitespace before the element
  };

  struct Pattern {
    std::string source;
    std::vector<Element> elements;
    bool distinctOperands;
    BuildFn build;
  };

  static Pattern compile(const char *source, bool distinctOperands, BuildFn build);
  static bool match(const Pattern &P, const std::vector<LexedToken> &toks, Captures &C);

  int extensionLevel;
  std::vector<Pattern> patterns;
};

} // end namespace minasm

#endif // MINASM_PARSER_H
