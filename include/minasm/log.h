#ifndef MINASM_LOG_H
#define MINASM_LOG_H

#include <cstdint>
#include <string>

#include "llvm/Support/Error.h"
#include "llvm/Support/raw_ostream.h"

// Error kinds raised by the loader and the interpreter, plus little helper
// functions for reporting them.
namespace minasm {

enum class ParseErrorCode {
  MissingLineNumber,
  DuplicateLineNumber,
  UnrecognizedStatement,
  NonContiguousNumbering
};

enum class RuntimeErrorCode {
  UnknownJumpTarget,
  UninitializedVariable,
  ArithmeticOverflow
};

/// A problem found while turning source text into a Program. Always reported
/// before execution starts.
class ParseError : public llvm::ErrorInfo<ParseError> {
public:
  static char ID;

  ParseError(ParseErrorCode code, std::string text, std::string file = "",
             unsigned sourceLine = 0)
      : code(code), text(std::move(text)), file(std::move(file)),
        sourceLine(sourceLine) {}

  ParseErrorCode getCode() const { return code; }
  /// Buffer the error was found in, empty when not known yet.
  const std::string &getFile() const { return file; }
  /// Physical line in the source (1-based), 0 if the error concerns the whole
  /// program.
  unsigned getSourceLine() const { return sourceLine; }
  /// The offending text or a detail message.
  const std::string &getText() const { return text; }

  void log(llvm::raw_ostream &OS) const override;
  std::error_code convertToErrorCode() const override;

private:
  ParseErrorCode code;
  std::string text;
  std::string file;
  unsigned sourceLine;
};

/// A fatal condition hit while running a Program.
class RuntimeError : public llvm::ErrorInfo<RuntimeError> {
public:
  static char ID;

  RuntimeError(RuntimeErrorCode code, uint64_t line, char var = '\0')
      : code(code), line(line), var(var) {}

  RuntimeErrorCode getCode() const { return code; }
  /// Program counter at the time of the error.
  uint64_t getLine() const { return line; }
  /// Variable involved, '\0' for jump errors.
  char getVariable() const { return var; }

  void log(llvm::raw_ostream &OS) const override;
  std::error_code convertToErrorCode() const override;

private:
  RuntimeErrorCode code;
  uint64_t line;
  char var;
};

const char *toString(ParseErrorCode code);
const char *toString(RuntimeErrorCode code);

/// logError, logWarning - report on stderr with the tool name as prefix.
void logError(llvm::Error err);
void logWarning(const llvm::Twine &msg);

} // end namespace minasm
#endif // MINASM_LOG_H
