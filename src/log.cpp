#include "minasm/log.h"

#include "llvm/Support/ErrorHandling.h"
#include "llvm/Support/WithColor.h"

namespace minasm {

char ParseError::ID = 0;
char RuntimeError::ID = 0;

const char *toString(ParseErrorCode code) {
  switch (code) {
  case ParseErrorCode::MissingLineNumber:      return "missing line number";
  case ParseErrorCode::DuplicateLineNumber:    return "duplicate line number";
  case ParseErrorCode::UnrecognizedStatement:  return "unrecognized statement";
  case ParseErrorCode::NonContiguousNumbering: return "non-contiguous numbering";
  }
  llvm_unreachable("unknown ParseErrorCode");
}

const char *toString(RuntimeErrorCode code) {
  switch (code) {
  case RuntimeErrorCode::UnknownJumpTarget:     return "jump target does not exist";
  case RuntimeErrorCode::UninitializedVariable: return "use of uninitialized variable";
  case RuntimeErrorCode::ArithmeticOverflow:    return "arithmetic overflow";
  }
  llvm_unreachable("unknown RuntimeErrorCode");
}

void ParseError::log(llvm::raw_ostream &OS) const {
  if (!file.empty()) {
    OS << file;
    if (sourceLine)
      OS << ":" << sourceLine;
    OS << ": ";
  } else if (sourceLine) {
    OS << "line " << sourceLine << ": ";
  }
  OS << toString(code);
  if (!text.empty())
    OS << ": " << text;
}

std::error_code ParseError::convertToErrorCode() const {
  return llvm::inconvertibleErrorCode();
}

void RuntimeError::log(llvm::raw_ostream &OS) const {
  OS << toString(code);
  switch (code) {
  case RuntimeErrorCode::UnknownJumpTarget:
    OS << ": jumped to line " << line;
    break;
  case RuntimeErrorCode::UninitializedVariable:
  case RuntimeErrorCode::ArithmeticOverflow:
    OS << " '" << var << "' on line " << line;
    break;
  }
}

std::error_code RuntimeError::convertToErrorCode() const {
  return llvm::inconvertibleErrorCode();
}

void logError(llvm::Error err) {
  llvm::handleAllErrors(std::move(err), [](const llvm::ErrorInfoBase &EI) {
    llvm::WithColor::error(llvm::errs(), "minasm") << EI.message() << "\n";
  });
}

void logWarning(const llvm::Twine &msg) {
  llvm::WithColor::warning(llvm::errs(), "minasm") << msg << "\n";
}

} // end namespace minasm
