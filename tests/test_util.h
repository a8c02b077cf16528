#ifndef MINASM_TESTS_TEST_UTIL_H
#define MINASM_TESTS_TEST_UTIL_H

#include <cassert>
#include <optional>
#include <string>
#include <utility>

#include "llvm/Support/Error.h"
#include "llvm/Support/raw_ostream.h"

#include "minasm/log.h"
#include "minasm/program.h"

namespace minasm {
namespace test {

/// Unwrap an Expected that the test requires to hold a value.
template <typename T> T expectValue(llvm::Expected<T> valueOrErr) {
  if (!valueOrErr) {
    llvm::errs() << "unexpected error: " << llvm::toString(valueOrErr.takeError()) << "\n";
    assert(false && "unexpected error");
  }
  return std::move(*valueOrErr);
}

inline void expectSuccess(llvm::Error err) {
  if (err) {
    llvm::errs() << "unexpected error: " << llvm::toString(std::move(err)) << "\n";
    assert(false && "unexpected error");
  }
}

/// Code of a ParseError, empty for success or any other error.
inline std::optional<ParseErrorCode> parseErrorCode(llvm::Error err) {
  std::optional<ParseErrorCode> code;
  llvm::handleAllErrors(
      std::move(err), [&](const ParseError &PE) { code = PE.getCode(); },
      [](const llvm::ErrorInfoBase &) {});
  return code;
}

/// Code of a RuntimeError, empty for success or any other error.
inline std::optional<RuntimeErrorCode> runtimeErrorCode(llvm::Error err) {
  std::optional<RuntimeErrorCode> code;
  llvm::handleAllErrors(
      std::move(err), [&](const RuntimeError &RE) { code = RE.getCode(); },
      [](const llvm::ErrorInfoBase &) {});
  return code;
}

inline Program parseProgram(llvm::StringRef source, int extensionLevel = EXT_None,
                            InitialBindings initial = {}) {
  ParseOptions opts;
  opts.extensionLevel = extensionLevel;
  opts.initial = std::move(initial);
  return expectValue(Program::parse(source, opts));
}

inline Value valueOf(const Program &P, Identifier var) {
  auto it = P.getVariables().find(var);
  assert(it != P.getVariables().end() && "variable not in table");
  assert(it->second && "variable has no value");
  return *it->second;
}

} // end namespace test
} // end namespace minasm

#endif // MINASM_TESTS_TEST_UTIL_H
