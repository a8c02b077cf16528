#ifndef MINASM_PROGRAM_H
#define MINASM_PROGRAM_H

#include <map>
#include <memory>
#include <utility>
#include <vector>

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/raw_ostream.h"

#include "minasm/ast.h"
#include "minasm/parser.h"

namespace llvm {
class MemoryBuffer;
} // end namespace llvm

namespace minasm {

/// Values supplied by the caller before the program starts.
using InitialBindings = std::map<Identifier, Value>;

struct ParseOptions {
  int extensionLevel = EXT_None;
  InitialBindings initial;
};

struct RunOptions {
  static constexpr unsigned DefaultStepLimit = 300;

  /// Steps executed before the run is cut off. Reaching it is not an error.
  unsigned stepLimit = DefaultStepLimit;
  /// Where the per-step trace goes; no trace when null.
  llvm::raw_ostream *trace = nullptr;
};

struct RunStatus {
  enum Termination { Halted, StepLimitReached };

  Termination termination = StepLimitReached;
  unsigned steps = 0;
  /// Line of the last executed instruction, 0 if nothing ran.
  LineNumber lastLine = 0;
};

/// A validated program: instructions numbered 1..N and the variable table.
class Program {
public:
  /// Parse program text. `bufferName` only shows up in diagnostics.
  static llvm::Expected<Program> parse(llvm::StringRef source, const ParseOptions &opts = {},
                                       llvm::StringRef bufferName = "<source>");
  static llvm::Expected<Program> loadFile(llvm::StringRef path, const ParseOptions &opts = {});

  Program(Program &&) = default;
  Program &operator=(Program &&) = default;

  size_t size() const { return instructions.size(); }
  bool empty() const { return instructions.empty(); }

  /// Instruction at `line`, null if the program has no such line.
  const Instruction *getInstruction(LineNumber line) const;

  const VariableTable &getVariables() const { return variables; }

  /// Restore the variables to their state right after parsing.
  void reset() { variables = initialVariables; }

  /// Execute from line 1 until a stop, an error or the step limit.
  llvm::Expected<RunStatus> run(const RunOptions &opts = {});
  /// Same with the default step limit, tracing to stdout when verbose.
  llvm::Expected<RunStatus> run(bool verbose);

  void print(llvm::raw_ostream &OS) const;
  static void printVariables(const VariableTable &vars, llvm::raw_ostream &OS);

private:
  static llvm::Expected<Program> parseBuffer(const llvm::MemoryBuffer &buffer,
                                             const ParseOptions &opts);

  Program(std::vector<std::unique_ptr<Instruction>> instructions, VariableTable variables)
      : instructions(std::move(instructions)), initialVariables(variables),
        variables(std::move(variables)) {}

  // instructions[i] holds line i + 1.
  std::vector<std::unique_ptr<Instruction>> instructions;
  VariableTable initialVariables;
  VariableTable variables;
};

/// Parse "x=5" into a binding. Used for initial values given on the command
/// line.
llvm::Expected<std::pair<Identifier, Value>> parseBinding(llvm::StringRef text);

} // end namespace minasm

#endif // MINASM_PROGRAM_H
