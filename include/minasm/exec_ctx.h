#ifndef MINASM_EXEC_CTX_H
#define MINASM_EXEC_CTX_H

#include <optional>

#include "llvm/ADT/Twine.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/raw_ostream.h"

#include "minasm/ast.h"
#include "minasm/log.h"

namespace minasm {

/// State an Instruction sees while it executes: the variable table, the
/// program counter and where the trace goes.
class ExecutionContext {
public:
  ExecutionContext(VariableTable &variables, llvm::raw_ostream *trace)
      : variables(variables), trace(trace) {}

  /// Called by the run loop before each instruction.
  void beginStep(LineNumber line) {
    pc = line;
    nextPC = line + 1;
  }

  LineNumber getPC() const { return pc; }
  LineNumber getNextPC() const { return nextPC; }
  bool isHalted() const { return halted; }

  void jumpTo(LineNumber target) { nextPC = target; }
  void halt() { halted = true; }

  /// Current binding of var, empty if it has no value yet.
  std::optional<Value> lookup(Identifier var) const {
    auto it = variables.find(var);
    if (it == variables.end())
      return std::nullopt;
    return it->second;
  }

  /// Value of var, or an UninitializedVariable error.
  llvm::Expected<Value> read(Identifier var) const {
    if (auto v = lookup(var))
      return *v;
    return llvm::make_error<RuntimeError>(RuntimeErrorCode::UninitializedVariable, pc, var);
  }

  void write(Identifier var, std::optional<Value> value) { variables[var] = value; }

  llvm::Error overflow(Identifier var) const {
    return llvm::make_error<RuntimeError>(RuntimeErrorCode::ArithmeticOverflow, pc, var);
  }

  bool isTracing() const { return trace != nullptr; }

  /// One trace line per executed step: "<line>: <what happened>".
  void traceStep(const llvm::Twine &effect) {
    if (trace)
      *trace << pc << ": " << effect << "\n";
  }

private:
  VariableTable &variables;
  llvm::raw_ostream *trace;
  LineNumber pc = 1;
  LineNumber nextPC = 2;
  bool halted = false;
};

} // end namespace minasm

#endif // MINASM_EXEC_CTX_H
