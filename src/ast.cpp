#include "minasm/ast.h"

#include <limits>

#include "llvm/ADT/Twine.h"
#include "llvm/Support/Debug.h"
#include "llvm/Support/ErrorHandling.h"
#include "llvm/Support/MathExtras.h"

#include "minasm/exec_ctx.h"

using namespace minasm;

const char *minasm::kindName(Instruction::InstrKind kind) {
  switch (kind) {
  case Instruction::IK_JumpIfZero: return "jump_zero";
  case Instruction::IK_Increment:  return "inc";
  case Instruction::IK_Decrement:  return "dec";
  case Instruction::IK_Jump:       return "jump";
  case Instruction::IK_Halt:       return "halt";
  case Instruction::IK_SetZero:    return "set_zero";
  case Instruction::IK_Transfer:   return "transfer";
  case Instruction::IK_Add:        return "add";
  case Instruction::IK_AbsDiff:    return "abs_diff";
  }
  llvm_unreachable("unknown instruction kind");
}

std::string Instruction::getSource() const {
  std::string S;
  llvm::raw_string_ostream OS(S);
  printSource(OS);
  return OS.str();
}

void Instruction::print(llvm::raw_ostream &OS) const {
  OS << "<Instruction line=" << line << " kind=" << kindName(kind);
  printFields(OS);
  OS << ">";
}

void Instruction::dump() const {
  print(llvm::dbgs());
  llvm::dbgs() << "\n";
}

//===----------------------------------------------------------------------===//
// Execution
//===----------------------------------------------------------------------===//

llvm::Error JumpIfZeroInst::execute(ExecutionContext &ctx) const {
  // "No value" is not zero, so an unset variable falls through.
  std::optional<Value> v = ctx.lookup(var);
  bool taken = v && *v == 0;
  if (taken)
    ctx.jumpTo(target);
  ctx.traceStep("Jump to " + llvm::Twine(target) + " if " + llvm::Twine(var) +
                " is 0" + (taken ? " (taken)" : " (not taken)"));
  return llvm::Error::success();
}

static llvm::Error addToVariable(ExecutionContext &ctx, Identifier var, Value delta,
                                 const char *verb) {
  auto v = ctx.read(var);
  if (!v)
    return v.takeError();

  Value result;
  if (llvm::AddOverflow(*v, delta, result))
    return ctx.overflow(var);

  ctx.write(var, result);
  ctx.traceStep(llvm::Twine(verb) + " " + llvm::Twine(var) + " (" + llvm::Twine(var) +
                " = " + llvm::Twine(result) + ")");
  return llvm::Error::success();
}

llvm::Error IncrementInst::execute(ExecutionContext &ctx) const {
  return addToVariable(ctx, var, 1, "Increment");
}

llvm::Error DecrementInst::execute(ExecutionContext &ctx) const {
  return addToVariable(ctx, var, -1, "Decrement");
}

llvm::Error JumpInst::execute(ExecutionContext &ctx) const {
  ctx.jumpTo(target);
  ctx.traceStep("Jump to " + llvm::Twine(target));
  return llvm::Error::success();
}

llvm::Error HaltInst::execute(ExecutionContext &ctx) const {
  ctx.halt();
  ctx.traceStep("Halting");
  return llvm::Error::success();
}

llvm::Error SetZeroInst::execute(ExecutionContext &ctx) const {
  ctx.write(var, 0);
  ctx.traceStep("Setting " + llvm::Twine(var) + " to zero");
  return llvm::Error::success();
}

llvm::Error TransferInst::execute(ExecutionContext &ctx) const {
  // A source without a value makes the destination lose its value too.
  std::optional<Value> v = ctx.lookup(src);
  ctx.write(dest, v);
  if (ctx.isTracing()) {
    std::string shown = v ? std::to_string(*v) : "<none>";
    ctx.traceStep("Setting " + llvm::Twine(dest) + " to the value in " + llvm::Twine(src) +
                  " (" + llvm::Twine(dest) + " = " + shown + ")");
  }
  return llvm::Error::success();
}

llvm::Error AddInst::execute(ExecutionContext &ctx) const {
  auto x = ctx.read(dest);
  if (!x)
    return x.takeError();
  auto y = ctx.read(src);
  if (!y)
    return y.takeError();

  Value result;
  if (llvm::AddOverflow(*x, *y, result))
    return ctx.overflow(dest);

  ctx.write(dest, result);
  ctx.traceStep("Setting " + llvm::Twine(dest) + " to " + llvm::Twine(dest) + " + " +
                llvm::Twine(src) + " (" + llvm::Twine(dest) + " = " + llvm::Twine(result) +
                ")");
  return llvm::Error::success();
}

llvm::Error AbsDiffInst::execute(ExecutionContext &ctx) const {
  auto x = ctx.read(lhs);
  if (!x)
    return x.takeError();
  auto y = ctx.read(rhs);
  if (!y)
    return y.takeError();

  Value diff;
  if (llvm::SubOverflow(*x, *y, diff) || diff == std::numeric_limits<Value>::min())
    return ctx.overflow(dest);

  Value result = diff < 0 ? -diff : diff;
  ctx.write(dest, result);
  ctx.traceStep("Setting " + llvm::Twine(dest) + " to abs(" + llvm::Twine(lhs) + " - " +
                llvm::Twine(rhs) + ") (" + llvm::Twine(dest) + " = " + llvm::Twine(result) +
                ")");
  return llvm::Error::success();
}

//===----------------------------------------------------------------------===//
// Printing
//===----------------------------------------------------------------------===//

void JumpIfZeroInst::printSource(llvm::raw_ostream &OS) const {
  OS << "if (" << var << " == 0) goto " << target;
}
void JumpIfZeroInst::printFields(llvm::raw_ostream &OS) const {
  OS << " var=" << var << " target=" << target;
}

void IncrementInst::printSource(llvm::raw_ostream &OS) const {
  OS << var << " = " << var << " + 1";
}
void IncrementInst::printFields(llvm::raw_ostream &OS) const { OS << " var=" << var; }

void DecrementInst::printSource(llvm::raw_ostream &OS) const {
  OS << var << " = " << var << " - 1";
}
void DecrementInst::printFields(llvm::raw_ostream &OS) const { OS << " var=" << var; }

void JumpInst::printSource(llvm::raw_ostream &OS) const { OS << "goto " << target; }
void JumpInst::printFields(llvm::raw_ostream &OS) const { OS << " target=" << target; }

void HaltInst::printSource(llvm::raw_ostream &OS) const { OS << "stop"; }

void SetZeroInst::printSource(llvm::raw_ostream &OS) const { OS << var << " = 0"; }
void SetZeroInst::printFields(llvm::raw_ostream &OS) const { OS << " var=" << var; }

void TransferInst::printSource(llvm::raw_ostream &OS) const { OS << dest << " = " << src; }
void TransferInst::printFields(llvm::raw_ostream &OS) const {
  OS << " dest=" << dest << " src=" << src;
}

void AddInst::printSource(llvm::raw_ostream &OS) const {
  OS << dest << " = " << dest << " + " << src;
}
void AddInst::printFields(llvm::raw_ostream &OS) const {
  OS << " dest=" << dest << " src=" << src;
}

void AbsDiffInst::printSource(llvm::raw_ostream &OS) const {
  OS << dest << " = abs(" << lhs << " - " << rhs << ")";
}
void AbsDiffInst::printFields(llvm::raw_ostream &OS) const {
  OS << " dest=" << dest << " lhs=" << lhs << " rhs=" << rhs;
}
