#ifndef MINASM_AST_H
#define MINASM_AST_H

#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include "llvm/ADT/SmallVector.h"
#include "llvm/Support/Casting.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/raw_ostream.h"

namespace minasm {

/// Single ASCII letter naming a variable. Case matters.
using Identifier = char;
using LineNumber = uint64_t;
using Value = int64_t;

/// Variables of a program. An empty optional means "no value", which is not
/// the same thing as zero.
using VariableTable = std::map<Identifier, std::optional<Value>>;

class ExecutionContext;

//===----------------------------------------------------------------------===//
// Instruction tree
//===----------------------------------------------------------------------===//

/// Instruction - Base class for one parsed source line. The set of subclasses
/// is closed; use isa<>/cast<>/dyn_cast<> on getKind() to look at the payload.
class Instruction {
public:
  enum InstrKind {
    IK_JumpIfZero,
    IK_Increment,
    IK_Decrement,
    IK_Jump,
    IK_Halt,
    IK_SetZero,
    IK_Transfer,
    IK_Add,
    IK_AbsDiff
  };

  Instruction(InstrKind kind, LineNumber line) : kind(kind), line(line) {}
  virtual ~Instruction() = default;

  InstrKind getKind() const { return kind; }
  LineNumber getLine() const { return line; }

  /// Identifiers named in the payload, in field order.
  virtual llvm::SmallVector<Identifier, 3> getOperands() const = 0;

  /// Apply the instruction to ctx. The context advances to line + 1 unless
  /// the instruction jumps or halts.
  virtual llvm::Error execute(ExecutionContext &ctx) const = 0;

  /// Canonical statement text, e.g. "x = x + 1".
  virtual void printSource(llvm::raw_ostream &OS) const = 0;
  std::string getSource() const;

  /// <Instruction line=2 kind=inc var=x>
  void print(llvm::raw_ostream &OS) const;
  void dump() const;

protected:
  virtual void printFields(llvm::raw_ostream &OS) const = 0;

private:
  const InstrKind kind;
  const LineNumber line;
};

const char *kindName(Instruction::InstrKind kind);

/// if (var == 0) goto target
class JumpIfZeroInst : public Instruction {
  Identifier var;
  LineNumber target;

public:
  JumpIfZeroInst(LineNumber line, Identifier var, LineNumber target)
      : Instruction(IK_JumpIfZero, line), var(var), target(target) {}

  Identifier getVar() const { return var; }
  LineNumber getTarget() const { return target; }

  llvm::SmallVector<Identifier, 3> getOperands() const override { return {var}; }
  llvm::Error execute(ExecutionContext &ctx) const override;
  void printSource(llvm::raw_ostream &OS) const override;

  static bool classof(const Instruction *I) { return I->getKind() == IK_JumpIfZero; }

protected:
  void printFields(llvm::raw_ostream &OS) const override;
};

/// var = var + 1
class IncrementInst : public Instruction {
  Identifier var;

public:
  IncrementInst(LineNumber line, Identifier var)
      : Instruction(IK_Increment, line), var(var) {}

  Identifier getVar() const { return var; }

  llvm::SmallVector<Identifier, 3> getOperands() const override { return {var}; }
  llvm::Error execute(ExecutionContext &ctx) const override;
  void printSource(llvm::raw_ostream &OS) const override;

  static bool classof(const Instruction *I) { return I->getKind() == IK_Increment; }

protected:
  void printFields(llvm::raw_ostream &OS) const override;
};

/// var = var - 1
class DecrementInst : public Instruction {
  Identifier var;

public:
  DecrementInst(LineNumber line, Identifier var)
      : Instruction(IK_Decrement, line), var(var) {}

  Identifier getVar() const { return var; }

  llvm::SmallVector<Identifier, 3> getOperands() const override { return {var}; }
  llvm::Error execute(ExecutionContext &ctx) const override;
  void printSource(llvm::raw_ostream &OS) const override;

  static bool classof(const Instruction *I) { return I->getKind() == IK_Decrement; }

protected:
  void printFields(llvm::raw_ostream &OS) const override;
};

/// goto target
class JumpInst : public Instruction {
  LineNumber target;

public:
  JumpInst(LineNumber line, LineNumber target)
      : Instruction(IK_Jump, line), target(target) {}

  LineNumber getTarget() const { return target; }

  llvm::SmallVector<Identifier, 3> getOperands() const override { return {}; }
  llvm::Error execute(ExecutionContext &ctx) const override;
  void printSource(llvm::raw_ostream &OS) const override;

  static bool classof(const Instruction *I) { return I->getKind() == IK_Jump; }

protected:
  void printFields(llvm::raw_ostream &OS) const override;
};

/// stop
class HaltInst : public Instruction {
public:
  explicit HaltInst(LineNumber line) : Instruction(IK_Halt, line) {}

  llvm::SmallVector<Identifier, 3> getOperands() const override { return {}; }
  llvm::Error execute(ExecutionContext &ctx) const override;
  void printSource(llvm::raw_ostream &OS) const override;

  static bool classof(const Instruction *I) { return I->getKind() == IK_Halt; }

protected:
  void printFields(llvm::raw_ostream &OS) const override {}
};

/// var = 0
class SetZeroInst : public Instruction {
  Identifier var;

public:
  SetZeroInst(LineNumber line, Identifier var)
      : Instruction(IK_SetZero, line), var(var) {}

  Identifier getVar() const { return var; }

  llvm::SmallVector<Identifier, 3> getOperands() const override { return {var}; }
  llvm::Error execute(ExecutionContext &ctx) const override;
  void printSource(llvm::raw_ostream &OS) const override;

  static bool classof(const Instruction *I) { return I->getKind() == IK_SetZero; }

protected:
  void printFields(llvm::raw_ostream &OS) const override;
};

/// dest = src
class TransferInst : public Instruction {
  Identifier dest, src;

public:
  TransferInst(LineNumber line, Identifier dest, Identifier src)
      : Instruction(IK_Transfer, line), dest(dest), src(src) {}

  Identifier getDest() const { return dest; }
  Identifier getSrc() const { return src; }

  llvm::SmallVector<Identifier, 3> getOperands() const override { return {dest, src}; }
  llvm::Error execute(ExecutionContext &ctx) const override;
  void printSource(llvm::raw_ostream &OS) const override;

  static bool classof(const Instruction *I) { return I->getKind() == IK_Transfer; }

protected:
  void printFields(llvm::raw_ostream &OS) const override;
};

/// dest = dest + src
class AddInst : public Instruction {
  Identifier dest, src;

public:
  AddInst(LineNumber line, Identifier dest, Identifier src)
      : Instruction(IK_Add, line), dest(dest), src(src) {}

  Identifier getDest() const { return dest; }
  Identifier getSrc() const { return src; }

  llvm::SmallVector<Identifier, 3> getOperands() const override { return {dest, src}; }
  llvm::Error execute(ExecutionContext &ctx) const override;
  void printSource(llvm::raw_ostream &OS) const override;

  static bool classof(const Instruction *I) { return I->getKind() == IK_Add; }

protected:
  void printFields(llvm::raw_ostream &OS) const override;
};

/// dest = abs(lhs - rhs)
class AbsDiffInst : public Instruction {
  Identifier dest, lhs, rhs;

public:
  AbsDiffInst(LineNumber line, Identifier dest, Identifier lhs, Identifier rhs)
      : Instruction(IK_AbsDiff, line), dest(dest), lhs(lhs), rhs(rhs) {}

  Identifier getDest() const { return dest; }
  Identifier getLHS() const { return lhs; }
  Identifier getRHS() const { return rhs; }

  llvm::SmallVector<Identifier, 3> getOperands() const override { return {dest, lhs, rhs}; }
  llvm::Error execute(ExecutionContext &ctx) const override;
  void printSource(llvm::raw_ostream &OS) const override;

  static bool classof(const Instruction *I) { return I->getKind() == IK_AbsDiff; }

protected:
  void printFields(llvm::raw_ostream &OS) const override;
};

} // end namespace minasm
#endif // MINASM_AST_H
