#include "minasm/program.h"

#include <cctype>
#include <string>
#include <tuple>

#include "llvm/ADT/Twine.h"
#include "llvm/Support/Debug.h"
#include "llvm/Support/LineIterator.h"
#include "llvm/Support/MemoryBuffer.h"

#include "minasm/exec_ctx.h"
#include "minasm/log.h"

#define DEBUG_TYPE "minasm-interp"

using namespace minasm;

/// Split "(12) x = 0" into 12 and "x = 0". The marker must be followed by
/// exactly one space.
static bool splitLineMarker(llvm::StringRef line, LineNumber &number, llvm::StringRef &code) {
  if (!line.consume_front("("))
    return false;

  size_t digits = line.find_first_not_of("0123456789");
  if (digits == 0 || digits == llvm::StringRef::npos)
    return false;
  if (line.take_front(digits).getAsInteger(10, number))
    return false;

  line = line.drop_front(digits);
  if (!line.consume_front(") "))
    return false;
  code = line;
  return true;
}

llvm::Expected<Program> Program::parse(llvm::StringRef source, const ParseOptions &opts,
                                       llvm::StringRef bufferName) {
  // line_iterator wants a null terminated buffer.
  std::unique_ptr<llvm::MemoryBuffer> buffer =
      llvm::MemoryBuffer::getMemBufferCopy(source, bufferName);
  return parseBuffer(*buffer, opts);
}

llvm::Expected<Program> Program::loadFile(llvm::StringRef path, const ParseOptions &opts) {
  llvm::ErrorOr<std::unique_ptr<llvm::MemoryBuffer>> bufferOrErr =
      llvm::MemoryBuffer::getFile(path, /*IsText=*/true);
  if (std::error_code EC = bufferOrErr.getError())
    return llvm::createFileError(path, llvm::errorCodeToError(EC));

  return parseBuffer(**bufferOrErr, opts);
}

llvm::Expected<Program> Program::parseBuffer(const llvm::MemoryBuffer &buffer,
                                             const ParseOptions &opts) {
  Recognizer recognizer(opts.extensionLevel);
  std::string file = buffer.getBufferIdentifier().str();
  std::map<LineNumber, std::unique_ptr<Instruction>> byLine;

  // Blank lines are kept so that they fail as missing a line number.
  for (llvm::line_iterator it(buffer, /*SkipBlanks=*/false), end; it != end; ++it) {
    llvm::StringRef line = it->rtrim('\r');
    unsigned sourceLine = static_cast<unsigned>(it.line_number());

    if (line.take_front(2) == "//")
      continue;

    LineNumber number;
    llvm::StringRef code;
    if (!splitLineMarker(line, number, code))
      return llvm::make_error<ParseError>(ParseErrorCode::MissingLineNumber, line.str(),
                                          file, sourceLine);

    if (byLine.count(number))
      return llvm::make_error<ParseError>(ParseErrorCode::DuplicateLineNumber,
                                          std::to_string(number), file, sourceLine);

    auto instOrErr = recognizer.recognize(number, code);
    if (!instOrErr) {
      // Attach the location the recognizer does not know about.
      return llvm::handleErrors(instOrErr.takeError(), [&](const ParseError &PE) {
        return llvm::make_error<ParseError>(PE.getCode(), PE.getText(), file, sourceLine);
      });
    }
    byLine.emplace(number, std::move(*instOrErr));
  }

  // The numbers must run 1, 2, ..., N without gaps.
  std::vector<std::unique_ptr<Instruction>> instructions;
  LineNumber expected = 1;
  for (auto &entry : byLine) {
    if (entry.first != expected)
      return llvm::make_error<ParseError>(
          ParseErrorCode::NonContiguousNumbering,
          ("expected line " + llvm::Twine(expected) + ", found line " +
           llvm::Twine(entry.first))
              .str(),
          file);
    instructions.push_back(std::move(entry.second));
    ++expected;
  }

  VariableTable variables;
  for (const auto &I : instructions)
    for (Identifier id : I->getOperands())
      variables.emplace(id, std::nullopt);
  // Bindings for letters the program never mentions are kept as well.
  for (const auto &binding : opts.initial)
    variables[binding.first] = binding.second;

  LLVM_DEBUG({
    llvm::dbgs() << buffer.getBufferIdentifier() << ": " << instructions.size()
                 << " instructions, " << variables.size() << " variables\n";
    for (const auto &I : instructions)
      I->dump();
  });
  return Program(std::move(instructions), std::move(variables));
}

const Instruction *Program::getInstruction(LineNumber line) const {
  if (line == 0 || line > instructions.size())
    return nullptr;
  return instructions[line - 1].get();
}

llvm::Expected<RunStatus> Program::run(const RunOptions &opts) {
  ExecutionContext ctx(variables, opts.trace);
  RunStatus status;
  LineNumber pc = 1;

  while (status.steps < opts.stepLimit) {
    const Instruction *I = getInstruction(pc);
    if (!I)
      return llvm::make_error<RuntimeError>(RuntimeErrorCode::UnknownJumpTarget, pc);

    ctx.beginStep(pc);
    if (llvm::Error err = I->execute(ctx))
      return std::move(err);

    ++status.steps;
    status.lastLine = pc;
    if (ctx.isHalted()) {
      status.termination = RunStatus::Halted;
      LLVM_DEBUG(llvm::dbgs() << "halted on line " << pc << " after " << status.steps
                              << " steps\n");
      return status;
    }
    pc = ctx.getNextPC();
  }

  LLVM_DEBUG(llvm::dbgs() << "step limit of " << opts.stepLimit << " reached\n");
  return status;
}

llvm::Expected<RunStatus> Program::run(bool verbose) {
  RunOptions opts;
  if (verbose)
    opts.trace = &llvm::outs();
  return run(opts);
}

void Program::print(llvm::raw_ostream &OS) const {
  for (const auto &I : instructions) {
    I->print(OS);
    OS << "\n";
  }
  printVariables(variables, OS);
}

void Program::printVariables(const VariableTable &vars, llvm::raw_ostream &OS) {
  for (const auto &entry : vars) {
    OS << entry.first << " = ";
    if (entry.second)
      OS << *entry.second;
    else
      OS << "<none>";
    OS << "\n";
  }
}

llvm::Expected<std::pair<Identifier, Value>> minasm::parseBinding(llvm::StringRef text) {
  llvm::StringRef name, value;
  std::tie(name, value) = text.split('=');
  name = name.trim();
  value = value.trim();

  if (name.size() != 1 || !isalpha(static_cast<unsigned char>(name[0])))
    return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                   "invalid binding '" + text +
                                       "': variable names are single letters");

  Value v;
  if (value.empty() || value.getAsInteger(10, v))
    return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                   "invalid binding '" + text + "': expected an integer");

  return std::make_pair(name[0], v);
}
