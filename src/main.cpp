#include <string>

#include "llvm/Support/CommandLine.h"
#include "llvm/Support/InitLLVM.h"
#include "llvm/Support/raw_ostream.h"

#include "minasm/log.h"
#include "minasm/parser.h"
#include "minasm/program.h"

using namespace llvm;

static cl::OptionCategory MinasmCategory("minasm options");

static cl::opt<std::string> InputFilename(cl::Positional, cl::Required,
                                          cl::desc("<input file>"), cl::cat(MinasmCategory));

static cl::opt<int> ExtensionLevel(
    "ext", cl::init(minasm::EXT_None), cl::value_desc("level"),
    cl::desc("Enable extension instructions up to this level "
             "(-1 none, 0 transfer, 1 add, 2 abs diff)"),
    cl::cat(MinasmCategory));

static cl::list<std::string> Bindings("set", cl::ZeroOrMore, cl::value_desc("var=value"),
                                      cl::desc("Initial value of a variable"),
                                      cl::cat(MinasmCategory));
static cl::alias BindingsShort("D", cl::desc("Alias for --set"), cl::aliasopt(Bindings));

static cl::opt<unsigned> StepLimit("step-limit",
                                   cl::init(minasm::RunOptions::DefaultStepLimit),
                                   cl::desc("Maximum number of instructions to execute"),
                                   cl::cat(MinasmCategory));

static cl::opt<bool> Verbose("verbose", cl::desc("Trace every executed instruction"),
                             cl::cat(MinasmCategory));
static cl::alias VerboseShort("v", cl::desc("Alias for --verbose"), cl::aliasopt(Verbose));

static cl::opt<bool> Dump("dump", cl::desc("Print the parsed program before running it"),
                          cl::cat(MinasmCategory));

static cl::opt<bool> NoRun("no-run", cl::desc("Parse and validate only"),
                           cl::cat(MinasmCategory));

//===----------------------------------------------------------------------===//
// Main driver code.
//===----------------------------------------------------------------------===//
int main(int argc, char **argv) {
  InitLLVM X(argc, argv);
  cl::HideUnrelatedOptions(MinasmCategory);
  cl::ParseCommandLineOptions(argc, argv, "minasm - line numbered mini assembler\n");

  minasm::ParseOptions parseOpts;
  parseOpts.extensionLevel = ExtensionLevel;
  if (ExtensionLevel > minasm::EXT_AbsDiff)
    minasm::logWarning("extension level " + Twine(ExtensionLevel.getValue()) +
                       " enables every extension");
  else if (ExtensionLevel < minasm::EXT_None)
    minasm::logWarning("extension level " + Twine(ExtensionLevel.getValue()) +
                       " enables no extension");

  for (const std::string &text : Bindings) {
    auto bindingOrErr = minasm::parseBinding(text);
    if (!bindingOrErr) {
      minasm::logError(bindingOrErr.takeError());
      return 1;
    }
    parseOpts.initial[bindingOrErr->first] = bindingOrErr->second;
  }

  auto programOrErr = minasm::Program::loadFile(InputFilename, parseOpts);
  if (!programOrErr) {
    minasm::logError(programOrErr.takeError());
    return 1;
  }
  minasm::Program &program = *programOrErr;

  if (Dump) {
    program.print(outs());
    outs() << "\n";
  }
  if (NoRun)
    return 0;

  minasm::RunOptions runOpts;
  runOpts.stepLimit = StepLimit;
  if (Verbose)
    runOpts.trace = &outs();

  auto statusOrErr = program.run(runOpts);
  if (!statusOrErr) {
    outs().flush();
    minasm::logError(statusOrErr.takeError());
    return 1;
  }

  if (statusOrErr->termination == minasm::RunStatus::StepLimitReached)
    minasm::logWarning("stopped after " + Twine(statusOrErr->steps) +
                       " steps without reaching stop");

  minasm::Program::printVariables(program.getVariables(), outs());
  return 0;
}
