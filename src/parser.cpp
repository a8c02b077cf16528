#include <cassert>
#include <iterator>

#include "minasm/parser.h"

#include "llvm/ADT/Twine.h"
#include "llvm/Support/Debug.h"

#include "minasm/lexer.h"
#include "minasm/log.h"

#define DEBUG_TYPE "minasm-parser"

using namespace minasm;

namespace {

using Captures = Recognizer::Captures;
using BuildFn = Recognizer::BuildFn;

struct PatternEntry {
  const char *source;
  bool distinctOperands;
  BuildFn build;
};

// Base grammar. Order matters: a statement is claimed by the first pattern
// that matches all of it.
const PatternEntry BasePatterns[] = {
    {"if ($1 == 0) goto #", false,
     [](LineNumber L, const Captures &C) -> std::unique_ptr<Instruction> {
       return std::make_unique<JumpIfZeroInst>(L, C.vars[0], C.target);
     }},
    {"$1 = $1 + 1", false,
     [](LineNumber L, const Captures &C) -> std::unique_ptr<Instruction> {
       return std::make_unique<IncrementInst>(L, C.vars[0]);
     }},
    {"$1 = $1 - 1", false,
     [](LineNumber L, const Captures &C) -> std::unique_ptr<Instruction> {
       return std::make_unique<DecrementInst>(L, C.vars[0]);
     }},
    {"goto #", false,
     [](LineNumber L, const Captures &C) -> std::unique_ptr<Instruction> {
       return std::make_unique<JumpInst>(L, C.target);
     }},
    {"stop", false,
     [](LineNumber L, const Captures &) -> std::unique_ptr<Instruction> {
       return std::make_unique<HaltInst>(L);
     }},
    {"$1 = 0", false,
     [](LineNumber L, const Captures &C) -> std::unique_ptr<Instruction> {
       return std::make_unique<SetZeroInst>(L, C.vars[0]);
     }},
};

// Extension grammar, indexed by ExtensionLevel.
const PatternEntry ExtPatterns[] = {
    {"$1 = $2", true,
     [](LineNumber L, const Captures &C) -> std::unique_ptr<Instruction> {
       return std::make_unique<TransferInst>(L, C.vars[0], C.vars[1]);
     }},
    {"$1 = $1 + $2", false,
     [](LineNumber L, const Captures &C) -> std::unique_ptr<Instruction> {
       return std::make_unique<AddInst>(L, C.vars[0], C.vars[1]);
     }},
    {"$3 = abs($1 - $2)", false,
     [](LineNumber L, const Captures &C) -> std::unique_ptr<Instruction> {
       return std::make_unique<AbsDiffInst>(L, C.vars[2], C.vars[0], C.vars[1]);
     }},
};

} // end anonymous namespace

std::vector<LexedToken> minasm::tokenize(llvm::StringRef code) {
  std::vector<LexedToken> toks;
  Lexer lexer(code);
  for (int tok = lexer.gettok(); tok != tok_eof; tok = lexer.gettok())
    toks.push_back({tok, lexer.getTokText(tok), lexer.getSpaceBefore().str()});
  return toks;
}

Recognizer::Recognizer(int extensionLevel) : extensionLevel(extensionLevel) {
  for (const PatternEntry &E : BasePatterns)
    patterns.push_back(compile(E.source, E.distinctOperands, E.build));

  // Level k enables extensions 0..k.
  for (int i = 0, e = static_cast<int>(std::size(ExtPatterns)); i < e; ++i) {
    if (i > extensionLevel)
      break;
    const PatternEntry &E = ExtPatterns[i];
    patterns.push_back(compile(E.source, E.distinctOperands, E.build));
  }

  LLVM_DEBUG(llvm::dbgs() << "recognizer: extension level " << extensionLevel << ", "
                          << patterns.size() << " patterns\n");
}

Recognizer::Pattern Recognizer::compile(const char *source, bool distinctOperands,
                                        BuildFn build) {
  Pattern P{source, {}, distinctOperands, build};
  std::vector<LexedToken> toks = tokenize(source);

  for (size_t i = 0, e = toks.size(); i != e; ++i) {
    const LexedToken &T = toks[i];
    if (T.tok == '$') {
      assert(i + 1 != e && toks[i + 1].tok == tok_number && "'$' needs a slot number");
      unsigned slot = std::stoul(toks[++i].text);
      assert(slot >= 1 && slot <= 3 && "identifier slot out of range");
      // The slot takes the spacing written before its '$'.
      P.elements.push_back({Element::Var, 0, "", slot - 1, T.spaceBefore});
    } else if (T.tok == '#') {
      P.elements.push_back({Element::Target, 0, "", 0, T.spaceBefore});
    } else {
      P.elements.push_back({Element::Token, T.tok, T.text, 0, T.spaceBefore});
    }
  }
  return P;
}

bool Recognizer::match(const Pattern &P, const std::vector<LexedToken> &toks, Captures &C) {
  if (toks.size() != P.elements.size())
    return false;

  bool bound[3] = {false, false, false};
  C = Captures();

  for (size_t i = 0, e = toks.size(); i != e; ++i) {
    const Element &El = P.elements[i];
    const LexedToken &T = toks[i];

    if (T.spaceBefore != El.spaceBefore)
      return false;

    switch (El.kind) {
    case Element::Token:
      if (T.tok != El.tok)
        return false;
      if ((T.tok == tok_identifier || T.tok == tok_number) && T.text != El.text)
        return false;
      break;

    case Element::Var: {
      // Only single letters name variables.
      if (T.tok != tok_identifier || T.text.size() != 1)
        return false;
      Identifier id = T.text[0];
      if (bound[El.slot] && C.vars[El.slot] != id)
        return false;
      bound[El.slot] = true;
      C.vars[El.slot] = id;
      break;
    }

    case Element::Target:
      if (T.tok != tok_number)
        return false;
      // getAsInteger returns true on failure, e.g. on overflow.
      if (llvm::StringRef(T.text).getAsInteger(10, C.target))
        return false;
      break;
    }
  }

  if (P.distinctOperands && C.vars[0] == C.vars[1])
    return false;
  return true;
}

llvm::Expected<std::unique_ptr<Instruction>>
Recognizer::recognize(LineNumber line, llvm::StringRef code) const {
  llvm::StringRef stmt = code.trim();
  std::vector<LexedToken> toks = tokenize(stmt);

  Captures C;
  for (const Pattern &P : patterns) {
    if (!match(P, toks, C))
      continue;
    LLVM_DEBUG(llvm::dbgs() << "line " << line << ": '" << stmt << "' matches '"
                            << P.source << "'\n");
    return P.build(line, C);
  }

  return llvm::make_error<ParseError>(
      ParseErrorCode::UnrecognizedStatement,
      ("no matching instruction could be found for the line: " + stmt).str());
}

std::vector<std::string> Recognizer::getPatterns() const {
  std::vector<std::string> result;
  for (const Pattern &P : patterns)
    result.push_back(P.source);
  return result;
}
