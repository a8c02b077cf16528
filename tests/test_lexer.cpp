#include <cassert>
#include <vector>

#include "llvm/Support/raw_ostream.h"

#include "minasm/lexer.h"
#include "minasm/parser.h"

using namespace minasm;

static std::vector<int> kinds(llvm::StringRef code) {
  std::vector<int> result;
  for (const LexedToken &T : tokenize(code))
    result.push_back(T.tok);
  return result;
}

void test_jump_if_zero_tokens() {
  llvm::outs() << "Running test_jump_if_zero_tokens...\n";

  std::vector<LexedToken> toks = tokenize("if (x == 0) goto 12");
  assert(toks.size() == 8);
  assert(toks[0].tok == tok_if);
  assert(toks[1].tok == '(');
  assert(toks[2].tok == tok_identifier && toks[2].text == "x");
  assert(toks[3].tok == tok_eqeq);
  assert(toks[4].tok == tok_number && toks[4].text == "0");
  assert(toks[5].tok == ')');
  assert(toks[6].tok == tok_goto);
  assert(toks[7].tok == tok_number && toks[7].text == "12");

  llvm::outs() << "test_jump_if_zero_tokens PASSED\n";
}

void test_space_before_recorded() {
  llvm::outs() << "Running test_space_before_recorded...\n";

  // Same tokens, different spacing.
  assert(kinds("if(x==0)goto 3") == kinds("  if ( x == 0 )   goto\t3 "));

  std::vector<LexedToken> toks = tokenize("x  =\ty+ 1");
  assert(toks.size() == 5);
  assert(toks[0].spaceBefore.empty());
  assert(toks[1].spaceBefore == "  ");
  assert(toks[2].spaceBefore == "\t");
  assert(toks[3].spaceBefore.empty());
  assert(toks[4].spaceBefore == " ");

  Lexer lexer("   stop");
  assert(lexer.gettok() == tok_stop);
  assert(lexer.getSpaceBefore() == "   ");

  assert(tokenize("   ").empty());
  assert(tokenize("").empty());

  llvm::outs() << "test_space_before_recorded PASSED\n";
}

void test_identifiers_and_keywords() {
  llvm::outs() << "Running test_identifiers_and_keywords...\n";

  std::vector<LexedToken> toks = tokenize("x1 = abs(y-z)");
  assert(toks.size() == 8);
  assert(toks[0].tok == tok_identifier && toks[0].text == "x1");
  assert(toks[1].tok == '=');
  assert(toks[2].tok == tok_abs);
  assert(toks[4].tok == tok_identifier && toks[4].text == "y");
  assert(toks[5].tok == '-');

  // Keywords are case sensitive.
  assert(kinds("stop") == std::vector<int>{tok_stop});
  assert(kinds("Stop") == std::vector<int>{tok_identifier});
  assert(kinds("gotox") == std::vector<int>{tok_identifier});

  llvm::outs() << "test_identifiers_and_keywords PASSED\n";
}

void test_single_equals_and_unknown_chars() {
  llvm::outs() << "Running test_single_equals_and_unknown_chars...\n";

  assert((kinds("= ==") == std::vector<int>{'=', tok_eqeq}));
  assert((kinds("===") == std::vector<int>{tok_eqeq, '='}));
  assert((kinds("x * 2;") == std::vector<int>{tok_identifier, '*', tok_number, ';'}));

  llvm::outs() << "test_single_equals_and_unknown_chars PASSED\n";
}

void test_columns() {
  llvm::outs() << "Running test_columns...\n";

  Lexer lexer("  goto 7");
  assert(lexer.gettok() == tok_goto);
  assert(lexer.getTokColumn() == 3);
  assert(lexer.gettok() == tok_number);
  assert(lexer.getTokColumn() == 8);
  assert(lexer.getNumStr() == "7");
  assert(lexer.gettok() == tok_eof);
  // Stays at eof.
  assert(lexer.gettok() == tok_eof);

  llvm::outs() << "test_columns PASSED\n";
}

void test_token_names() {
  llvm::outs() << "Running test_token_names...\n";

  assert(tokenName(tok_eqeq) == "==");
  assert(tokenName(tok_goto) == "goto");
  assert(tokenName('(') == "(");
  assert(tokenName(tok_eof) == "<eof>");

  llvm::outs() << "test_token_names PASSED\n";
}

int main() {
  llvm::outs() << "Running lexer unit tests...\n";

  test_jump_if_zero_tokens();
  test_space_before_recorded();
  test_identifiers_and_keywords();
  test_single_equals_and_unknown_chars();
  test_columns();
  test_token_names();

  llvm::outs() << "All lexer tests passed.\n";
  return 0;
}
