#pragma once

#include "lexer/token.hpp"
#include "pattern/patternNode.hpp"

#include <string>
#include <vector>

namespace treepat {

/**
 * PatternParser - recursive descent parser for node pattern text
 *
 * Sequence-only constructs (..., repetition suffixes) are accepted anywhere;
 * rejecting them outside sequences is the compiler's job.
 */
class PatternParser {
public:
  explicit PatternParser(const std::string &source,
                         const std::string &filename = "(pattern)");

  /**
   * Parse the whole text as a single pattern
   * @throws PatternSyntaxError on malformed input
   */
  PatternNodePtr parse();

private:
  std::vector<Token> tokens;
  size_t position = 0;

  const Token &peek() const;
  const Token &advance();
  const Token &expect(TokenType type, const char *what);
  [[noreturn]] void fail(const Token &token, const std::string &message) const;

  std::unique_ptr<PatternNode> parseTerm();
  std::unique_ptr<PatternNode> parsePrimary();
  std::unique_ptr<PatternNode> parseGroup(PatternType type, TokenType close,
                                          const char *closeText);

  static std::unique_ptr<PatternNode> newNode(PatternType type,
                                              const Token &token);
  static void extendTo(PatternNode &node, const Token &last);
};

} // namespace treepat
