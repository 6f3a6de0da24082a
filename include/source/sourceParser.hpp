#pragma once

#include "ast/sourceBuffer.hpp"

#include <set>
#include <string>
#include <vector>

namespace treepat {

/**
 * SourceParser - reads a small Ruby-flavoured expression language into an
 * analyzed tree whose nodes carry source ranges
 *
 * Supported: literals, arrays, local variables, assignments, method calls
 * with and without receiver (including &.), binary operators and
 * parenthesized expressions. Several statements become a begin node.
 */
class SourceParser {
public:
  explicit SourceParser(std::string source, std::string name = "(source)");

  /**
   * Parse the whole buffer
   * @throws SourceSyntaxError on malformed or empty input
   */
  SourceTree parse();

private:
  enum class Kind {
    Integer,
    Float,
    String,
    Symbol,
    Identifier,
    Operator, // punctuation and operators, text in `text`
    Newline,
    End
  };

  struct Lexeme {
    Kind kind;
    std::string text; // identifier, operator, unescaped string, symbol name
    SourceRange range;
  };

  std::shared_ptr<const SourceBuffer> buffer;
  std::vector<Lexeme> lexemes;
  size_t position = 0;
  // Names assigned so far; later bare references to them are variables
  std::set<std::string> locals;

  void tokenize();
  [[noreturn]] void fail(size_t offset, const std::string &message) const;

  const Lexeme &peek(size_t ahead = 0) const;
  const Lexeme &advance();
  bool check(const char *op) const;
  bool match(const char *op);
  void expect(const char *op);
  void skipNewlines();

  ValueList parseStatements(const char *terminator);
  NodePtr parseStatement();
  NodePtr parseBinary(size_t level);
  NodePtr parsePostfix();
  NodePtr parsePrimary();
  ValueList parseArguments(const char *close, size_t &end);
};

} // namespace treepat
