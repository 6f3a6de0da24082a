#pragma once

#include "lexer/sourceLocation.hpp"
#include "lexer/tokenType.hpp"

#include <cstdint>
#include <string>
#include <variant>

namespace treepat {

struct Token {
  TokenType type;
  std::string lexeme;
  SourceLocation location;
  SourceRange range;

  // Literal value if applicable: the number, the unescaped string, or the
  // bare name of a symbol, predicate or parameter
  std::variant<std::monostate, int64_t, double, std::string> value;

  std::string toString() const;
};

} // namespace treepat
