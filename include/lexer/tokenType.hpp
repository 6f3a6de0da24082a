#pragma once

#include <string_view>

namespace treepat {

/**
 * @brief Node pattern token types
 *
 * Identifiers are split by their suffix: a bare word names a node type, a
 * word ending in '?' names a predicate.
 */
enum class TokenType {
  // Literals
  INTEGER,
  FLOAT,
  STRING,
  SYMBOL, // :name or :+

  // Words
  NODE_TYPE, // send
  PREDICATE, // nil?
  PARAMETER, // %name
  WILDCARD,  // _
  REST,      // ...

  // Grouping
  LPAREN,   // ( sequence
  RPAREN,   // )
  LBRACE,   // { union
  RBRACE,   // }
  LBRACKET, // [ intersection
  RBRACKET, // ]

  // Prefix operators
  DOLLAR, // $ capture
  BANG,   // ! negation

  // Repetition suffixes
  STAR,
  PLUS,
  QUESTION,

  END_OF_FILE,
  ERROR
};

// Convert token type to string for debugging
constexpr std::string_view tokenTypeToString(TokenType type) {
  switch (type) {
  case TokenType::INTEGER:
    return "INTEGER";
  case TokenType::FLOAT:
    return "FLOAT";
  case TokenType::STRING:
    return "STRING";
  case TokenType::SYMBOL:
    return "SYMBOL";
  case TokenType::NODE_TYPE:
    return "NODE_TYPE";
  case TokenType::PREDICATE:
    return "PREDICATE";
  case TokenType::PARAMETER:
    return "PARAMETER";
  case TokenType::WILDCARD:
    return "WILDCARD";
  case TokenType::REST:
    return "REST";
  case TokenType::LPAREN:
    return "LPAREN";
  case TokenType::RPAREN:
    return "RPAREN";
  case TokenType::LBRACE:
    return "LBRACE";
  case TokenType::RBRACE:
    return "RBRACE";
  case TokenType::LBRACKET:
    return "LBRACKET";
  case TokenType::RBRACKET:
    return "RBRACKET";
  case TokenType::DOLLAR:
    return "DOLLAR";
  case TokenType::BANG:
    return "BANG";
  case TokenType::STAR:
    return "STAR";
  case TokenType::PLUS:
    return "PLUS";
  case TokenType::QUESTION:
    return "QUESTION";
  case TokenType::END_OF_FILE:
    return "EOF";
  case TokenType::ERROR:
    return "ERROR";
  default:
    return "UNKNOWN";
  }
}

} // namespace treepat
