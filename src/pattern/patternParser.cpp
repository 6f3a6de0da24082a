#include "pattern/patternParser.hpp"

#include "compiler/errors.hpp"
#include "lexer/lexer.hpp"

#include <algorithm>

namespace treepat {

PatternParser::PatternParser(const std::string &source,
                             const std::string &filename)
    : tokens(Lexer(source, filename).tokenize()) {}

PatternNodePtr PatternParser::parse() {
  if (peek().type == TokenType::END_OF_FILE) {
    fail(peek(), "empty pattern");
  }
  std::unique_ptr<PatternNode> root = parseTerm();
  if (peek().type != TokenType::END_OF_FILE) {
    fail(peek(), "unexpected '" + peek().lexeme + "' after pattern");
  }
  return root;
}

const Token &PatternParser::peek() const { return tokens[position]; }

const Token &PatternParser::advance() {
  const Token &token = tokens[position];
  if (token.type != TokenType::END_OF_FILE) {
    ++position;
  }
  return token;
}

const Token &PatternParser::expect(TokenType type, const char *what) {
  if (peek().type != type) {
    fail(peek(), std::string("expected ") + what);
  }
  return advance();
}

void PatternParser::fail(const Token &token, const std::string &message) const {
  std::string text = message;
  if (token.type == TokenType::ERROR) {
    text = std::get<std::string>(token.value);
  } else if (token.type == TokenType::END_OF_FILE) {
    text += " (reached end of pattern)";
  }
  throw PatternSyntaxError(
      Diagnostic(text, token.location, std::max<size_t>(token.range.size(), 1)));
}

std::unique_ptr<PatternNode> PatternParser::newNode(PatternType type,
                                                    const Token &token) {
  auto node = std::make_unique<PatternNode>(type);
  node->location = token.location;
  node->range = token.range;
  return node;
}

void PatternParser::extendTo(PatternNode &node, const Token &last) {
  node.range.end = last.range.end;
}

// A primary followed by an optional repetition suffix
std::unique_ptr<PatternNode> PatternParser::parseTerm() {
  std::unique_ptr<PatternNode> term = parsePrimary();

  TokenType next = peek().type;
  if (next == TokenType::STAR || next == TokenType::PLUS ||
      next == TokenType::QUESTION) {
    const Token &suffix = advance();
    auto repetition = std::make_unique<PatternNode>(PatternType::Repetition);
    repetition->location = term->location;
    repetition->range = {term->range.begin, suffix.range.end};
    repetition->repetition = suffix.lexeme[0];
    repetition->children.push_back(std::move(term));
    return repetition;
  }
  return term;
}

std::unique_ptr<PatternNode> PatternParser::parsePrimary() {
  const Token &token = peek();

  switch (token.type) {
  case TokenType::LPAREN: {
    advance();
    auto sequence = parseGroup(PatternType::Sequence, TokenType::RPAREN, "')'");
    sequence->location = token.location;
    sequence->range.begin = token.range.begin;
    return sequence;
  }
  case TokenType::LBRACE: {
    advance();
    auto group = parseGroup(PatternType::Union, TokenType::RBRACE, "'}'");
    group->location = token.location;
    group->range.begin = token.range.begin;
    return group;
  }
  case TokenType::LBRACKET: {
    advance();
    auto group =
        parseGroup(PatternType::Intersection, TokenType::RBRACKET, "']'");
    group->location = token.location;
    group->range.begin = token.range.begin;
    return group;
  }
  case TokenType::DOLLAR:
  case TokenType::BANG: {
    advance();
    auto node = newNode(token.type == TokenType::DOLLAR ? PatternType::Capture
                                                        : PatternType::Negation,
                        token);
    std::unique_ptr<PatternNode> operand = parseTerm();
    node->range.end = operand->range.end;
    node->children.push_back(std::move(operand));
    return node;
  }
  case TokenType::NODE_TYPE: {
    auto node = newNode(PatternType::NodeType, token);
    node->name = std::get<std::string>(token.value);
    advance();
    return node;
  }
  case TokenType::PREDICATE: {
    auto node = newNode(PatternType::Predicate, token);
    node->name = std::get<std::string>(token.value);
    advance();
    return node;
  }
  case TokenType::PARAMETER: {
    auto node = newNode(PatternType::Parameter, token);
    node->name = std::get<std::string>(token.value);
    advance();
    return node;
  }
  case TokenType::WILDCARD: {
    auto node = newNode(PatternType::Wildcard, token);
    advance();
    return node;
  }
  case TokenType::REST: {
    auto node = newNode(PatternType::Rest, token);
    advance();
    return node;
  }
  case TokenType::SYMBOL: {
    auto node = newNode(PatternType::Literal, token);
    node->literal = Value::symbol(std::get<std::string>(token.value));
    advance();
    return node;
  }
  case TokenType::INTEGER: {
    auto node = newNode(PatternType::Literal, token);
    node->literal = Value::integer(std::get<int64_t>(token.value));
    advance();
    return node;
  }
  case TokenType::FLOAT: {
    auto node = newNode(PatternType::Literal, token);
    node->literal = Value::floating(std::get<double>(token.value));
    advance();
    return node;
  }
  case TokenType::STRING: {
    auto node = newNode(PatternType::Literal, token);
    node->literal = Value::string(std::get<std::string>(token.value));
    advance();
    return node;
  }
  default:
    fail(token, "unexpected '" + token.lexeme + "'");
  }
}

// Terms up to and including the closing token; at least one is required
std::unique_ptr<PatternNode> PatternParser::parseGroup(PatternType type,
                                                       TokenType close,
                                                       const char *closeText) {
  auto group = std::make_unique<PatternNode>(type);
  while (peek().type != close) {
    if (peek().type == TokenType::END_OF_FILE) {
      fail(peek(), std::string("expected ") + closeText);
    }
    group->children.push_back(parseTerm());
  }
  if (group->children.empty()) {
    fail(peek(), std::string("empty ") +
                     std::string(patternTypeToString(type)));
  }
  extendTo(*group, expect(close, closeText));
  return group;
}

} // namespace treepat
