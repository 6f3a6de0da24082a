#include "source/sourceParser.hpp"

#include "compiler/errors.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace treepat {

// Binary operators from loosest to tightest binding
static const std::vector<std::vector<std::string>> binaryLevels = {
    {"==", "!="},
    {"<", ">", "<=", ">="},
    {"+", "-"},
    {"*", "/"},
};

static const char *const twoCharOperators[] = {"==", "!=", "<=", ">=", "&."};
static const std::string singleCharOperators = "=<>+-*/()[],.";

static bool isIdentifierStart(char c) {
  return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

static bool isIdentifierChar(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

static bool isDigit(char c) {
  return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

SourceParser::SourceParser(std::string source, std::string name)
    : buffer(std::make_shared<const SourceBuffer>(std::move(name),
                                                  std::move(source))) {}

SourceTree SourceParser::parse() {
  tokenize();
  skipNewlines();
  if (peek().kind == Kind::End) {
    fail(0, "empty source");
  }

  ValueList statements = parseStatements(nullptr);
  if (peek().kind != Kind::End) {
    fail(peek().range.begin, "unexpected '" + peek().text + "'");
  }

  if (statements.size() == 1) {
    return SourceTree{buffer, statements.front().asNode()};
  }
  SourceRange range{statements.front().asNode()->range->begin,
                    statements.back().asNode()->range->end};
  return SourceTree{buffer, makeNode("begin", std::move(statements), range)};
}

void SourceParser::fail(size_t offset, const std::string &message) const {
  throw SourceSyntaxError(Diagnostic(message, buffer->locationOf(offset)));
}

void SourceParser::tokenize() {
  const std::string &text = buffer->text();
  size_t offset = 0;

  auto push = [this](Kind kind, std::string value, size_t begin, size_t end) {
    lexemes.push_back(Lexeme{kind, std::move(value), SourceRange{begin, end}});
  };

  while (offset < text.size()) {
    char c = text[offset];
    size_t start = offset;

    if (c == ' ' || c == '\t' || c == '\r') {
      ++offset;
      continue;
    }
    if (c == '#') {
      while (offset < text.size() && text[offset] != '\n') {
        ++offset;
      }
      continue;
    }
    if (c == '\n' || c == ';') {
      push(Kind::Newline, std::string(1, c), start, ++offset);
      continue;
    }

    if (isDigit(c)) {
      while (offset < text.size() && isDigit(text[offset])) {
        ++offset;
      }
      Kind kind = Kind::Integer;
      if (offset + 1 < text.size() && text[offset] == '.' &&
          isDigit(text[offset + 1])) {
        kind = Kind::Float;
        ++offset;
        while (offset < text.size() && isDigit(text[offset])) {
          ++offset;
        }
      }
      push(kind, text.substr(start, offset - start), start, offset);
      continue;
    }

    if (c == '"') {
      std::string value;
      ++offset;
      while (offset < text.size() && text[offset] != '"') {
        if (text[offset] == '\\' && offset + 1 < text.size()) {
          ++offset;
          switch (text[offset]) {
          case 'n':
            value += '\n';
            break;
          case 't':
            value += '\t';
            break;
          default:
            value += text[offset];
          }
        } else {
          value += text[offset];
        }
        ++offset;
      }
      if (offset >= text.size()) {
        fail(start, "unterminated string");
      }
      ++offset; // closing "
      push(Kind::String, std::move(value), start, offset);
      continue;
    }

    if (c == ':' && offset + 1 < text.size() &&
        isIdentifierStart(text[offset + 1])) {
      ++offset;
      while (offset < text.size() && isIdentifierChar(text[offset])) {
        ++offset;
      }
      if (offset < text.size() && (text[offset] == '?' || text[offset] == '!')) {
        ++offset;
      }
      push(Kind::Symbol, text.substr(start + 1, offset - start - 1), start,
           offset);
      continue;
    }

    if (isIdentifierStart(c)) {
      while (offset < text.size() && isIdentifierChar(text[offset])) {
        ++offset;
      }
      // foo? and foo!, but not foo != bar
      if (offset < text.size() && (text[offset] == '?' || text[offset] == '!') &&
          !(offset + 1 < text.size() && text[offset + 1] == '=')) {
        ++offset;
      }
      push(Kind::Identifier, text.substr(start, offset - start), start, offset);
      continue;
    }

    bool matched = false;
    for (const char *op : twoCharOperators) {
      if (text.compare(offset, 2, op) == 0) {
        offset += 2;
        push(Kind::Operator, op, start, offset);
        matched = true;
        break;
      }
    }
    if (matched) {
      continue;
    }
    if (singleCharOperators.find(c) != std::string::npos) {
      push(Kind::Operator, std::string(1, c), start, ++offset);
      continue;
    }

    fail(start, std::string("unexpected character '") + c + "'");
  }

  push(Kind::End, "", text.size(), text.size());
}

const SourceParser::Lexeme &SourceParser::peek(size_t ahead) const {
  return lexemes[std::min(position + ahead, lexemes.size() - 1)];
}

const SourceParser::Lexeme &SourceParser::advance() {
  const Lexeme &lexeme = lexemes[position];
  if (lexeme.kind != Kind::End) {
    ++position;
  }
  return lexeme;
}

bool SourceParser::check(const char *op) const {
  return peek().kind == Kind::Operator && peek().text == op;
}

bool SourceParser::match(const char *op) {
  if (!check(op)) {
    return false;
  }
  advance();
  return true;
}

void SourceParser::expect(const char *op) {
  if (!match(op)) {
    fail(peek().range.begin, std::string("expected '") + op + "'");
  }
}

void SourceParser::skipNewlines() {
  while (peek().kind == Kind::Newline) {
    advance();
  }
}

// Statements separated by newlines or ';', up to `terminator` (not consumed)
// or the end of the source
ValueList SourceParser::parseStatements(const char *terminator) {
  ValueList statements;
  skipNewlines();
  while (peek().kind != Kind::End && !(terminator && check(terminator))) {
    statements.push_back(parseStatement());
    if (peek().kind != Kind::Newline) {
      break;
    }
    skipNewlines();
  }
  if (statements.empty()) {
    fail(peek().range.begin, "expected expression");
  }
  return statements;
}

NodePtr SourceParser::parseStatement() {
  if (peek().kind == Kind::Identifier && peek(1).kind == Kind::Operator &&
      peek(1).text == "=") {
    const Lexeme &name = advance();
    advance(); // =
    skipNewlines();
    locals.insert(name.text);
    NodePtr value = parseStatement();
    return makeNode("lvasgn", {Value::symbol(name.text), value},
                    SourceRange{name.range.begin, value->range->end});
  }
  return parseBinary(0);
}

NodePtr SourceParser::parseBinary(size_t level) {
  if (level == binaryLevels.size()) {
    return parsePostfix();
  }

  NodePtr left = parseBinary(level + 1);
  const std::vector<std::string> &operators = binaryLevels[level];
  while (peek().kind == Kind::Operator &&
         std::find(operators.begin(), operators.end(), peek().text) !=
             operators.end()) {
    std::string op = advance().text;
    skipNewlines();
    NodePtr right = parseBinary(level + 1);
    SourceRange range{left->range->begin, right->range->end};
    left = makeNode("send", {left, Value::symbol(op), right}, range);
  }
  return left;
}

NodePtr SourceParser::parsePostfix() {
  NodePtr receiver = parsePrimary();
  while (check(".") || check("&.")) {
    std::string type = advance().text == "." ? "send" : "csend";
    if (peek().kind != Kind::Identifier) {
      fail(peek().range.begin, "expected method name");
    }
    const Lexeme &name = advance();

    ValueList children{receiver, Value::symbol(name.text)};
    size_t end = name.range.end;
    if (match("(")) {
      ValueList arguments = parseArguments(")", end);
      children.insert(children.end(), arguments.begin(), arguments.end());
    }
    SourceRange range{receiver->range->begin, end};
    receiver = makeNode(type, std::move(children), range);
  }
  return receiver;
}

// Comma separated statements after an opening bracket, through `close`.
// Sets `end` to the offset just past `close`.
ValueList SourceParser::parseArguments(const char *close, size_t &end) {
  ValueList arguments;
  skipNewlines();
  if (!check(close)) {
    while (true) {
      arguments.push_back(parseStatement());
      skipNewlines();
      if (!match(",")) {
        break;
      }
      skipNewlines();
    }
  }
  if (!check(close)) {
    fail(peek().range.begin, std::string("expected '") + close + "'");
  }
  end = advance().range.end;
  return arguments;
}

NodePtr SourceParser::parsePrimary() {
  const Lexeme &token = peek();

  switch (token.kind) {
  case Kind::Integer:
  case Kind::Float: {
    advance();
    try {
      if (token.kind == Kind::Float) {
        return makeNode("float", {Value::floating(std::stod(token.text))},
                        token.range);
      }
      return makeNode("int", {Value::integer(std::stoll(token.text))},
                      token.range);
    } catch (const std::out_of_range &) {
      fail(token.range.begin, "number out of range");
    }
  }
  case Kind::String:
    advance();
    return makeNode("str", {Value::string(token.text)}, token.range);
  case Kind::Symbol:
    advance();
    return makeNode("sym", {Value::symbol(token.text)}, token.range);
  case Kind::Identifier: {
    advance();
    if (token.text == "nil" || token.text == "true" || token.text == "false" ||
        token.text == "self") {
      return makeNode(token.text, {}, token.range);
    }
    if (match("(")) {
      size_t end = token.range.end;
      ValueList children{Value::nil(), Value::symbol(token.text)};
      ValueList arguments = parseArguments(")", end);
      children.insert(children.end(), arguments.begin(), arguments.end());
      return makeNode("send", std::move(children),
                      SourceRange{token.range.begin, end});
    }
    if (locals.count(token.text)) {
      return makeNode("lvar", {Value::symbol(token.text)}, token.range);
    }
    return makeNode("send", {Value::nil(), Value::symbol(token.text)},
                    token.range);
  }
  case Kind::Operator:
    if (token.text == "-" &&
        (peek(1).kind == Kind::Integer || peek(1).kind == Kind::Float) &&
        peek(1).range.begin == token.range.end) {
      advance();
      const Lexeme &number = advance();
      SourceRange range{token.range.begin, number.range.end};
      try {
        if (number.kind == Kind::Float) {
          return makeNode("float", {Value::floating(-std::stod(number.text))},
                          range);
        }
        return makeNode("int", {Value::integer(std::stoll("-" + number.text))},
                        range);
      } catch (const std::out_of_range &) {
        fail(token.range.begin, "number out of range");
      }
    }
    if (token.text == "(") {
      advance();
      ValueList statements = parseStatements(")");
      size_t end = peek().range.end;
      expect(")");
      return makeNode("begin", std::move(statements),
                      SourceRange{token.range.begin, end});
    }
    if (token.text == "[") {
      advance();
      size_t end = token.range.end;
      ValueList elements = parseArguments("]", end);
      return makeNode("array", std::move(elements),
                      SourceRange{token.range.begin, end});
    }
    break;
  case Kind::Newline:
    fail(token.range.begin, "unexpected end of line");
  case Kind::End:
    fail(token.range.begin, "unexpected end of source");
  }
  fail(token.range.begin, "unexpected '" + token.text + "'");
}

} // namespace treepat
