#include "ast/value.hpp"

#include <llvm/Support/Format.h>
#include <llvm/Support/raw_ostream.h>

namespace treepat {

Value Value::boolean(bool value) {
  Value result;
  result.storage = value;
  return result;
}

Value Value::integer(int64_t value) {
  Value result;
  result.storage = value;
  return result;
}

Value Value::floating(double value) {
  Value result;
  result.storage = value;
  return result;
}

Value Value::symbol(std::string name) {
  Value result;
  result.storage = Symbol{std::move(name)};
  return result;
}

Value Value::string(std::string text) {
  Value result;
  result.storage = std::move(text);
  return result;
}

Value Value::list(ValueList values) {
  Value result;
  result.storage = std::make_shared<const ValueList>(std::move(values));
  return result;
}

bool Value::isNil() const {
  return std::holds_alternative<std::monostate>(storage);
}

bool Value::isBoolean() const { return std::holds_alternative<bool>(storage); }

bool Value::isInteger() const {
  return std::holds_alternative<int64_t>(storage);
}

bool Value::isFloat() const { return std::holds_alternative<double>(storage); }

bool Value::isSymbol() const { return std::holds_alternative<Symbol>(storage); }

bool Value::isString() const {
  return std::holds_alternative<std::string>(storage);
}

bool Value::isNode() const {
  return std::holds_alternative<NodePtr>(storage) && asNode() != nullptr;
}

bool Value::isList() const {
  return std::holds_alternative<std::shared_ptr<const ValueList>>(storage);
}

const ValueList &Value::asList() const {
  return *std::get<std::shared_ptr<const ValueList>>(storage);
}

bool Value::operator==(const Value &other) const {
  if (storage.index() != other.storage.index()) {
    return false;
  }
  if (isNode()) {
    return other.isNode() && *asNode() == *other.asNode();
  }
  if (isList()) {
    return asList() == other.asList();
  }
  return storage == other.storage;
}

// Escape a string literal the way it would be written in source
static std::string quote(const std::string &text) {
  std::string result = "\"";
  for (char character : text) {
    switch (character) {
    case '"':
      result += "\\\"";
      break;
    case '\\':
      result += "\\\\";
      break;
    case '\n':
      result += "\\n";
      break;
    case '\t':
      result += "\\t";
      break;
    default:
      result += character;
    }
  }
  return result + "\"";
}

std::string Value::toString() const {
  if (isNil()) {
    return "nil";
  }
  if (isBoolean()) {
    return asBoolean() ? "true" : "false";
  }
  if (isInteger()) {
    return std::to_string(asInteger());
  }
  if (isFloat()) {
    std::string text;
    llvm::raw_string_ostream stream(text);
    stream << llvm::format("%g", asFloat());
    stream.flush();
    if (text.find_first_of(".eni") == std::string::npos) {
      text += ".0";
    }
    return text;
  }
  if (isSymbol()) {
    return ":" + asSymbol();
  }
  if (isString()) {
    return quote(asString());
  }
  if (isNode()) {
    return asNode()->toString();
  }
  if (isList()) {
    std::string result = "[";
    const ValueList &values = asList();
    for (size_t index = 0; index < values.size(); ++index) {
      if (index > 0) {
        result += ", ";
      }
      result += values[index].toString();
    }
    return result + "]";
  }
  // A null NodePtr
  return "nil";
}

void Node::eachDescendant(
    const std::function<void(const Node &)> &visit) const {
  for (const Value &child : children) {
    if (child.isNode()) {
      visit(*child.asNode());
      child.asNode()->eachDescendant(visit);
    }
  }
}

bool Node::operator==(const Node &other) const {
  return type == other.type && children == other.children;
}

std::string Node::toString() const {
  std::string result = "(" + type;
  for (const Value &child : children) {
    result += " " + child.toString();
  }
  return result + ")";
}

NodePtr makeNode(std::string type, ValueList children,
                 std::optional<SourceRange> range) {
  return std::make_shared<Node>(std::move(type), std::move(children), range);
}

} // namespace treepat
