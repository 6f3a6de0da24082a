#pragma once

#include "lexer/sourceLocation.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace treepat {

struct Node;
class Value;

using NodePtr = std::shared_ptr<Node>;
using ValueList = std::vector<Value>;

/**
 * Symbol - a name literal such as :foo or :+
 */
struct Symbol {
  std::string name;

  bool operator==(const Symbol &other) const { return name == other.name; }
};

/**
 * Value - anything that can appear as a child of an analyzed node
 *
 * Nodes are shared so that captures can hand them out without copying the
 * tree. Lists only appear as the capture of a variadic sequence term.
 */
class Value {
public:
  using Storage =
      std::variant<std::monostate, // nil
                   bool, int64_t, double, Symbol,
                   std::string, // string literal
                   NodePtr, std::shared_ptr<const ValueList>>;

  Value() = default;
  Value(NodePtr node) : storage(std::move(node)) {}

  static Value nil() { return Value(); }
  static Value boolean(bool value);
  static Value integer(int64_t value);
  static Value floating(double value);
  static Value symbol(std::string name);
  static Value string(std::string text);
  static Value list(ValueList values);

  bool isNil() const;
  bool isBoolean() const;
  bool isInteger() const;
  bool isFloat() const;
  bool isSymbol() const;
  bool isString() const;
  bool isNode() const;
  bool isList() const;

  bool asBoolean() const { return std::get<bool>(storage); }
  int64_t asInteger() const { return std::get<int64_t>(storage); }
  double asFloat() const { return std::get<double>(storage); }
  const std::string &asSymbol() const { return std::get<Symbol>(storage).name; }
  const std::string &asString() const { return std::get<std::string>(storage); }
  const NodePtr &asNode() const { return std::get<NodePtr>(storage); }
  const ValueList &asList() const;

  // Structural equality; nodes compare by type and children
  bool operator==(const Value &other) const;
  bool operator!=(const Value &other) const { return !(*this == other); }

  // Render in s-expression form: nil, 42, :foo, "str", (send nil :foo)
  std::string toString() const;

private:
  Storage storage;
};

/**
 * Node - a node of the analyzed tree
 *
 * Mirrors the shape of a parser AST: a type name, ordered children that are
 * either nodes or atoms, and the byte range of the source it was built from.
 */
struct Node {
  std::string type;
  ValueList children;
  std::optional<SourceRange> range;

  Node(std::string type, ValueList children = {},
       std::optional<SourceRange> range = std::nullopt)
      : type(std::move(type)), children(std::move(children)), range(range) {}

  // Visit every descendant node depth-first, pre-order, excluding this node
  void eachDescendant(const std::function<void(const Node &)> &visit) const;

  bool operator==(const Node &other) const;

  std::string toString() const;
};

NodePtr makeNode(std::string type, ValueList children = {},
                 std::optional<SourceRange> range = std::nullopt);

} // namespace treepat
