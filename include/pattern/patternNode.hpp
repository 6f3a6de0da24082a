#pragma once

#include "ast/value.hpp"
#include "lexer/sourceLocation.hpp"
#include "pattern/patternType.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace treepat {

/**
 * PatternNode - one element of a parsed node pattern
 *
 * Immutable once parsed. The compiler reads pattern nodes and keys debug
 * identities by their address, never by their structure.
 */
struct PatternNode {
  PatternType type;
  std::vector<std::unique_ptr<PatternNode>> children;
  std::string name;  // NodeType, Predicate ("nil?") and Parameter names
  Value literal;     // Literal value
  char repetition{}; // '*', '+' or '?' for Repetition
  SourceLocation location;
  SourceRange range; // Byte range in the pattern text

  explicit PatternNode(PatternType type) : type(type) {}

  PatternNode(const PatternNode &) = delete;
  PatternNode &operator=(const PatternNode &) = delete;

  const PatternNode &child(size_t index) const { return *children[index]; }

  // Pattern tree in s-expression form, e.g. (sequence (node_type send) ...)
  std::string toString() const;

  // Visit this node and its descendants in pre-order
  void eachNode(const std::function<void(const PatternNode &)> &visit) const;
};

using PatternNodePtr = std::unique_ptr<const PatternNode>;

// Whether the node can consume other than exactly one sequence element
bool isVariadic(const PatternNode &node);

} // namespace treepat
