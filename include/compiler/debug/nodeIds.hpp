#pragma once

#include "pattern/patternNode.hpp"
#include "trace/trace.hpp"

#include <optional>
#include <unordered_map>
#include <vector>

namespace treepat {

/**
 * NodeIds - identities of pattern nodes, keyed by object identity
 *
 * Identities are handed out 0, 1, 2, ... in the order nodes are first seen,
 * which is compile pre-order. Two equal-looking nodes get two identities.
 */
class NodeIds {
public:
  // Identity of `node`, assigning the next free one on first sight
  NodeId idFor(const PatternNode &node);

  std::optional<NodeId> find(const PatternNode &node) const;

  // Pattern node of an identity handed out by idFor()
  const PatternNode &node(NodeId id) const { return *order.at(id); }

  size_t size() const { return order.size(); }

  // Nodes in identity order
  const std::vector<const PatternNode *> &nodes() const { return order; }

private:
  std::unordered_map<const PatternNode *, NodeId> ids;
  std::vector<const PatternNode *> order;
};

} // namespace treepat
