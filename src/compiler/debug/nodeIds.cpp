#include "compiler/debug/nodeIds.hpp"

namespace treepat {

NodeId NodeIds::idFor(const PatternNode &node) {
  auto [it, inserted] = ids.emplace(&node, order.size());
  if (inserted) {
    order.push_back(&node);
  }
  return it->second;
}

std::optional<NodeId> NodeIds::find(const PatternNode &node) const {
  auto it = ids.find(&node);
  if (it == ids.end()) {
    return std::nullopt;
  }
  return it->second;
}

} // namespace treepat
