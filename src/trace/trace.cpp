#include "trace/trace.hpp"

namespace treepat {

std::optional<bool> Trace::matched(NodeId id) const {
  auto it = visitsData.find(id);
  if (it == visitsData.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool Trace::bind(NodeId id, const Node &node) {
  return bindings.emplace(&node, id).second;
}

void Trace::confirm(NodeId id, const Node &node) {
  confirmed[&node].push_back(id);
  confirmLog.push_back(&node);
}

void Trace::rewind(size_t mark) {
  while (confirmLog.size() > mark) {
    auto it = confirmed.find(confirmLog.back());
    it->second.pop_back();
    if (it->second.empty()) {
      confirmed.erase(it);
    }
    confirmLog.pop_back();
  }
}

std::optional<NodeId> Trace::binding(const Node &node) const {
  auto latest = confirmed.find(&node);
  if (latest != confirmed.end()) {
    return latest->second.back();
  }
  auto it = bindings.find(&node);
  if (it == bindings.end()) {
    return std::nullopt;
  }
  return it->second;
}

} // namespace treepat
