#pragma once

#include "ast/value.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <unordered_map>
#include <vector>

namespace treepat {

// Identity of a pattern node within one compiled pattern
using NodeId = size_t;

/**
 * Trace - what one run of a debug matcher did
 *
 * Records, per pattern node identity, whether it was entered and whether it
 * matched. Also remembers which pattern identity examined each analyzed node
 * so results can be mapped back onto the source.
 *
 * One trace per run. Reusing a trace for a second run mixes both runs.
 */
class Trace {
public:
  // Marks `id` as visited but not (yet) matched
  bool enter(NodeId id) {
    visitsData[id] = false;
    return true;
  }

  bool success(NodeId id) {
    visitsData[id] = true;
    return true;
  }

  // nullopt if `id` was never entered
  std::optional<bool> matched(NodeId id) const;

  // Provisionally associates `node` with `id` unless it is already bound
  // provisionally in this trace. Returns whether the binding was made.
  bool bind(NodeId id, const Node &node);

  /**
   * Associates `node` with `id` along the path that is currently matching.
   * Confirmed bindings take precedence over provisional ones, and the latest
   * one made wins. They are undone by rewind() when the path backtracks.
   */
  void confirm(NodeId id, const Node &node);

  // Position to rewind confirmed bindings to
  size_t checkpoint() const { return confirmLog.size(); }

  // Drops every confirmed binding made since `mark`
  void rewind(size_t mark);

  // Latest confirmed binding, else the provisional one
  std::optional<NodeId> binding(const Node &node) const;

  // Visited identities in ascending order
  const std::map<NodeId, bool> &visits() const { return visitsData; }

  bool empty() const {
    return visitsData.empty() && bindings.empty() && confirmLog.empty();
  }

private:
  std::map<NodeId, bool> visitsData;
  std::unordered_map<const Node *, NodeId> bindings;
  std::unordered_map<const Node *, std::vector<NodeId>> confirmed;
  std::vector<const Node *> confirmLog;
};

} // namespace treepat
