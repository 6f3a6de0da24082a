#pragma once

#include "compiler/debug/nodeIds.hpp"
#include "compiler/fragment.hpp"

namespace treepat {

/**
 * Instrumentation - wraps compiled fragments so a run records into a Trace
 *
 * A wrapped fragment enters its identity before running, succeeds it only when
 * the wrapped fragment matched, and answers exactly what it answers. Wrapping
 * never changes which inputs match.
 *
 * Examined nodes are bound provisionally on entry and confirmed on success.
 * Confirmations are rewound when the path they belong to backtracks.
 */
class Instrumentation {
public:
  // Identity for a node about to be compiled
  NodeId assign(const PatternNode &node) { return ids.idFor(node); }

  Fragment wrap(NodeId id, const PatternNode &node, Fragment fragment) const;

  const NodeIds &nodeIds() const { return ids; }

private:
  NodeIds ids;
};

} // namespace treepat
