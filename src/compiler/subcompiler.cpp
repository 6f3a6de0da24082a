#include "compiler/subcompiler.hpp"

#include "compiler/debug/instrumentation.hpp"

#include <optional>

namespace treepat {

Fragment Subcompiler::compile(const PatternNode &node) {
  CompileContext::NodeScope scope(*contextData, node);

  Instrumentation *instrumentation = contextData->instrumentation();
  std::optional<NodeId> id;
  if (instrumentation) {
    id = instrumentation->assign(node);
  }

  Handler handler = definitionData->registry.lookup(node.type);
  Fragment fragment = handler(*this, node);

  if (id) {
    fragment = instrumentation->wrap(*id, node, std::move(fragment));
  }
  return fragment;
}

Subcompiler Subcompiler::nodePattern(std::string access) const {
  return Subcompiler(*contextData, contextData->nodePatternDefinition(),
                     std::move(access));
}

Subcompiler Subcompiler::sequence(std::string access) const {
  return Subcompiler(*contextData, contextData->sequenceDefinition(),
                     std::move(access));
}

} // namespace treepat
