#include "compiler/debug/instrumentation.hpp"

#include <utility>
#include <vector>

namespace treepat {

// Child index and term identity of every sequence term with a fixed position
static std::vector<std::pair<size_t, NodeId>>
fixedTerms(const NodeIds &ids, const PatternNode &node) {
  std::vector<std::pair<size_t, NodeId>> terms;
  if (node.type != PatternType::Sequence) {
    return terms;
  }
  for (size_t index = 1; index < node.children.size(); ++index) {
    const PatternNode &term = node.child(index);
    if (isVariadic(term)) {
      break;
    }
    if (std::optional<NodeId> id = ids.find(term)) {
      terms.emplace_back(index - 1, *id);
    }
  }
  return terms;
}

Fragment Instrumentation::wrap(NodeId id, const PatternNode &node,
                               Fragment fragment) const {
  std::string marker = std::to_string(id);
  fragment.code = "(trace.enter(" + marker + ") && " + fragment.code +
                  " && trace.success(" + marker + "))";

  bool variadic = !fragment.arity.isSingle();
  fragment.step = [id, variadic, terms = fixedTerms(ids, node),
                   step = std::move(fragment.step)](
                      MatchFrame &frame, const ValueList &elements,
                      size_t position, Continuation next) {
    if (!frame.trace) {
      return step(frame, elements, position, next);
    }
    Trace &trace = *frame.trace;
    trace.enter(id);

    const Node *subject = nullptr;
    if (!variadic && position < elements.size() &&
        elements[position].isNode()) {
      subject = elements[position].asNode().get();
      trace.bind(id, *subject);
      for (const auto &[child, termId] : terms) {
        if (child < subject->children.size() &&
            subject->children[child].isNode()) {
          trace.bind(termId, *subject->children[child].asNode());
        }
      }
    }

    // Confirmed bindings only survive along the path that matched
    size_t mark = trace.checkpoint();
    bool matched = step(frame, elements, position, [&](size_t end) {
      trace.success(id);
      size_t resume = trace.checkpoint();
      if (subject) {
        trace.confirm(id, *subject);
      }
      if (variadic) {
        for (size_t index = position; index < end; ++index) {
          if (elements[index].isNode()) {
            trace.confirm(id, *elements[index].asNode());
          }
        }
      }
      if (next(end)) {
        return true;
      }
      trace.rewind(resume);
      return false;
    });
    if (!matched) {
      trace.rewind(mark);
    }
    return matched;
  };
  return fragment;
}

} // namespace treepat
