#include "compiler/registry.hpp"

#include "compiler/errors.hpp"
#include "handlers.h"

#include <algorithm>

namespace treepat {

Diagnostic diagnosticAt(const PatternNode &node, const std::string &message) {
  return Diagnostic(message, node.location,
                    std::max<size_t>(node.range.size(), 1));
}

Fragment onTypeMissing(Subcompiler &compiler, const PatternNode &node) {
  throw CompileError(diagnosticAt(
      node, "unsupported pattern construct '" +
                std::string(patternTypeToString(node.type)) + "' in " +
                compiler.definition().name));
}

const Definition &nodePatternDefinition() {
  static const Definition definition = [] {
    Definition result{"node pattern", Registry(onTypeMissing)};
    Registry &registry = result.registry;
    registry.define(PatternType::Sequence, compileSequence);
    registry.define(PatternType::NodeType, compileNodeType);
    registry.define(PatternType::Wildcard, compileWildcard);
    registry.define(PatternType::Literal, compileLiteral);
    registry.define(PatternType::Predicate, compilePredicate);
    registry.define(PatternType::Capture, compileCapture);
    registry.define(PatternType::Negation, compileNegation);
    registry.define(PatternType::Union, compileUnion);
    registry.define(PatternType::Intersection, compileIntersection);
    registry.define(PatternType::Parameter, compileParameter);
    return result;
  }();
  return definition;
}

const Definition &sequenceDefinition() {
  static const Definition definition = [] {
    Definition result = nodePatternDefinition().derive("sequence");
    result.registry.define(PatternType::Rest, compileRest);
    result.registry.define(PatternType::Repetition, compileRepetition);
    result.registry.define(PatternType::Capture, compileSequenceCapture);
    return result;
  }();
  return definition;
}

} // namespace treepat
