#pragma once

#include "compiler/compiledMatcher.hpp"
#include "compiler/compilerOptions.hpp"
#include "pattern/patternNode.hpp"

#include <string>

namespace treepat {

/**
 * NodePattern - pattern text parsed and compiled in one go
 *
 * @throws PatternSyntaxError or CompileError from the constructor
 */
class NodePattern {
public:
  explicit NodePattern(std::string source, CompilerOptions options = {});

  const std::string &source() const { return sourceData; }
  const PatternNode &pattern() const { return *patternData; }
  const CompiledMatcher &matcher() const { return matcherData; }

  MatchResult match(const Value &node) const {
    return matcherData.match(node);
  }
  MatchResult call(const Arguments &arguments) const {
    return matcherData.call(arguments);
  }

private:
  std::string sourceData;
  PatternNodePtr patternData;
  CompiledMatcher matcherData;
};

} // namespace treepat
