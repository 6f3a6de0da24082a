#pragma once

#include "ast/sourceBuffer.hpp"
#include "compiler/compiledMatcher.hpp"
#include "compiler/debug/debugCompiler.hpp"
#include "trace/trace.hpp"
#include "visualizer/displayAttribute.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace treepat {

using Json = nlohmann::json;

class Colorizer;

/**
 * ColorizerResult - one traced run, ready to be rendered
 */
class ColorizerResult {
public:
  ColorizerResult(const Colorizer &colorizer, Trace trace,
                  MatchResult returned, SourceTree tree)
      : colorizerData(&colorizer), traceData(std::move(trace)),
        returnedData(std::move(returned)), treeData(std::move(tree)) {}

  const Colorizer &colorizer() const { return *colorizerData; }
  const Trace &trace() const { return traceData; }
  const MatchResult &returned() const { return returnedData; }
  const SourceTree &tree() const { return treeData; }

  // Every analyzed node, self-first depth-first pre-order, with its status
  std::vector<std::pair<const Node *, DisplayAttribute>> matchMap() const;

  DisplayAttribute status(const Node &node) const;

  /**
   * One attribute per character of the source buffer. Characters outside
   * every node range stay NotVisitable. Nodes are applied in matchMap()
   * order, so inner nodes overwrite their ancestors.
   */
  std::vector<DisplayAttribute> colorMap() const;

  Json toJson() const;

private:
  const Colorizer *colorizerData;
  Trace traceData;
  MatchResult returnedData;
  SourceTree treeData;
};

/**
 * Colorizer - debug-compiles a pattern and runs it against sample sources
 */
class Colorizer {
public:
  /**
   * @throws PatternSyntaxError or CompileError
   */
  explicit Colorizer(std::string pattern, CompilerOptions options = {});

  Colorizer(const Colorizer &) = delete;
  Colorizer &operator=(const Colorizer &) = delete;

  // Run with a fresh trace; the result refers back to this colorizer
  ColorizerResult test(SourceTree tree) const;

  // Parse `source` with SourceParser first
  ColorizerResult test(const std::string &source) const;

  const std::string &pattern() const { return patternSource; }
  const PatternNode &patternTree() const { return *patternData; }
  const CompiledMatcher &matcher() const { return matcherData; }
  const NodeIds &nodeIds() const { return compiler.nodeIds(); }

  void setDebug(bool enabled) { debug = enabled; }

private:
  std::string patternSource;
  PatternNodePtr patternData;
  DebugCompiler compiler;
  CompiledMatcher matcherData;
  bool debug;

  void log(const std::string &message) const;
};

} // namespace treepat
