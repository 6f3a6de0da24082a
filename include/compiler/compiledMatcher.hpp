#pragma once

#include "compiler/fragment.hpp"

#include <map>
#include <string>
#include <variant>
#include <vector>

namespace treepat {

class Trace;

// A keyword argument: a value for node and %name parameters, a trace for the
// trace parameter of debug matchers
using Argument = std::variant<Value, Trace *>;
using Arguments = std::map<std::string, Argument>;

/**
 * MatchResult - outcome of one matcher run
 */
struct MatchResult {
  bool matched = false;
  // In capture order; empty unless matched
  ValueList captures;

  explicit operator bool() const { return matched; }
};

/**
 * CompiledMatcher - the executable result of compiling one pattern
 *
 * Immutable after construction. Every call runs on its own frame, so a single
 * matcher may be called any number of times.
 */
class CompiledMatcher {
public:
  CompiledMatcher(std::string code, Step root, size_t captureCount,
                  std::vector<std::string> parameters, bool traced)
      : codeData(std::move(code)), root(std::move(root)),
        captureCountData(captureCount),
        parameterNames(std::move(parameters)), tracedData(traced) {}

  // "node", then %name parameters in order of appearance, then "trace" if
  // the matcher is instrumented
  const std::vector<std::string> &parameters() const { return parameterNames; }

  const std::string &code() const { return codeData; }
  size_t captureCount() const { return captureCountData; }
  bool traced() const { return tracedData; }

  /**
   * Run the matcher
   * @param arguments exactly one entry per name in parameters()
   * @throws ArgumentError on a missing, unknown or mistyped argument
   */
  MatchResult call(const Arguments &arguments) const;

  MatchResult match(const Value &node) const;
  MatchResult match(const Value &node, Trace &trace) const;

  // Render the matcher as a lambda over its parameters
  std::string toString() const;

private:
  std::string codeData;
  Step root;
  size_t captureCountData;
  std::vector<std::string> parameterNames;
  bool tracedData;
};

} // namespace treepat
