#pragma once

#include "compiler/compiledMatcher.hpp"
#include "compiler/compilerOptions.hpp"
#include "pattern/patternNode.hpp"

#include <memory>
#include <string>

namespace treepat {

class Instrumentation;

/**
 * PatternCompiler - turns a pattern tree into a CompiledMatcher
 *
 * Compiles in a single top-down pass, dispatching every pattern node through
 * the registry of the active definition. With an Instrumentation attached,
 * every compiled node is wrapped to record into a Trace and the matcher takes
 * an extra "trace" argument.
 */
class PatternCompiler {
public:
  explicit PatternCompiler(
      CompilerOptions options = {},
      std::shared_ptr<Instrumentation> instrumentation = nullptr);
  virtual ~PatternCompiler() = default;

  /**
   * Compile a pattern. The matcher does not refer to the tree; identities
   * handed out by an instrumented compiler do.
   * @throws CompileError
   */
  CompiledMatcher compile(const PatternNode &pattern) const;

  const CompilerOptions &options() const { return optionsData; }

  void setDebug(bool enabled) { debug = enabled; }

protected:
  Instrumentation *instrumentation() const { return instrumentationData.get(); }

private:
  CompilerOptions optionsData;
  PredicateTable predicates;
  std::shared_ptr<Instrumentation> instrumentationData;
  bool debug;

  void log(const std::string &message) const;
};

} // namespace treepat
