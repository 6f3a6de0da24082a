#pragma once

#include "compiler/debug/instrumentation.hpp"
#include "compiler/patternCompiler.hpp"

namespace treepat {

/**
 * DebugCompiler - a PatternCompiler with instrumentation attached
 *
 * Identities accumulate over every pattern this compiler compiles; use one
 * debug compiler per pattern.
 */
class DebugCompiler : public PatternCompiler {
public:
  explicit DebugCompiler(CompilerOptions options = {});

  const NodeIds &nodeIds() const { return instrumentation()->nodeIds(); }
};

} // namespace treepat
