#pragma once

#include "compiler/predicates.hpp"

namespace treepat {

struct Definition;

/**
 * Options for a PatternCompiler
 */
struct CompilerOptions {
  // Definition for node positions; nullptr = nodePatternDefinition()
  const Definition *nodePattern = nullptr;
  // Definition for sequence terms; nullptr = sequenceDefinition()
  const Definition *sequence = nullptr;
  // Predicates added to (or overriding) the built-in ones
  PredicateTable predicates;
  // Write compile progress to stderr
  bool debug = false;
};

} // namespace treepat
