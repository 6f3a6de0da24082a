#pragma once

#include "compiler/predicates.hpp"
#include "pattern/patternNode.hpp"

#include <string>
#include <vector>

namespace treepat {

struct Definition;
class Instrumentation;

/**
 * CompileContext - state shared by every subcompiler of one compilation
 *
 * Built fresh for each top-level compile, so a failed compilation leaves
 * nothing behind for the next one.
 */
class CompileContext {
public:
  CompileContext(const PredicateTable &predicates,
                 const Definition &nodePattern, const Definition &sequence,
                 Instrumentation *instrumentation = nullptr)
      : predicatesData(predicates), nodePatternData(nodePattern),
        sequenceData(sequence), instrumentationData(instrumentation) {}

  CompileContext(const CompileContext &) = delete;
  CompileContext &operator=(const CompileContext &) = delete;

  /**
   * Makes `node` the current node for the lifetime of the scope and restores
   * the previous one on exit, including exits by exception.
   */
  class NodeScope {
  public:
    NodeScope(CompileContext &context, const PatternNode &node)
        : context(context), previous(context.current) {
      context.current = &node;
    }
    ~NodeScope() { context.current = previous; }

    NodeScope(const NodeScope &) = delete;
    NodeScope &operator=(const NodeScope &) = delete;

  private:
    CompileContext &context;
    const PatternNode *previous;
  };

  // Node being compiled; nullptr outside any compile call
  const PatternNode *currentNode() const { return current; }

  // Captures are numbered in the order their '$' appears in the pattern
  size_t nextCaptureIndex();
  size_t captureIndex() const { return captureCounter; }
  void rewindCaptures(size_t index) { captureCounter = index; }
  size_t captureCount() const { return capturesUsed; }

  // Registers a %name parameter; repeated names share one argument
  void declareParameter(const PatternNode &node);
  const std::vector<std::string> &parameters() const { return parameterNames; }

  const PredicateTable &predicates() const { return predicatesData; }
  const Definition &nodePatternDefinition() const { return nodePatternData; }
  const Definition &sequenceDefinition() const { return sequenceData; }
  Instrumentation *instrumentation() const { return instrumentationData; }

private:
  const PredicateTable &predicatesData;
  const Definition &nodePatternData;
  const Definition &sequenceData;
  Instrumentation *instrumentationData;

  const PatternNode *current = nullptr;
  size_t captureCounter = 0;
  size_t capturesUsed = 0;
  std::vector<std::string> parameterNames;
};

} // namespace treepat
