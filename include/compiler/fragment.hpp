#pragma once

#include "ast/value.hpp"

#include <llvm/ADT/STLExtras.h>

#include <functional>
#include <optional>
#include <string>
#include <unordered_map>

namespace treepat {

class Trace;

/**
 * MatchFrame - mutable state of one matcher run
 *
 * A fresh frame is built for every call of a compiled matcher, so compiled
 * fragments can be shared between runs.
 */
struct MatchFrame {
  ValueList captures;
  std::unordered_map<std::string, Value> arguments; // %name parameters
  Trace *trace = nullptr;                           // Debug matchers only
};

// Receives the position just past what a step consumed; returns whether the
// rest of the match succeeded from there
using Continuation = llvm::function_ref<bool(size_t)>;

/**
 * Executable part of a fragment
 *
 * Matches elements starting at `position` and, for every way it can match,
 * calls `next` with the end position until `next` accepts. Returns true once
 * `next` has returned true.
 */
using Step = std::function<bool(MatchFrame &frame, const ValueList &elements,
                                size_t position, Continuation next)>;

// Test of a single element
using Test = std::function<bool(MatchFrame &frame, const Value &value)>;

/**
 * How many elements a fragment consumes
 */
struct Arity {
  size_t min = 1;
  std::optional<size_t> max = 1; // nullopt = unbounded

  bool isSingle() const { return min == 1 && max == 1; }

  static Arity single() { return {}; }
  static Arity between(size_t min, std::optional<size_t> max) {
    return {min, max};
  }
};

/**
 * Fragment - what a handler emits for one pattern node
 *
 * Pairs the rendered matcher code with the step that executes it.
 */
struct Fragment {
  std::string code;
  Arity arity;
  Step step;

  // A fragment consuming exactly one element that passes `test`
  static Fragment single(std::string code, Test test);
};

} // namespace treepat
