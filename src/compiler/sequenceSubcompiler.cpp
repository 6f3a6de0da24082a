#include "handlers.h"

#include <string>

namespace treepat {

Fragment compileRest(Subcompiler &, const PatternNode &) {
  Fragment fragment;
  fragment.code = "true";
  fragment.arity = Arity::between(0, std::nullopt);
  // Longest run first
  fragment.step = [](MatchFrame &, const ValueList &elements, size_t position,
                     Continuation next) {
    for (size_t end = elements.size(); end >= position; --end) {
      if (next(end)) {
        return true;
      }
      if (end == position) {
        break;
      }
    }
    return false;
  };
  return fragment;
}

// Greedy: tries one more repetition before settling for `count`
static bool repeat(MatchFrame &frame, const Step &step,
                   const ValueList &elements, size_t position, size_t count,
                   const Arity &arity, Continuation next) {
  if ((!arity.max || count < *arity.max) && position < elements.size()) {
    bool matched = step(frame, elements, position, [&](size_t end) {
      return repeat(frame, step, elements, end, count + 1, arity, next);
    });
    if (matched) {
      return true;
    }
  }
  return count >= arity.min && next(position);
}

Fragment compileRepetition(Subcompiler &compiler, const PatternNode &node) {
  Fragment inner =
      compiler.nodePattern(compiler.access()).compile(node.child(0));

  Arity arity;
  switch (node.repetition) {
  case '*':
    arity = Arity::between(0, std::nullopt);
    break;
  case '+':
    arity = Arity::between(1, std::nullopt);
    break;
  default: // '?'
    arity = Arity::between(0, 1);
    break;
  }

  Fragment fragment;
  fragment.code = "(" + inner.code + ")" + node.repetition;
  fragment.arity = arity;
  fragment.step = [arity, step = std::move(inner.step)](
                      MatchFrame &frame, const ValueList &elements,
                      size_t position, Continuation next) {
    return repeat(frame, step, elements, position, 0, arity, next);
  };
  return fragment;
}

/**
 * Capture of a sequence term. A term consuming exactly one element captures
 * that element; a variadic term captures the list of elements it consumed.
 */
Fragment compileSequenceCapture(Subcompiler &compiler,
                                const PatternNode &node) {
  if (!isVariadic(node.child(0))) {
    return compileCapture(compiler, node);
  }

  size_t index = compiler.context().nextCaptureIndex();
  Fragment inner = compiler.compile(node.child(0));

  Fragment fragment;
  fragment.code = "(captures[" + std::to_string(index) +
                  "] = " + compiler.access() + ") && " + inner.code;
  fragment.arity = inner.arity;
  fragment.step = [index, step = std::move(inner.step)](
                      MatchFrame &frame, const ValueList &elements,
                      size_t position, Continuation next) {
    return step(frame, elements, position, [&](size_t end) {
      frame.captures[index] = Value::list(
          ValueList(elements.begin() + position, elements.begin() + end));
      return next(end);
    });
  };
  return fragment;
}

} // namespace treepat
