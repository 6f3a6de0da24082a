#include "compiler/errors.hpp"
#include "handlers.h"

#include <algorithm>
#include <memory>

namespace treepat {

// Runs the term steps of a sequence from `index` on, requiring the last one to
// end exactly at the end of `items`
static bool matchTerms(MatchFrame &frame, const std::vector<Step> &steps,
                       size_t index, const ValueList &items, size_t position) {
  if (index == steps.size()) {
    return position == items.size();
  }
  return steps[index](frame, items, position, [&](size_t end) {
    return matchTerms(frame, steps, index + 1, items, end);
  });
}

/**
 * Access expression of every term of a sequence; term 0 is the head.
 * Terms before the first variadic term index children from the front, terms
 * after the last one index from the back. Anything in between has no fixed
 * position.
 */
static std::vector<std::string> termAccesses(const PatternNode &node,
                                             const std::string &access) {
  size_t count = node.children.size();
  size_t firstVariadic = count;
  size_t lastVariadic = 0;
  for (size_t index = 1; index < count; ++index) {
    if (isVariadic(node.child(index))) {
      firstVariadic = std::min(firstVariadic, index);
      lastVariadic = index;
    }
  }

  std::vector<std::string> accesses{access};
  for (size_t index = 1; index < count; ++index) {
    if (index < firstVariadic) {
      accesses.push_back(access + ".children[" + std::to_string(index - 1) +
                         "]");
    } else if (index > lastVariadic) {
      accesses.push_back(access + ".children[-" +
                         std::to_string(count - index) + "]");
    } else {
      accesses.push_back(access + ".children[*]");
    }
  }
  return accesses;
}

Fragment compileSequence(Subcompiler &compiler, const PatternNode &node) {
  std::vector<std::string> accesses = termAccesses(node, compiler.access());

  auto steps = std::make_shared<std::vector<Step>>();
  std::string terms;
  size_t min = 0;
  std::optional<size_t> max = 0;
  for (size_t index = 0; index < node.children.size(); ++index) {
    // The head tests the node itself, the remaining terms its children
    Fragment term =
        index == 0
            ? compiler.nodePattern(accesses[0]).compile(node.child(0))
            : compiler.sequence(accesses[index]).compile(node.child(index));

    min += term.arity.min;
    if (max && term.arity.max) {
      *max += *term.arity.max;
    } else {
      max = std::nullopt;
    }
    terms += " && " + term.code;
    steps->push_back(std::move(term.step));
  }

  const std::string &access = compiler.access();
  std::string sizeCheck =
      max ? access + ".children.size == " + std::to_string(*max - 1)
          : access + ".children.size >= " + std::to_string(min - 1);

  Fragment fragment;
  fragment.code = "(" + access + ".node? && " + sizeCheck + terms + ")";
  fragment.arity = Arity::single();
  fragment.step = [steps, min, max](MatchFrame &frame,
                                    const ValueList &elements, size_t position,
                                    Continuation next) {
    if (position >= elements.size() || !elements[position].isNode()) {
      return false;
    }
    const Node &subject = *elements[position].asNode();

    ValueList items;
    items.reserve(subject.children.size() + 1);
    items.push_back(elements[position]);
    items.insert(items.end(), subject.children.begin(), subject.children.end());
    if (items.size() < min || (max && items.size() > *max)) {
      return false;
    }

    if (!matchTerms(frame, *steps, 0, items, 0)) {
      return false;
    }
    return next(position + 1);
  };
  return fragment;
}

Fragment compileNodeType(Subcompiler &compiler, const PatternNode &node) {
  std::string type = node.name;
  return Fragment::single(compiler.access() + "." + type + "_type?",
                          [type](MatchFrame &, const Value &value) {
                            return value.isNode() &&
                                   value.asNode()->type == type;
                          });
}

Fragment compileWildcard(Subcompiler &, const PatternNode &) {
  return Fragment::single("true",
                          [](MatchFrame &, const Value &) { return true; });
}

Fragment compileLiteral(Subcompiler &compiler, const PatternNode &node) {
  Value literal = node.literal;
  return Fragment::single(compiler.access() + " == " + literal.toString(),
                          [literal](MatchFrame &, const Value &value) {
                            return value == literal;
                          });
}

Fragment compilePredicate(Subcompiler &compiler, const PatternNode &node) {
  std::optional<Predicate> predicate =
      compiler.context().predicates().find(node.name);
  if (!predicate) {
    throw CompileError(
        diagnosticAt(node, "unknown predicate '" + node.name + "'"));
  }
  return Fragment::single(compiler.access() + "." + node.name,
                          [test = std::move(*predicate)](MatchFrame &,
                                                         const Value &value) {
                            return test(value);
                          });
}

Fragment compileParameter(Subcompiler &compiler, const PatternNode &node) {
  compiler.context().declareParameter(node);
  std::string name = node.name;
  return Fragment::single(compiler.access() + " == %" + name,
                          [name](MatchFrame &frame, const Value &value) {
                            auto it = frame.arguments.find(name);
                            return it != frame.arguments.end() &&
                                   it->second == value;
                          });
}

Fragment compileCapture(Subcompiler &compiler, const PatternNode &node) {
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
      frame.captures[index] = elements[position];
      return next(end);
    });
  };
  return fragment;
}

Fragment compileNegation(Subcompiler &compiler, const PatternNode &node) {
  Fragment inner =
      compiler.nodePattern(compiler.access()).compile(node.child(0));

  Fragment fragment;
  fragment.code = "!(" + inner.code + ")";
  fragment.arity = Arity::single();
  fragment.step = [step = std::move(inner.step)](MatchFrame &frame,
                                                 const ValueList &elements,
                                                 size_t position,
                                                 Continuation next) {
    if (position >= elements.size() ||
        step(frame, elements, position, [](size_t) { return true; })) {
      return false;
    }
    return next(position + 1);
  };
  return fragment;
}

Fragment compileUnion(Subcompiler &compiler, const PatternNode &node) {
  CompileContext &context = compiler.context();
  size_t start = context.captureIndex();
  std::optional<size_t> end;

  std::vector<Step> steps;
  std::string code;
  Arity arity;
  for (size_t index = 0; index < node.children.size(); ++index) {
    // Every branch fills the same capture slots
    context.rewindCaptures(start);
    Fragment branch = compiler.compile(node.child(index));
    if (!end) {
      end = context.captureIndex();
    } else if (*end != context.captureIndex()) {
      throw CompileError(diagnosticAt(
          node, "union branches must capture the same number of values"));
    }

    if (index == 0) {
      arity = branch.arity;
    } else {
      arity.min = std::min(arity.min, branch.arity.min);
      if (arity.max && branch.arity.max) {
        arity.max = std::max(*arity.max, *branch.arity.max);
      } else {
        arity.max = std::nullopt;
      }
      code += " || ";
    }
    code += branch.code;
    steps.push_back(std::move(branch.step));
  }
  context.rewindCaptures(*end);

  Fragment fragment;
  fragment.code = "(" + code + ")";
  fragment.arity = arity;
  fragment.step = [steps = std::move(steps)](MatchFrame &frame,
                                             const ValueList &elements,
                                             size_t position,
                                             Continuation next) {
    for (const Step &step : steps) {
      if (step(frame, elements, position, next)) {
        return true;
      }
    }
    return false;
  };
  return fragment;
}

Fragment compileIntersection(Subcompiler &compiler, const PatternNode &node) {
  Subcompiler single = compiler.nodePattern(compiler.access());

  std::vector<Step> steps;
  std::string code;
  for (const auto &child : node.children) {
    Fragment term = single.compile(*child);
    if (!code.empty()) {
      code += " && ";
    }
    code += term.code;
    steps.push_back(std::move(term.step));
  }

  Fragment fragment;
  fragment.code = "(" + code + ")";
  fragment.arity = Arity::single();
  fragment.step = [steps = std::move(steps)](MatchFrame &frame,
                                             const ValueList &elements,
                                             size_t position,
                                             Continuation next) {
    if (position >= elements.size()) {
      return false;
    }
    for (const Step &step : steps) {
      if (!step(frame, elements, position, [](size_t) { return true; })) {
        return false;
      }
    }
    return next(position + 1);
  };
  return fragment;
}

} // namespace treepat
