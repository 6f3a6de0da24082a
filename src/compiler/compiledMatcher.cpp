#include "compiler/compiledMatcher.hpp"

#include "compiler/errors.hpp"

#include <algorithm>

namespace treepat {

MatchResult CompiledMatcher::call(const Arguments &arguments) const {
  for (const std::string &name : parameterNames) {
    if (arguments.find(name) == arguments.end()) {
      throw ArgumentError("missing keyword: " + name);
    }
  }

  MatchFrame frame;
  frame.captures.resize(captureCountData);
  Value subject;
  for (const auto &[name, argument] : arguments) {
    if (std::find(parameterNames.begin(), parameterNames.end(), name) ==
        parameterNames.end()) {
      throw ArgumentError("unknown keyword: " + name);
    }
    if (name == "trace") {
      Trace *const *trace = std::get_if<Trace *>(&argument);
      if (!trace || !*trace) {
        throw ArgumentError("keyword 'trace' expects a trace");
      }
      frame.trace = *trace;
      continue;
    }
    const Value *value = std::get_if<Value>(&argument);
    if (!value) {
      throw ArgumentError("keyword '" + name + "' expects a value");
    }
    if (name == "node") {
      subject = *value;
    } else {
      frame.arguments[name] = *value;
    }
  }

  ValueList elements{subject};
  MatchResult result;
  result.matched = root(frame, elements, 0,
                        [&](size_t end) { return end == elements.size(); });
  if (result.matched) {
    result.captures = std::move(frame.captures);
  }
  return result;
}

MatchResult CompiledMatcher::match(const Value &node) const {
  return call({{"node", node}});
}

MatchResult CompiledMatcher::match(const Value &node, Trace &trace) const {
  return call({{"node", node}, {"trace", &trace}});
}

std::string CompiledMatcher::toString() const {
  std::string signature;
  for (const std::string &name : parameterNames) {
    if (!signature.empty()) {
      signature += ", ";
    }
    signature += name;
  }
  return "lambda(" + signature + ") {\n  " + codeData + "\n}";
}

} // namespace treepat
