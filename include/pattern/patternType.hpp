#pragma once

#include <cstddef>
#include <string_view>

namespace treepat {

/**
 * Pattern node type tag
 * The compiler dispatches on this tag through its definition's registry.
 */
enum class PatternType {
  Sequence,     // (send nil? :foo)
  NodeType,     // send
  Wildcard,     // _
  Literal,      // :foo 42 1.5 "str"
  Predicate,    // nil?
  Capture,      // $pattern
  Negation,     // !pattern
  Union,        // {a b}
  Intersection, // [a b]
  Parameter,    // %name
  Rest,         // ... (sequence terms only)
  Repetition,   // pattern* pattern+ pattern? (sequence terms only)
  Count
};

constexpr size_t patternTypeCount = static_cast<size_t>(PatternType::Count);

constexpr std::string_view patternTypeToString(PatternType type) {
  switch (type) {
  case PatternType::Sequence:
    return "sequence";
  case PatternType::NodeType:
    return "node_type";
  case PatternType::Wildcard:
    return "wildcard";
  case PatternType::Literal:
    return "literal";
  case PatternType::Predicate:
    return "predicate";
  case PatternType::Capture:
    return "capture";
  case PatternType::Negation:
    return "negation";
  case PatternType::Union:
    return "union";
  case PatternType::Intersection:
    return "intersection";
  case PatternType::Parameter:
    return "parameter";
  case PatternType::Rest:
    return "rest";
  case PatternType::Repetition:
    return "repetition";
  default:
    return "unknown";
  }
}

} // namespace treepat
