#pragma once

#include <optional>
#include <string_view>

namespace treepat {

// How a source character is shown after a traced run
enum class DisplayAttribute {
  NotVisitable, // no pattern position ever examined it
  NotVisited,   // a pattern position governs it but was never reached
  Failed,
  Matched,
};

constexpr std::string_view displayAttributeToString(DisplayAttribute attribute) {
  switch (attribute) {
  case DisplayAttribute::NotVisitable:
    return "not_visitable";
  case DisplayAttribute::NotVisited:
    return "not_visited";
  case DisplayAttribute::Failed:
    return "failed";
  case DisplayAttribute::Matched:
    return "matched";
  }
  return "not_visitable";
}

// Trace status (nullopt = never entered) to display attribute
constexpr DisplayAttribute displayAttributeFor(std::optional<bool> matched) {
  if (!matched) {
    return DisplayAttribute::NotVisited;
  }
  return *matched ? DisplayAttribute::Matched : DisplayAttribute::Failed;
}

} // namespace treepat
