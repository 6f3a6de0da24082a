#include "pattern/patternNode.hpp"

namespace treepat {

std::string PatternNode::toString() const {
  std::string result = "(" + std::string(patternTypeToString(type));
  switch (type) {
  case PatternType::NodeType:
  case PatternType::Predicate:
    result += " " + name;
    break;
  case PatternType::Parameter:
    result += " %" + name;
    break;
  case PatternType::Literal:
    result += " " + literal.toString();
    break;
  case PatternType::Repetition:
    result += " ";
    result += repetition;
    break;
  default:
    break;
  }
  for (const auto &child : children) {
    result += " " + child->toString();
  }
  return result + ")";
}

void PatternNode::eachNode(
    const std::function<void(const PatternNode &)> &visit) const {
  visit(*this);
  for (const auto &child : children) {
    child->eachNode(visit);
  }
}

bool isVariadic(const PatternNode &node) {
  switch (node.type) {
  case PatternType::Rest:
  case PatternType::Repetition:
    return true;
  case PatternType::Capture:
    return isVariadic(node.child(0));
  case PatternType::Union:
    for (const auto &branch : node.children) {
      if (isVariadic(*branch)) {
        return true;
      }
    }
    return false;
  default:
    return false;
  }
}

} // namespace treepat
