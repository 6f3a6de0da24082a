#include "compiler/predicates.hpp"

namespace treepat {

static const std::string typeSuffix = "_type?";

PredicateTable PredicateTable::builtins() {
  PredicateTable table;
  table.define("nil?", [](const Value &value) { return value.isNil(); });
  table.define("true?", [](const Value &value) {
    return value.isBoolean() && value.asBoolean();
  });
  table.define("false?", [](const Value &value) {
    return value.isBoolean() && !value.asBoolean();
  });
  table.define("node?", [](const Value &value) { return value.isNode(); });
  table.define("sym?", [](const Value &value) { return value.isSymbol(); });
  table.define("str?", [](const Value &value) { return value.isString(); });
  table.define("int?", [](const Value &value) { return value.isInteger(); });
  table.define("float?", [](const Value &value) { return value.isFloat(); });
  table.define("array?", [](const Value &value) { return value.isList(); });
  table.define("literal?", [](const Value &value) {
    return !value.isNode() && !value.isList();
  });
  return table;
}

void PredicateTable::define(const std::string &name, Predicate predicate) {
  predicates[name] = std::move(predicate);
}

void PredicateTable::merge(const PredicateTable &other) {
  for (const auto &[name, predicate] : other.predicates) {
    predicates[name] = predicate;
  }
}

std::optional<Predicate> PredicateTable::find(const std::string &name) const {
  auto it = predicates.find(name);
  if (it != predicates.end()) {
    return it->second;
  }

  // send_type? and friends
  if (name.size() > typeSuffix.size() &&
      name.compare(name.size() - typeSuffix.size(), typeSuffix.size(),
                   typeSuffix) == 0) {
    std::string type = name.substr(0, name.size() - typeSuffix.size());
    return Predicate([type](const Value &value) {
      return value.isNode() && value.asNode()->type == type;
    });
  }
  return std::nullopt;
}

} // namespace treepat
