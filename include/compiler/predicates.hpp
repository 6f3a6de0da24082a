#pragma once

#include "ast/value.hpp"

#include <functional>
#include <optional>
#include <string>
#include <unordered_map>

namespace treepat {

using Predicate = std::function<bool(const Value &value)>;

/**
 * PredicateTable - named predicates available to `name?` patterns
 *
 * Names include the trailing '?'. Any `<type>_type?` name resolves to a
 * node type test without being defined.
 */
class PredicateTable {
public:
  PredicateTable() = default;

  // nil? true? false? node? sym? str? int? float? array? literal?
  static PredicateTable builtins();

  // Insert or overwrite a predicate
  void define(const std::string &name, Predicate predicate);

  // Define every predicate of `other`, overwriting on conflict
  void merge(const PredicateTable &other);

  std::optional<Predicate> find(const std::string &name) const;

  bool empty() const { return predicates.empty(); }

private:
  std::unordered_map<std::string, Predicate> predicates;
};

} // namespace treepat
