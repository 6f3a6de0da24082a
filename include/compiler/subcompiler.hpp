#pragma once

#include "compiler/compileContext.hpp"
#include "compiler/fragment.hpp"
#include "compiler/registry.hpp"

#include <string>

namespace treepat {

/**
 * Subcompiler - compiles pattern nodes under one definition
 *
 * `access` is the expression naming the value the compiled fragment tests,
 * e.g. "node" or "node.children[1]". It only feeds the rendered code.
 */
class Subcompiler {
public:
  Subcompiler(CompileContext &context, const Definition &definition,
              std::string access)
      : contextData(&context), definitionData(&definition),
        accessData(std::move(access)) {}

  // Dispatch `node` to the handler its type is registered to
  Fragment compile(const PatternNode &node);

  Subcompiler nodePattern(std::string access) const;
  Subcompiler sequence(std::string access) const;

  CompileContext &context() const { return *contextData; }
  const Definition &definition() const { return *definitionData; }
  const std::string &access() const { return accessData; }

private:
  CompileContext *contextData;
  const Definition *definitionData;
  std::string accessData;
};

} // namespace treepat
