#pragma once

#include "compiler/fragment.hpp"
#include "pattern/patternNode.hpp"

#include <array>
#include <string>

namespace treepat {

class Subcompiler;

// Compiles one pattern node of the type it is registered for
using Handler = Fragment (*)(Subcompiler &compiler, const PatternNode &node);

/**
 * Registry - pattern type to handler mapping
 *
 * Types without a handler resolve to the registry's "missing" handler.
 * Copies are independent: derive() snapshots the mapping, and define() on the
 * snapshot never reaches the original.
 */
class Registry {
public:
  explicit Registry(Handler missing) : missing(missing) {}

  // Full independent copy, to be extended by a derived definition
  Registry derive() const { return *this; }

  // Insert or overwrite the handler for a type
  void define(PatternType type, Handler handler) {
    handlers[static_cast<size_t>(type)] = handler;
  }

  bool defines(PatternType type) const {
    return handlers[static_cast<size_t>(type)] != nullptr;
  }

  Handler lookup(PatternType type) const {
    Handler handler = handlers[static_cast<size_t>(type)];
    return handler ? handler : missing;
  }

  Handler missingHandler() const { return missing; }

private:
  std::array<Handler, patternTypeCount> handlers{};
  Handler missing;
};

/**
 * Definition - a named compiler definition and the registry it owns
 *
 * Definitions are built once and read-only afterwards; compilers only hold
 * pointers to them.
 */
struct Definition {
  std::string name;
  Registry registry;

  // New definition starting from a snapshot of this one's registry
  Definition derive(std::string derivedName) const {
    return Definition{std::move(derivedName), registry.derive()};
  }
};

// Fails compilation for a node whose type has no handler
[[noreturn]] Fragment onTypeMissing(Subcompiler &compiler,
                                    const PatternNode &node);

// Handlers for every construct except the sequence-only ones
const Definition &nodePatternDefinition();

// Derived from nodePatternDefinition(); compiles sequence terms
const Definition &sequenceDefinition();

} // namespace treepat
