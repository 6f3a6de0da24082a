#pragma once

#include "compiler/diagnostic.hpp"
#include "compiler/subcompiler.hpp"

#include <string>

namespace treepat {

// nodePatternDefinition()
Fragment compileSequence(Subcompiler &compiler, const PatternNode &node);
Fragment compileNodeType(Subcompiler &compiler, const PatternNode &node);
Fragment compileWildcard(Subcompiler &compiler, const PatternNode &node);
Fragment compileLiteral(Subcompiler &compiler, const PatternNode &node);
Fragment compilePredicate(Subcompiler &compiler, const PatternNode &node);
Fragment compileCapture(Subcompiler &compiler, const PatternNode &node);
Fragment compileNegation(Subcompiler &compiler, const PatternNode &node);
Fragment compileUnion(Subcompiler &compiler, const PatternNode &node);
Fragment compileIntersection(Subcompiler &compiler, const PatternNode &node);
Fragment compileParameter(Subcompiler &compiler, const PatternNode &node);

// sequenceDefinition()
Fragment compileRest(Subcompiler &compiler, const PatternNode &node);
Fragment compileRepetition(Subcompiler &compiler, const PatternNode &node);
Fragment compileSequenceCapture(Subcompiler &compiler, const PatternNode &node);

// Diagnostic spanning the pattern text of `node`
Diagnostic diagnosticAt(const PatternNode &node, const std::string &message);

} // namespace treepat
