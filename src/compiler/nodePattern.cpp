#include "compiler/nodePattern.hpp"

#include "compiler/patternCompiler.hpp"
#include "pattern/patternParser.hpp"

namespace treepat {

NodePattern::NodePattern(std::string source, CompilerOptions options)
    : sourceData(std::move(source)),
      patternData(PatternParser(sourceData).parse()),
      matcherData(PatternCompiler(std::move(options)).compile(*patternData)) {}

} // namespace treepat
