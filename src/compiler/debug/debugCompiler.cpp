#include "compiler/debug/debugCompiler.hpp"

namespace treepat {

DebugCompiler::DebugCompiler(CompilerOptions options)
    : PatternCompiler(std::move(options),
                      std::make_shared<Instrumentation>()) {}

} // namespace treepat
