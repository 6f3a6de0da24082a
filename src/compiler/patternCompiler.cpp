#include "compiler/patternCompiler.hpp"

#include "compiler/compileContext.hpp"
#include "compiler/debug/instrumentation.hpp"
#include "compiler/errors.hpp"
#include "compiler/subcompiler.hpp"

#include <llvm/Support/raw_ostream.h>

namespace treepat {

PatternCompiler::PatternCompiler(
    CompilerOptions options, std::shared_ptr<Instrumentation> instrumentation)
    : optionsData(std::move(options)), predicates(PredicateTable::builtins()),
      instrumentationData(std::move(instrumentation)),
      debug(optionsData.debug) {
  predicates.merge(optionsData.predicates);
}

CompiledMatcher PatternCompiler::compile(const PatternNode &pattern) const {
  const Definition &nodePattern = optionsData.nodePattern
                                      ? *optionsData.nodePattern
                                      : nodePatternDefinition();
  const Definition &sequence =
      optionsData.sequence ? *optionsData.sequence : sequenceDefinition();

  CompileContext context(predicates, nodePattern, sequence,
                         instrumentationData.get());
  log("compiling " + pattern.toString() + " with " + nodePattern.name);

  Fragment root;
  try {
    root = Subcompiler(context, nodePattern, "node").compile(pattern);
  } catch (const CompileError &error) {
    log(std::string("compile failed: ") + error.what());
    throw;
  }

  std::vector<std::string> parameters{"node"};
  parameters.insert(parameters.end(), context.parameters().begin(),
                    context.parameters().end());
  if (instrumentationData) {
    parameters.push_back("trace");
    log("assigned " + std::to_string(instrumentationData->nodeIds().size()) +
        " node identities");
  }

  return CompiledMatcher(std::move(root.code), std::move(root.step),
                         context.captureCount(), std::move(parameters),
                         instrumentationData != nullptr);
}

void PatternCompiler::log(const std::string &message) const {
  if (debug) {
    llvm::errs() << "[treepat] " << message << "\n";
  }
}

} // namespace treepat
