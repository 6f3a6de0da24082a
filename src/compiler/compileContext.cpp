#include "compiler/compileContext.hpp"

#include "compiler/errors.hpp"

#include <algorithm>

namespace treepat {

size_t CompileContext::nextCaptureIndex() {
  size_t index = captureCounter++;
  capturesUsed = std::max(capturesUsed, captureCounter);
  return index;
}

void CompileContext::declareParameter(const PatternNode &node) {
  if (node.name == "node" || node.name == "trace") {
    throw CompileError(Diagnostic("parameter name '%" + node.name +
                                      "' is reserved",
                                  node.location, node.range.size()));
  }
  if (std::find(parameterNames.begin(), parameterNames.end(), node.name) ==
      parameterNames.end()) {
    parameterNames.push_back(node.name);
  }
}

} // namespace treepat
