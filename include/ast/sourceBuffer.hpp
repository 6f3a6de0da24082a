#pragma once

#include "ast/value.hpp"
#include "lexer/sourceLocation.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace treepat {

/**
 * SourceBuffer - the full text an analyzed tree was parsed from
 */
class SourceBuffer {
public:
  SourceBuffer(std::string name, std::string text);

  const std::string &name() const { return nameData; }
  const std::string &text() const { return textData; }
  size_t size() const { return textData.size(); }

  // 1-based line and column of a byte offset
  SourceLocation locationOf(size_t offset) const;

  // Text covered by a range, clamped to the buffer
  std::string_view slice(const SourceRange &range) const;

private:
  std::string nameData;
  std::string textData;
  // Offsets at which each line starts
  std::vector<size_t> lineStarts;
};

/**
 * SourceTree - an analyzed tree together with the buffer its ranges refer to
 */
struct SourceTree {
  std::shared_ptr<const SourceBuffer> buffer;
  NodePtr root;
};

} // namespace treepat
