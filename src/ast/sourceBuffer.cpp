#include "ast/sourceBuffer.hpp"

#include <algorithm>

namespace treepat {

SourceBuffer::SourceBuffer(std::string name, std::string text)
    : nameData(std::move(name)), textData(std::move(text)) {
  lineStarts.push_back(0);
  for (size_t offset = 0; offset < textData.size(); ++offset) {
    if (textData[offset] == '\n') {
      lineStarts.push_back(offset + 1);
    }
  }
}

SourceLocation SourceBuffer::locationOf(size_t offset) const {
  auto next = std::upper_bound(lineStarts.begin(), lineStarts.end(), offset);
  size_t line = static_cast<size_t>(next - lineStarts.begin());
  size_t column = offset - lineStarts[line - 1] + 1;
  return {line, column, nameData};
}

std::string_view SourceBuffer::slice(const SourceRange &range) const {
  size_t begin = std::min(range.begin, textData.size());
  size_t end = std::min(std::max(range.end, begin), textData.size());
  return std::string_view(textData).substr(begin, end - begin);
}

} // namespace treepat
