#pragma once

#include <cstddef>
#include <string>

namespace treepat {

struct SourceLocation {
  size_t line{};
  size_t column{};
  std::string filename;
};

/**
 * Half-open byte range [begin, end) into a source text
 */
struct SourceRange {
  size_t begin{};
  size_t end{};

  size_t size() const { return end > begin ? end - begin : 0; }
  bool operator==(const SourceRange &other) const {
    return begin == other.begin && end == other.end;
  }
};

} // namespace treepat
