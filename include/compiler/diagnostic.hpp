#pragma once

#include "lexer/sourceLocation.hpp"

#include <string>
#include <utility>

namespace treepat {

/**
 * Diagnostic - a message about a position in pattern or source text
 */
struct Diagnostic {
  std::string message;
  std::string filePath;
  size_t line;
  size_t column;    // 1-based start column
  size_t endLine;   // 1-based end line
  size_t endColumn; // 1-based column just past the end

  explicit Diagnostic(std::string msg)
      : message(std::move(msg)), line(0), column(0), endLine(0), endColumn(0) {}

  Diagnostic(std::string msg, const SourceLocation &location,
             size_t length = 1)
      : message(std::move(msg)), filePath(location.filename),
        line(location.line), column(location.column), endLine(location.line),
        endColumn(location.column + length) {}

  // "Error at file:line:column: message", or "Error: message" without a
  // position
  std::string toString() const {
    if (line == 0) {
      return "Error: " + message;
    }
    std::string text = "Error at ";
    text += filePath.empty() ? "line " + std::to_string(line)
                             : filePath + ":" + std::to_string(line) + ":" +
                                   std::to_string(column);
    return text + ": " + message;
  }
};

} // namespace treepat
