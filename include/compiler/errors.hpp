#pragma once

#include "compiler/diagnostic.hpp"

#include <stdexcept>
#include <string>

namespace treepat {

/**
 * Base of every error treepat throws; carries the diagnostic it reports
 */
class TreepatError : public std::runtime_error {
public:
  explicit TreepatError(Diagnostic diagnostic)
      : std::runtime_error(diagnostic.toString()),
        diagnosticData(std::move(diagnostic)) {}

  const Diagnostic &diagnostic() const { return diagnosticData; }

private:
  Diagnostic diagnosticData;
};

// Malformed pattern text
class PatternSyntaxError : public TreepatError {
public:
  using TreepatError::TreepatError;
};

// Malformed sample source text
class SourceSyntaxError : public TreepatError {
public:
  using TreepatError::TreepatError;
};

// A pattern tree the compiler cannot turn into a matcher
class CompileError : public TreepatError {
public:
  using TreepatError::TreepatError;
};

// A compiled matcher called with the wrong parameter set
class ArgumentError : public TreepatError {
public:
  explicit ArgumentError(const std::string &message)
      : TreepatError(Diagnostic(message)) {}
};

} // namespace treepat
