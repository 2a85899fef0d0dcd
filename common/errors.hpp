#pragma once

#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace postmatch {

class MatchingError : public std::runtime_error {
public:
  explicit MatchingError(const std::string &message)
      : std::runtime_error(message) {}
};

// Malformed shape or type of an argument.
class SchemaError : public MatchingError {
public:
  explicit SchemaError(const std::string &message)
      : MatchingError("Schema error: " + message) {}
};

// Value outside of its allowed domain.
class DomainError : public MatchingError {
public:
  explicit DomainError(const std::string &message)
      : MatchingError("Domain error: " + message) {}
};

// Mismatch between parallel arguments, or between a parameter record and the
// imputation set it describes.
class ConsistencyError : public MatchingError {
public:
  explicit ConsistencyError(const std::string &message)
      : MatchingError("Consistency error: " + message) {}
};

// No common donor/recipient pool, or an uncovered match-variable value.
class DataCoverageError : public MatchingError {
public:
  explicit DataCoverageError(const std::string &message)
      : MatchingError("Data coverage error: " + message) {}
};

// Configuration that is structurally unmatchable.
class StateError : public MatchingError {
public:
  explicit StateError(const std::string &message)
      : MatchingError("State error: " + message) {}
};

class IOError : public MatchingError {
public:
  explicit IOError(const std::string &message)
      : MatchingError("IO error: " + message) {}
};

/**
 * @brief Formats a column group as "(2, 3, 4)" for error and log messages.
 */
inline std::string format_group(const std::vector<int> &group) {
  std::ostringstream out;
  out << "(";
  for (size_t i = 0; i < group.size(); ++i) {
    if (i > 0)
      out << ", ";
    out << group[i];
  }
  out << ")";
  return out.str();
}

} // namespace postmatch
