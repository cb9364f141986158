#include "stream_options.hpp"

#include <cctype>
#include <stdexcept>
#include <string>

NumericPolicy parseNumericPolicy(const std::string& name) {
  if (name == "embedded") return NumericPolicy::Embedded;
  if (name == "whole") return NumericPolicy::WholeToken;
  throw std::invalid_argument("unknown numeric policy '" + name + "' (expected embedded or whole)");
}

ColumnPolicy parseColumnPolicy(const std::string& name) {
  if (name == "first") return ColumnPolicy::FirstMatch;
  if (name == "nearest") return ColumnPolicy::Nearest;
  throw std::invalid_argument("unknown column policy '" + name + "' (expected first or nearest)");
}

ClusterPolicy parseClusterPolicy(const std::string& name) {
  if (name == "anchor") return ClusterPolicy::Anchor;
  if (name == "centroid") return ClusterPolicy::Centroid;
  throw std::invalid_argument("unknown cluster policy '" + name + "' (expected anchor or centroid)");
}

RowPolicy parseRowPolicy(const std::string& name) {
  if (name == "first") return RowPolicy::FirstMember;
  if (name == "mean") return RowPolicy::RunningMean;
  throw std::invalid_argument("unknown row policy '" + name + "' (expected first or mean)");
}

void validateOptions(const StreamOptions& options) {
  if (!(options.xTolerance >= 0.0)) {
    throw std::invalid_argument("x tolerance must be non-negative");
  }
  if (!(options.yTolerance >= 0.0)) {
    throw std::invalid_argument("y tolerance must be non-negative");
  }
  // The mask lands inside <v_NNN:payload>, so it must not look like a digit or
  // like the marker's own delimiters.
  const char c = options.maskChar;
  if (std::isdigit(static_cast<unsigned char>(c)) || std::isspace(static_cast<unsigned char>(c))
      || c == '<' || c == '>' || c == ':' || c == '\0') {
    throw std::invalid_argument("mask character must not be a digit, whitespace, '<', '>' or ':'");
  }
}
