#pragma once

#include <string>

// How numbers are found inside a token.
enum class NumericPolicy {
  Embedded,   // every numeric substring, surrounding text kept
  WholeToken  // only tokens that are a plain signed integer or decimal
};

// How a token's x origin is mapped to a baseline.
enum class ColumnPolicy {
  FirstMatch,  // first baseline within tolerance, else column 1
  Nearest      // closest baseline, ties to the lower index
};

// How x origins are clustered into baselines.
enum class ClusterPolicy {
  Anchor,   // compare against the last accepted baseline, keep cluster seeds
  Centroid  // compare against the running mean, report the mean
};

// What a row's vertical reference is while grouping.
enum class RowPolicy {
  FirstMember,  // top of the row's first token
  RunningMean   // mean top of the tokens collected so far
};

struct StreamOptions {
  double xTolerance = 20.0;
  double yTolerance = 3.0;
  bool maskNumbers = false;
  char maskChar = 'X';
  NumericPolicy numericPolicy = NumericPolicy::Embedded;
  ColumnPolicy columnPolicy = ColumnPolicy::FirstMatch;
  ClusterPolicy clusterPolicy = ClusterPolicy::Anchor;
  RowPolicy rowPolicy = RowPolicy::FirstMember;
};

// Policy names as accepted on the command line.
// Each throws std::invalid_argument for an unknown name.
NumericPolicy parseNumericPolicy(const std::string& name);
ColumnPolicy parseColumnPolicy(const std::string& name);
ClusterPolicy parseClusterPolicy(const std::string& name);
RowPolicy parseRowPolicy(const std::string& name);

// Throws std::invalid_argument when a tolerance is negative or the mask
// character is a digit, whitespace, '<', '>' or ':'.
void validateOptions(const StreamOptions& options);
