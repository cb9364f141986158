#pragma once

#include "stream_options.hpp"
#include "token.hpp"

#include <cstddef>
#include <string>
#include <vector>

struct NumericSpan {
  std::size_t offset;  // byte offset into the scanned text
  std::size_t length;  // byte length of the match
  std::string value;   // matched text without thousands separators
};

// Numeric matches in text, in order of appearance. Does not touch any counter.
std::vector<NumericSpan> findNumericSpans(const std::string& text, NumericPolicy policy);

// Payload shown for a value when masking is on.
// WholeToken: "NUMERIC". Embedded: every digit replaced by maskChar.
std::string maskValue(const std::string& value, NumericPolicy policy, char maskChar);

// Replace every numeric span with <v_NNN:payload>, taking one id per span from
// counters in left to right order.
std::string tagNumericText(const std::string& text,
                           const StreamOptions& options,
                           RunCounters& counters);
