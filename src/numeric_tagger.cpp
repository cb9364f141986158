#include "numeric_tagger.hpp"

#include <fmt/format.h>

#include <regex>
#include <string>

namespace {

// Byte patterns for the UTF-8 forms the documents use. A fullwidth digit is
// EF BC 90..99; the alternation keeps every match aligned on a character start.
const std::string kSign = "(?:-|\xE2\x96\xB3|\xE2\x96\xB2)";
const std::string kFullwidthDigit =
  "\xEF\xBC(?:\x90|\x91|\x92|\x93|\x94|\x95|\x96|\x97|\x98|\x99)";
const std::string kDigit = "(?:[0-9]|" + kFullwidthDigit + ")";
const std::string kSeparator = "(?:[.,]|\xEF\xBC\x8C)";
const std::string kPercent = "(?:%|\xEF\xBC\x85)";

const std::regex& embeddedPattern() {
  static const std::regex re(
    kSign + "?" + kDigit + "+(?:" + kSeparator + kDigit + "+)*" + kPercent + "?");
  return re;
}

const std::regex& wholeTokenPattern() {
  static const std::regex re("-?[0-9]+(?:\\.[0-9]+)?");
  return re;
}

bool isFullwidthDigitAt(const std::string& s, size_t i) {
  return i + 2 < s.size()
    && static_cast<unsigned char>(s[i]) == 0xEF
    && static_cast<unsigned char>(s[i + 1]) == 0xBC
    && static_cast<unsigned char>(s[i + 2]) >= 0x90
    && static_cast<unsigned char>(s[i + 2]) <= 0x99;
}

std::string stripSeparators(const std::string& in) {
  std::string out;
  out.reserve(in.size());
  for (size_t i = 0; i < in.size(); ++i) {
    if (in[i] == ',') continue;
    if (in.compare(i, 3, "\xEF\xBC\x8C") == 0) { i += 2; continue; }
    out.push_back(in[i]);
  }
  return out;
}

} // namespace

std::vector<NumericSpan> findNumericSpans(const std::string& text, NumericPolicy policy) {
  std::vector<NumericSpan> spans;

  if (policy == NumericPolicy::WholeToken) {
    if (std::regex_match(text, wholeTokenPattern())) {
      spans.push_back(NumericSpan{0, text.size(), text});
    }
    return spans;
  }

  auto begin = std::sregex_iterator(text.begin(), text.end(), embeddedPattern());
  auto end = std::sregex_iterator();
  for (auto it = begin; it != end; ++it) {
    spans.push_back(NumericSpan{
      static_cast<std::size_t>(it->position()),
      static_cast<std::size_t>(it->length()),
      stripSeparators(it->str())});
  }
  return spans;
}

std::string maskValue(const std::string& value, NumericPolicy policy, char maskChar) {
  if (policy == NumericPolicy::WholeToken) return "NUMERIC";

  // One mask character per digit so the digit count survives.
  std::string out;
  out.reserve(value.size());
  for (size_t i = 0; i < value.size(); ++i) {
    if (value[i] >= '0' && value[i] <= '9') {
      out.push_back(maskChar);
    } else if (isFullwidthDigitAt(value, i)) {
      out.push_back(maskChar);
      i += 2;
    } else {
      out.push_back(value[i]);
    }
  }
  return out;
}

std::string tagNumericText(const std::string& text, const StreamOptions& options, RunCounters& counters) {
  std::vector<NumericSpan> spans = findNumericSpans(text, options.numericPolicy);
  if (spans.empty()) return text;

  std::string out;
  size_t pos = 0;
  for (const auto& span : spans) {
    out.append(text, pos, span.offset - pos);
    int id = counters.nextValue();
    const std::string payload = options.maskNumbers
      ? maskValue(span.value, options.numericPolicy, options.maskChar)
      : span.value;
    out += fmt::format("<v_{:03d}:{}>", id, payload);
    pos = span.offset + span.length;
  }
  out.append(text, pos, std::string::npos);
  return out;
}
