#include "text_normalizer.hpp"

#include <regex>
#include <string>

namespace {

const std::string kWhiteTriangle = "\xE2\x96\xB3";  // U+25B3
const std::string kBlackTriangle = "\xE2\x96\xB2";  // U+25B2
const std::string kFullwidthComma = "\xEF\xBC\x8C"; // U+FF0C

void replaceAll(std::string& s, const std::string& from, const std::string& to) {
  size_t pos = 0;
  while ((pos = s.find(from, pos)) != std::string::npos) {
    s.replace(pos, from.size(), to);
    pos += to.size();
  }
}

} // namespace

std::string normalizeText(const std::string& text) {
  std::string t = text;
  replaceAll(t, kWhiteTriangle, "-");
  replaceAll(t, kBlackTriangle, "-");
  replaceAll(t, ",", "");
  replaceAll(t, kFullwidthComma, "");

  static const std::regex parenthesized("^\\(([0-9]+(?:\\.[0-9]+)?)\\)$");
  std::smatch m;
  if (std::regex_match(t, m, parenthesized)) {
    t = "-" + m[1].str();
  }
  return t;
}
