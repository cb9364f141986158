#include <catch2/catch_all.hpp>

#include "text_normalizer.hpp"

#include <string>

TEST_CASE("normalizeText rewrites negative sign glyphs", "[normalize]") {
  REQUIRE(normalizeText("△1,234") == "-1234");
  REQUIRE(normalizeText("▲5") == "-5");
  REQUIRE(normalizeText("△") == "-");
}

TEST_CASE("normalizeText strips thousands separators", "[normalize]") {
  REQUIRE(normalizeText("1,234,567") == "1234567");
  REQUIRE(normalizeText("1，234") == "1234");
  REQUIRE(normalizeText("¥1,000百万円") == "¥1000百万円");
}

TEST_CASE("normalizeText turns parenthesized numerals negative", "[normalize]") {
  REQUIRE(normalizeText("(567)") == "-567");
  REQUIRE(normalizeText("(1,234.5)") == "-1234.5");

  // Only plain numerals qualify
  REQUIRE(normalizeText("(注1)") == "(注1)");
  REQUIRE(normalizeText("(a)") == "(a)");
  REQUIRE(normalizeText("(-5)") == "(-5)");
  REQUIRE(normalizeText("(12)%") == "(12)%");
  REQUIRE(normalizeText("()") == "()");
}

TEST_CASE("normalizeText leaves other text alone", "[normalize]") {
  REQUIRE(normalizeText("Revenue") == "Revenue");
  REQUIRE(normalizeText("12.3%") == "12.3%");
  REQUIRE(normalizeText("$45.00") == "$45.00");
  REQUIRE(normalizeText("") == "");
}

TEST_CASE("normalizeText is idempotent", "[normalize]") {
  for (const std::string raw : {"△1,234", "(567)", "1，234円", "Revenue", "(注1)", "-12.5%", "(((3)))"}) {
    std::string once = normalizeText(raw);
    REQUIRE(normalizeText(once) == once);
  }
}
