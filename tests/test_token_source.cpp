#include <catch2/catch_all.hpp>

#include "token_source.hpp"

#include <cstdio>
#include <sstream>
#include <stdexcept>
#include <string>

namespace {

const char* kBboxSample =
  "<!DOCTYPE html PUBLIC \"-//W3C//DTD XHTML 1.0 Transitional//EN\">\n"
  "<html xmlns=\"http://www.w3.org/1999/xhtml\">\n"
  "<head>\n<title>statement</title>\n</head>\n"
  "<body>\n<doc>\n"
  "  <page width=\"595.276000\" height=\"841.890000\">\n"
  "    <flow>\n      <block xMin=\"56.8\" yMin=\"57.2\" xMax=\"230.0\" yMax=\"69.2\">\n"
  "        <line xMin=\"56.8\" yMin=\"57.2\" xMax=\"230.0\" yMax=\"69.2\">\n"
  "          <word xMin=\"56.800000\" yMin=\"57.208000\" xMax=\"88.456000\" yMax=\"69.208000\">Revenue</word>\n"
  "          <word xMin=\"200.100000\" yMin=\"57.208000\" xMax=\"230.000000\" yMax=\"69.208000\">1,234</word>\n"
  "        </line>\n      </block>\n    </flow>\n"
  "  </page>\n"
  "  <page width=\"595.276000\" height=\"841.890000\">\n"
  "  </page>\n"
  "  <page width=\"595.276000\" height=\"841.890000\">\n"
  "    <word xMin=\"10.000000\" yMin=\"20.500000\" xMax=\"40.000000\" yMax=\"30.000000\">R&amp;D&#37;</word>\n"
  "  </page>\n"
  "</doc>\n</body>\n</html>\n";

} // namespace

TEST_CASE("parseBboxLayout reads words page by page", "[tokens][bbox]") {
  auto pages = parseBboxLayout(kBboxSample);

  REQUIRE(pages.size() == 3);
  REQUIRE(pages[0].pageNumber == 1);
  REQUIRE(pages[0].tokens.size() == 2);
  REQUIRE(pages[0].tokens[0].text == "Revenue");
  REQUIRE(pages[0].tokens[0].x0 == Catch::Approx(56.8));
  REQUIRE(pages[0].tokens[0].top == Catch::Approx(57.208));
  REQUIRE(pages[0].tokens[1].text == "1,234");

  // Pages without words are kept so numbering stays aligned
  REQUIRE(pages[1].pageNumber == 2);
  REQUIRE(pages[1].tokens.empty());

  REQUIRE(pages[2].pageNumber == 3);
  REQUIRE(pages[2].tokens.size() == 1);
  REQUIRE(pages[2].tokens[0].text == "R&D%");
}

TEST_CASE("parseBboxLayout numbers pages from the first requested page", "[tokens][bbox]") {
  auto pages = parseBboxLayout(kBboxSample, 5);
  REQUIRE(pages.size() == 3);
  REQUIRE(pages[0].pageNumber == 5);
  REQUIRE(pages[2].pageNumber == 7);

  REQUIRE(parseBboxLayout("<html><body><doc></doc></body></html>").empty());
}

TEST_CASE("parseTokenTsv groups tokens by page number", "[tokens][tsv]") {
  std::istringstream in(
    "# page\tx0\ttop\ttext\n"
    "3\t10\t100\tRevenue\n"
    "\n"
    "3\t200.5\t100\t1,234\r\n"
    "1\t12\t40\tNet sales\tFY2024\n");

  auto pages = parseTokenTsv(in);

  // Page 2 has no tokens and is left out; page numbers are kept as written
  REQUIRE(pages.size() == 2);
  REQUIRE(pages[0].pageNumber == 1);
  REQUIRE(pages[0].tokens.size() == 1);
  REQUIRE(pages[0].tokens[0].text == "Net sales\tFY2024");
  REQUIRE(pages[1].pageNumber == 3);
  REQUIRE(pages[1].tokens.size() == 2);
  REQUIRE(pages[1].tokens[1].text == "1,234");
  REQUIRE(pages[1].tokens[1].x0 == Catch::Approx(200.5));
}

TEST_CASE("parseTokenTsv stores a far page without padding", "[tokens][tsv]") {
  std::istringstream in("100000000\t1\t1\tx\n");
  auto pages = parseTokenTsv(in);
  REQUIRE(pages.size() == 1);
  REQUIRE(pages[0].pageNumber == 100000000);
  REQUIRE(pages[0].tokens.size() == 1);
}

TEST_CASE("parseTokenTsv rejects malformed lines", "[tokens][tsv]") {
  SECTION("missing fields") {
    std::istringstream in("1\t10\tRevenue\n");
    REQUIRE_THROWS_AS(parseTokenTsv(in), std::runtime_error);
  }
  SECTION("bad coordinate") {
    std::istringstream in("1\tten\t100\tRevenue\n");
    REQUIRE_THROWS_WITH(parseTokenTsv(in), Catch::Matchers::ContainsSubstring("line 1"));
  }
  SECTION("bad page") {
    std::istringstream in("0\t10\t100\tRevenue\n");
    REQUIRE_THROWS_AS(parseTokenTsv(in), std::runtime_error);
  }
  SECTION("page beyond int range") {
    std::istringstream in("3000000000\t1\t1\tx\n");
    REQUIRE_THROWS_WITH(parseTokenTsv(in), Catch::Matchers::ContainsSubstring("positive integer"));
  }
  SECTION("fractional page") {
    std::istringstream in("2.5\t1\t1\tx\n");
    REQUIRE_THROWS_AS(parseTokenTsv(in), std::runtime_error);
  }
}

TEST_CASE("readTokenFile reports a missing file", "[tokens][tsv]") {
  REQUIRE_THROWS_AS(readTokenFile("/nonexistent/tokens.tsv"), std::runtime_error);
}

TEST_CASE("shellQuote keeps a path as one literal shell word", "[tokens][pdf]") {
  REQUIRE(shellQuote("report.pdf") == "'report.pdf'");
  REQUIRE(shellQuote("") == "''");

  // Nothing inside single quotes is expanded; a quote closes, escapes and reopens
  REQUIRE(shellQuote("a$(touch x)`id`\"\\.pdf") == "'a$(touch x)`id`\"\\.pdf'");
  REQUIRE(shellQuote("it's.pdf") == "'it'\\''s.pdf'");
}

TEST_CASE("shellQuote round-trips through the shell", "[tokens][pdf]") {
  const std::string path = "/tmp/q1 $(echo hi) 'x' `id`.pdf";
  std::string cmd = "printf '%s' " + shellQuote(path);

  FILE* pipe = popen(cmd.c_str(), "r");
  REQUIRE(pipe != nullptr);
  std::string out;
  char buf[256];
  size_t n;
  while ((n = std::fread(buf, 1, sizeof(buf), pipe)) > 0) out.append(buf, n);
  REQUIRE(pclose(pipe) == 0);

  REQUIRE(out == path);
}
