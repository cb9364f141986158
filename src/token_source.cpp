#include "token_source.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <map>
#include <regex>
#include <stdexcept>
#include <string>

namespace {

std::string decodeEntities(const std::string& in) {
  std::string out;
  out.reserve(in.size());
  for (size_t i = 0; i < in.size(); ++i) {
    if (in[i] == '&') {
      size_t j = in.find(';', i + 1);
      if (j != std::string::npos) {
        std::string ent = in.substr(i + 1, j - (i + 1));
        std::string rep;
        if (ent == "amp") rep = "&";
        else if (ent == "lt") rep = "<";
        else if (ent == "gt") rep = ">";
        else if (ent == "quot") rep = "\"";
        else if (ent == "apos") rep = "'";
        else if (ent.size() > 1 && ent[0] == '#') {
          bool hex = ent[1] == 'x' || ent[1] == 'X';
          std::string digits = ent.substr(hex ? 2 : 1);
          char* endp = nullptr;
          unsigned long code = std::strtoul(digits.c_str(), &endp, hex ? 16 : 10);
          if (!digits.empty() && *endp == '\0' && code > 0 && code <= 0x7F) {
            rep.push_back(static_cast<char>(code));
          }
        }
        if (!rep.empty()) {
          out += rep; i = j; continue;
        }
      }
    }
    out.push_back(in[i]);
  }
  return out;
}

bool commandExists(const std::string& command) {
  std::string test = "command -v " + command + " >/dev/null 2>&1";
  return std::system(test.c_str()) == 0;
}

std::string runPdftotextBboxLayout(const std::string& pdfPath, int firstPage, int lastPage) {
  if (!commandExists("pdftotext")) {
    throw std::runtime_error("pdftotext not found; install poppler-utils");
  }
  std::string cmd = "pdftotext -bbox-layout";
  if (firstPage > 0) {
    cmd += " -f " + std::to_string(firstPage);
  }
  if (lastPage > 0 && lastPage >= firstPage) {
    cmd += " -l " + std::to_string(lastPage);
  }
  cmd += " -q " + shellQuote(pdfPath) + " -";
  spdlog::debug("Running: {}", cmd);

  FILE* pipe = popen(cmd.c_str(), "r");
  if (!pipe) throw std::runtime_error("Failed to run pdftotext -bbox-layout");
  std::string out;
  char buf[8192];
  size_t n;
  while ((n = std::fread(buf, 1, sizeof(buf), pipe)) > 0) {
    out.append(buf, n);
  }
  int rc = pclose(pipe);
  if (rc != 0) throw std::runtime_error("pdftotext -bbox-layout returned error");
  return out;
}

double parseNumber(const std::string& field, const char* what, int lineNo) {
  char* endp = nullptr;
  errno = 0;
  double v = std::strtod(field.c_str(), &endp);
  if (field.empty() || *endp != '\0' || errno == ERANGE || !std::isfinite(v)) {
    throw std::runtime_error("line " + std::to_string(lineNo) + ": invalid " + what + " '" + field + "'");
  }
  return v;
}

} // namespace

std::string shellQuote(const std::string& arg) {
  std::string out = "'";
  for (char ch : arg) {
    if (ch == '\'') out += "'\\''";
    else out.push_back(ch);
  }
  out += "'";
  return out;
}

std::vector<PageTokens> parseBboxLayout(const std::string& xhtml, int firstPage) {
  std::vector<PageTokens> pages;
  // Either a page opening tag or a complete word element.
  std::regex itemRe(
    "(<page(?:\\s[^>]*)?>)"
    "|<word[^>]*?xMin=\"([-0-9.eE+]+)\"[^>]*?yMin=\"([-0-9.eE+]+)\"[^>]*>([^<]*)</word>");

  int nextPage = firstPage;
  auto begin = std::sregex_iterator(xhtml.begin(), xhtml.end(), itemRe);
  auto end = std::sregex_iterator();
  for (auto it = begin; it != end; ++it) {
    const std::smatch& m = *it;
    if (m[1].matched) {
      pages.push_back(PageTokens{nextPage++, {}});
      continue;
    }
    if (pages.empty()) {
      // Words outside any page element belong to the first page.
      pages.push_back(PageTokens{nextPage++, {}});
    }
    Token t;
    t.x0 = std::stod(m[2].str());
    t.top = std::stod(m[3].str());
    t.text = decodeEntities(m[4].str());
    pages.back().tokens.push_back(std::move(t));
  }
  return pages;
}

std::vector<PageTokens> extractTokensFromPdf(const std::string& pdfPath, int firstPage, int lastPage) {
  std::string xhtml = runPdftotextBboxLayout(pdfPath, firstPage, lastPage);
  std::vector<PageTokens> pages = parseBboxLayout(xhtml, firstPage > 0 ? firstPage : 1);

  size_t tokenCount = 0;
  for (const auto& p : pages) tokenCount += p.tokens.size();
  spdlog::info("Read {} word(s) on {} page(s) from '{}'", tokenCount, pages.size(), pdfPath);
  return pages;
}

std::vector<PageTokens> parseTokenTsv(std::istream& in) {
  std::map<int, PageTokens> pages;
  std::string line;
  int lineNo = 0;
  while (std::getline(in, line)) {
    lineNo++;
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.empty() || line[0] == '#') continue;

    size_t a = line.find('\t');
    size_t b = a == std::string::npos ? a : line.find('\t', a + 1);
    size_t c = b == std::string::npos ? b : line.find('\t', b + 1);
    if (c == std::string::npos) {
      throw std::runtime_error("line " + std::to_string(lineNo) + ": expected page, x0, top and text");
    }

    double page = parseNumber(line.substr(0, a), "page", lineNo);
    if (page < 1 || page > std::numeric_limits<int>::max() || page != std::floor(page)) {
      throw std::runtime_error("line " + std::to_string(lineNo) + ": page must be a positive integer");
    }
    int pageNo = static_cast<int>(page);
    Token t;
    t.x0 = parseNumber(line.substr(a + 1, b - a - 1), "x0", lineNo);
    t.top = parseNumber(line.substr(b + 1, c - b - 1), "top", lineNo);
    t.text = line.substr(c + 1);

    auto it = pages.find(pageNo);
    if (it == pages.end()) it = pages.emplace(pageNo, PageTokens{pageNo, {}}).first;
    it->second.tokens.push_back(std::move(t));
  }

  std::vector<PageTokens> out;
  out.reserve(pages.size());
  for (auto& kv : pages) out.push_back(std::move(kv.second));
  return out;
}

std::vector<PageTokens> readTokenFile(const std::string& path) {
  std::ifstream ifs(path);
  if (!ifs) {
    throw std::runtime_error("Cannot open token file '" + path + "'");
  }
  std::vector<PageTokens> pages = parseTokenTsv(ifs);
  spdlog::info("Read {} page(s) from '{}'", pages.size(), path);
  return pages;
}
