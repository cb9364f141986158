#pragma once

#include <string>
#include <vector>

// One word as delivered by the document parser: its text and the origin of its box.
struct Token {
  std::string text;
  double x0;
  double top;
};

// Tokens judged to share a text line, ordered left to right.
using Row = std::vector<Token>;

struct PageTokens {
  int pageNumber;
  std::vector<Token> tokens;
};

// Row and value identifiers handed out during one document run.
// Both start at zero and keep counting across pages.
struct RunCounters {
  int rows = 0;
  int values = 0;

  int nextRow() { return ++rows; }
  int nextValue() { return ++values; }
};
