#pragma once

#include "token.hpp"

#include <istream>
#include <string>
#include <vector>

// Extract word boxes by invoking `pdftotext -bbox-layout` and group them by page.
// Pages without words are kept with an empty token list.
// If lastPage < firstPage or lastPage == -1, processes until end.
// Throws std::runtime_error when pdftotext is missing or fails.
std::vector<PageTokens> extractTokensFromPdf(const std::string& pdfPath,
                                             int firstPage = 1,
                                             int lastPage = -1);

// Single-quote arg for /bin/sh, so the shell passes it through as one literal word.
std::string shellQuote(const std::string& arg);

// Parse the XHTML written by `pdftotext -bbox-layout`. Pages are numbered in order
// of appearance starting at firstPage; a word's xMin/yMin become x0/top.
std::vector<PageTokens> parseBboxLayout(const std::string& xhtml, int firstPage = 1);

// Read tokens from tab separated lines "page<TAB>x0<TAB>top<TAB>text".
// Blank lines and lines starting with '#' are skipped. Only pages that have tokens
// are returned, in ascending page order; each keeps its own page number.
// Throws std::runtime_error on a malformed line or a page outside 1..INT_MAX.
std::vector<PageTokens> parseTokenTsv(std::istream& in);
std::vector<PageTokens> readTokenFile(const std::string& path);
