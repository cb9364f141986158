#pragma once

#include "stream_options.hpp"
#include "token.hpp"

#include <cstddef>
#include <string>
#include <vector>

struct PageStream {
  int pageNumber = 0;
  std::size_t rowCount = 0;
  std::size_t columnCount = 0;
  std::size_t valueCount = 0;
  std::string text;  // page header followed by one line per row
};

// "=== PAGE n [Detected k Columns] ==="
std::string pageHeader(int pageNumber, std::size_t columnCount);

// One output line: row marker followed by a fragment per token.
std::string serializeRow(const Row& row,
                         const std::vector<double>& baselines,
                         const StreamOptions& options,
                         RunCounters& counters);

// Stream a single page. The page must have at least one token;
// throws std::invalid_argument otherwise.
PageStream streamPage(const PageTokens& page, const StreamOptions& options, RunCounters& counters);

// Stream a whole document with fresh counters. Pages without tokens are skipped.
// When summary is given it receives one entry per emitted page.
std::string streamDocument(const std::vector<PageTokens>& pages,
                           const StreamOptions& options,
                           std::vector<PageStream>* summary = nullptr);
