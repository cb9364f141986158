#include "page_stream.hpp"

#include "layout.hpp"
#include "numeric_tagger.hpp"
#include "text_normalizer.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <stdexcept>
#include <string>
#include <utility>

namespace {

// Origins are truncated toward zero, not rounded.
long long truncated(double x) {
  return static_cast<long long>(x);
}

} // namespace

std::string pageHeader(int pageNumber, std::size_t columnCount) {
  return fmt::format("=== PAGE {} [Detected {} Columns] ===", pageNumber, columnCount);
}

std::string serializeRow(const Row& row,
                         const std::vector<double>& baselines,
                         const StreamOptions& options,
                         RunCounters& counters) {
  int rowId = counters.nextRow();
  std::string line = fmt::format("[r_{:03d}]<x:{:03d}> ", rowId, truncated(row.front().x0));

  for (const auto& t : row) {
    int col = columnIndex(t.x0, baselines, options.xTolerance, options.columnPolicy);
    std::string text = tagNumericText(normalizeText(t.text), options, counters);
    line += fmt::format("<col:{}, x:{:03d}> {} ", col, truncated(t.x0), text);
  }
  return line;
}

PageStream streamPage(const PageTokens& page, const StreamOptions& options, RunCounters& counters) {
  if (page.tokens.empty()) {
    throw std::invalid_argument("page " + std::to_string(page.pageNumber) + " has no tokens");
  }

  std::vector<Row> rows = groupRows(page.tokens, options.yTolerance, options.rowPolicy);

  std::vector<double> xStarts;
  xStarts.reserve(page.tokens.size());
  for (const auto& r : rows) {
    for (const auto& t : r) xStarts.push_back(t.x0);
  }
  std::vector<double> baselines = clusterCoordinates(xStarts, options.xTolerance, options.clusterPolicy);

  PageStream out;
  out.pageNumber = page.pageNumber;
  out.columnCount = baselines.size();
  out.text = pageHeader(page.pageNumber, baselines.size());

  const int valuesBefore = counters.values;
  for (const auto& r : rows) {
    if (r.empty()) continue;
    out.text += '\n';
    out.text += serializeRow(r, baselines, options, counters);
    out.rowCount++;
  }
  out.valueCount = static_cast<std::size_t>(counters.values - valuesBefore);

  spdlog::debug("Page {}: {} rows, {} columns, {} values",
                out.pageNumber, out.rowCount, out.columnCount, out.valueCount);
  return out;
}

std::string streamDocument(const std::vector<PageTokens>& pages,
                           const StreamOptions& options,
                           std::vector<PageStream>* summary) {
  RunCounters counters;
  std::string document;

  for (const auto& page : pages) {
    if (page.tokens.empty()) {
      spdlog::debug("Page {} has no tokens, skipping", page.pageNumber);
      continue;
    }
    PageStream ps = streamPage(page, options, counters);
    spdlog::info("Page {}: detected {} columns", ps.pageNumber, ps.columnCount);

    if (!document.empty()) document += "\n\n";
    document += ps.text;
    if (summary) summary->push_back(std::move(ps));
  }

  spdlog::debug("Document: {} rows, {} values", counters.rows, counters.values);
  return document;
}
