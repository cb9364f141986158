#include "layout.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <utility>

namespace {

void closeRow(std::vector<Row>& rows, Row& current) {
  if (current.empty()) return;
  std::stable_sort(current.begin(), current.end(), [](const Token& a, const Token& b) {
    return a.x0 < b.x0;
  });
  rows.push_back(std::move(current));
  current.clear();
}

std::vector<double> clusterByAnchor(const std::vector<double>& sorted, double tol) {
  std::vector<double> baselines{sorted.front()};
  for (size_t i = 1; i < sorted.size(); ++i) {
    // A value more than tol past the last seed opens a new column; anything
    // closer is absorbed and discarded, only the seed is kept.
    if (sorted[i] > baselines.back() + tol) {
      baselines.push_back(sorted[i]);
    }
  }
  return baselines;
}

std::vector<double> clusterByCentroid(const std::vector<double>& sorted, double tol) {
  std::vector<double> baselines;
  double acc = sorted.front();
  int count = 1;
  for (size_t i = 1; i < sorted.size(); ++i) {
    if (sorted[i] > acc / count + tol) {
      baselines.push_back(acc / count);
      acc = sorted[i]; count = 1;
    } else {
      acc += sorted[i]; count++;
    }
  }
  baselines.push_back(acc / count);
  return baselines;
}

} // namespace

std::vector<Row> groupRows(std::vector<Token> tokens, double yTolerance, RowPolicy policy) {
  std::vector<Row> rows;
  if (tokens.empty()) return rows;

  std::stable_sort(tokens.begin(), tokens.end(), [](const Token& a, const Token& b) {
    if (a.top == b.top) return a.x0 < b.x0;
    return a.top < b.top;
  });

  Row current;
  double reference = tokens.front().top;
  for (auto& t : tokens) {
    if (std::abs(t.top - reference) <= yTolerance) {
      current.push_back(std::move(t));
      if (policy == RowPolicy::RunningMean) {
        reference += (current.back().top - reference) / current.size();
      }
    } else {
      closeRow(rows, current);
      reference = t.top;
      current.push_back(std::move(t));
    }
  }
  closeRow(rows, current);
  return rows;
}

std::vector<double> clusterCoordinates(std::vector<double> coords, double xTolerance, ClusterPolicy policy) {
  if (coords.empty()) return {};
  std::sort(coords.begin(), coords.end());
  if (policy == ClusterPolicy::Centroid) return clusterByCentroid(coords, xTolerance);
  return clusterByAnchor(coords, xTolerance);
}

int columnIndex(double x, const std::vector<double>& baselines, double xTolerance, ColumnPolicy policy) {
  if (baselines.empty()) return 1;

  if (policy == ColumnPolicy::Nearest) {
    size_t bestIdx = 0;
    double bestDist = std::abs(x - baselines[0]);
    for (size_t c = 1; c < baselines.size(); ++c) {
      double d = std::abs(x - baselines[c]);
      if (d < bestDist) { bestDist = d; bestIdx = c; }
    }
    return static_cast<int>(bestIdx) + 1;
  }

  // First match in baseline order, not the closest one.
  for (size_t c = 0; c < baselines.size(); ++c) {
    if (std::abs(x - baselines[c]) <= xTolerance) return static_cast<int>(c) + 1;
  }
  return 1;
}
