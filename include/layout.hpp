#pragma once

#include "stream_options.hpp"
#include "token.hpp"

#include <vector>

// Group a page's tokens into rows, top to bottom, each row sorted by x0.
// Tokens are ordered by (top, x0) first; a token joins the current row while its
// top is within yTolerance of the row's reference. With RowPolicy::FirstMember the
// reference is the top of the row's first token and is only reset when a new row
// starts. An empty input yields no rows.
std::vector<Row> groupRows(std::vector<Token> tokens,
                           double yTolerance,
                           RowPolicy policy = RowPolicy::FirstMember);

// Greedy 1-D clustering of x origins into ascending baselines.
std::vector<double> clusterCoordinates(std::vector<double> coords,
                                       double xTolerance,
                                       ClusterPolicy policy = ClusterPolicy::Anchor);

// 1-based column of x among the baselines. Returns 1 when no baseline qualifies
// or baselines is empty.
int columnIndex(double x,
                const std::vector<double>& baselines,
                double xTolerance,
                ColumnPolicy policy = ColumnPolicy::FirstMatch);
