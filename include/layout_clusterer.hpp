#pragma once

#include "fragment_extractor.hpp"

#include <cstddef>
#include <vector>

struct RowCluster {
  double yCenter = 0.0;
  std::vector<size_t> fragments; // indices into the fragment list
};

struct ColumnBand {
  double xMin = 0.0;
  double xMax = 0.0;

  double center() const { return (xMin + xMax) * 0.5; }
  bool contains(double x) const { return x >= xMin && x <= xMax; }
};

struct LayoutOptions {
  // Absolute tolerances in pixels; a value <= 0 means "derive from the page".
  double rowTolerance = 0.0;
  double columnTolerance = 0.0;

  double rowToleranceFactor = 0.6;    // x median fragment height
  double columnToleranceFactor = 0.2; // x median fragment width
  double minRowTolerance = 2.0;
  double minColumnTolerance = 2.0;
};

struct Layout {
  std::vector<RowCluster> rows;    // top to bottom
  std::vector<ColumnBand> columns; // left to right, never empty
  std::vector<double> boundaries;  // columns.size() + 1 strictly increasing cuts

  size_t rowCount() const { return rows.size(); }
  size_t columnCount() const { return columns.size(); }
};

// Groups fragments into rows by vertical center. Every fragment lands in
// exactly one cluster; equidistant fragments go to the earlier row.
std::vector<RowCluster> clusterRows(const std::vector<TextFragment>& fragments,
                                    const LayoutOptions& options = {});

// Interval-merges the horizontal extents of all fragments into column bands.
// Returns a single band when nothing can be separated.
std::vector<ColumnBand> clusterColumns(const std::vector<TextFragment>& fragments,
                                       const LayoutOptions& options = {});

std::vector<double> columnBoundaries(const std::vector<ColumnBand>& bands);

Layout clusterLayout(const std::vector<TextFragment>& fragments,
                     const LayoutOptions& options = {});

double rowToleranceFor(const std::vector<TextFragment>& fragments, const LayoutOptions& options);
double columnToleranceFor(const std::vector<TextFragment>& fragments, const LayoutOptions& options);
