#include "grid_assembler.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

size_t columnIndexFor(double x, const std::vector<ColumnBand>& bands) {
  for (size_t c = 0; c < bands.size(); ++c) {
    if (bands[c].contains(x)) return c;
  }
  // in a gap or outside the page's bands: nearest center, strict '<' keeps the left one
  size_t bestIdx = 0;
  double bestDist = bands.empty() ? 0.0 : std::abs(x - bands[0].center());
  for (size_t c = 1; c < bands.size(); ++c) {
    double d = std::abs(x - bands[c].center());
    if (d < bestDist) { bestDist = d; bestIdx = c; }
  }
  return bestIdx;
}

Grid assembleGrid(const std::vector<TextFragment>& fragments, const Layout& layout) {
  Grid grid;
  grid.columnCount = std::max<size_t>(1, layout.columnCount());
  grid.rows.reserve(layout.rowCount());

  for (const auto& r : layout.rows) {
    std::vector<size_t> members = r.fragments;
    // reading order inside the row decides how shared cells are joined
    std::sort(members.begin(), members.end(), [&](size_t a, size_t b) {
      const BoundingBox& ba = fragments[a].bbox;
      const BoundingBox& bb = fragments[b].bbox;
      if (ba.xMin != bb.xMin) return ba.xMin < bb.xMin;
      if (ba.yMin != bb.yMin) return ba.yMin < bb.yMin;
      return a < b;
    });

    std::vector<std::string> row(grid.columnCount);
    for (size_t idx : members) {
      const TextFragment& f = fragments[idx];
      size_t col = columnIndexFor(f.bbox.xCenter(), layout.columns);
      if (col >= row.size()) col = row.size() - 1;
      if (!row[col].empty()) row[col] += ' ';
      row[col] += f.text;
    }
    grid.rows.push_back(std::move(row));
  }
  return grid;
}

bool isDegenerateGrid(const Grid& grid) {
  if (grid.rows.empty()) return true;
  if (grid.rows.size() == 1 && grid.columnCount <= 1) return true;
  for (const auto& row : grid.rows) {
    for (const auto& cell : row) {
      if (!cell.empty()) return false;
    }
  }
  return true;
}
