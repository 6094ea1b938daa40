#pragma once

#include "fragment_extractor.hpp"
#include "layout_clusterer.hpp"

#include <cstddef>
#include <string>
#include <vector>

struct Grid {
  std::vector<std::vector<std::string>> rows;
  size_t columnCount = 0;

  bool empty() const { return rows.empty(); }
};

// Index of the band containing x, otherwise the band with the nearest center
// (ties go left).
size_t columnIndexFor(double x, const std::vector<ColumnBand>& bands);

// Places every fragment in its cell. Rows follow the layout's row order and
// every row has layout.columnCount() cells.
Grid assembleGrid(const std::vector<TextFragment>& fragments, const Layout& layout);

// True for grids with no table structure: no rows, a single cell, or only
// empty cells.
bool isDegenerateGrid(const Grid& grid);
