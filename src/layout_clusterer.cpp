#include "layout_clusterer.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace {

double median(std::vector<double> v) {
  if (v.empty()) return 0.0;
  std::nth_element(v.begin(), v.begin() + v.size()/2, v.end());
  return v[v.size()/2];
}

// Equal up to rounding noise in averaged centers.
bool nearlyEqual(double a, double b) {
  return std::abs(a - b) <= 1e-9 * std::max(1.0, std::max(std::abs(a), std::abs(b)));
}

} // namespace

double rowToleranceFor(const std::vector<TextFragment>& fragments, const LayoutOptions& options) {
  if (options.rowTolerance > 0) return options.rowTolerance;
  std::vector<double> heights;
  heights.reserve(fragments.size());
  for (const auto& f : fragments) heights.push_back(f.bbox.height());
  return std::max(options.minRowTolerance, median(heights) * options.rowToleranceFactor);
}

double columnToleranceFor(const std::vector<TextFragment>& fragments, const LayoutOptions& options) {
  if (options.columnTolerance > 0) return options.columnTolerance;
  std::vector<double> widths;
  widths.reserve(fragments.size());
  for (const auto& f : fragments) widths.push_back(f.bbox.width());
  return std::max(options.minColumnTolerance, median(widths) * options.columnToleranceFactor);
}

std::vector<RowCluster> clusterRows(const std::vector<TextFragment>& fragments,
                                    const LayoutOptions& options) {
  std::vector<RowCluster> rows;
  if (fragments.empty()) return rows;

  const double tol = rowToleranceFor(fragments, options);

  std::vector<size_t> order(fragments.size());
  std::iota(order.begin(), order.end(), size_t{0});
  std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
    double ya = fragments[a].bbox.yCenter();
    double yb = fragments[b].bbox.yCenter();
    if (ya == yb) return fragments[a].bbox.xMin < fragments[b].bbox.xMin;
    return ya < yb; // top to bottom
  });

  for (size_t idx : order) {
    double yc = fragments[idx].bbox.yCenter();

    // Cluster centers grow with the index, so only the trailing clusters can
    // be within reach. Walking backwards, equal distances move to the lower index.
    size_t best = rows.size();
    double bestDist = 0.0;
    for (size_t r = rows.size(); r-- > 0;) {
      double d = std::abs(yc - rows[r].yCenter);
      if (d > tol && !nearlyEqual(d, tol)) break;
      if (best == rows.size() || d < bestDist || nearlyEqual(d, bestDist)) {
        best = r;
        bestDist = d;
      }
    }

    if (best == rows.size()) {
      rows.push_back(RowCluster{yc, {}});
    }
    RowCluster& row = rows[best];
    row.fragments.push_back(idx);
    // running mean of member centers
    row.yCenter = (row.yCenter * (row.fragments.size() - 1) + yc) / row.fragments.size();
  }
  return rows;
}

std::vector<ColumnBand> clusterColumns(const std::vector<TextFragment>& fragments,
                                       const LayoutOptions& options) {
  if (fragments.empty()) return {ColumnBand{0.0, 0.0}};

  const double tol = columnToleranceFor(fragments, options);

  std::vector<ColumnBand> extents;
  extents.reserve(fragments.size());
  for (const auto& f : fragments) extents.push_back(ColumnBand{f.bbox.xMin, f.bbox.xMax});
  std::sort(extents.begin(), extents.end(), [](const ColumnBand& a, const ColumnBand& b) {
    if (a.xMin == b.xMin) return a.xMax < b.xMax;
    return a.xMin < b.xMin;
  });

  std::vector<ColumnBand> bands;
  bands.push_back(extents.front());
  for (size_t i = 1; i < extents.size(); ++i) {
    ColumnBand& cur = bands.back();
    double gap = extents[i].xMin - cur.xMax;
    if (gap < tol) {
      cur.xMax = std::max(cur.xMax, extents[i].xMax);
    } else {
      bands.push_back(extents[i]);
    }
  }
  return bands;
}

std::vector<double> columnBoundaries(const std::vector<ColumnBand>& bands) {
  std::vector<double> cuts;
  if (bands.empty()) return cuts;
  cuts.reserve(bands.size() + 1);
  cuts.push_back(bands.front().xMin);
  for (size_t i = 0; i + 1 < bands.size(); ++i) {
    cuts.push_back((bands[i].xMax + bands[i+1].xMin) * 0.5);
  }
  double right = bands.back().xMax;
  // zero-width last band would repeat the previous cut
  if (right <= cuts.back()) right = cuts.back() + 1.0;
  cuts.push_back(right);
  return cuts;
}

Layout clusterLayout(const std::vector<TextFragment>& fragments, const LayoutOptions& options) {
  Layout layout;
  layout.rows = clusterRows(fragments, options);
  layout.columns = clusterColumns(fragments, options);
  layout.boundaries = columnBoundaries(layout.columns);
  return layout;
}
