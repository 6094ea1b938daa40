#include "fragment_extractor.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <utility>

std::string trimText(const std::string& s) {
  size_t a = 0, b = s.size();
  while (a < b && std::isspace(static_cast<unsigned char>(s[a]))) a++;
  while (b > a && std::isspace(static_cast<unsigned char>(s[b-1]))) b--;
  return s.substr(a, b - a);
}

std::vector<TextFragment> extractFragments(const std::vector<RawOcrItem>& items,
                                           const ExtractOptions& options) {
  std::vector<TextFragment> fragments;
  fragments.reserve(items.size());
  for (const auto& item : items) {
    std::string text = trimText(item.text);
    if (text.empty()) continue;

    double conf = std::min(1.0, std::max(0.0, item.confidence));
    // 0 is "unknown", never filtered
    if (conf > 0.0 && conf < options.minConfidence) continue;

    TextFragment f;
    f.text = std::move(text);
    f.bbox.xMin = std::min(item.bbox.xMin, item.bbox.xMax);
    f.bbox.xMax = std::max(item.bbox.xMin, item.bbox.xMax);
    f.bbox.yMin = std::min(item.bbox.yMin, item.bbox.yMax);
    f.bbox.yMax = std::max(item.bbox.yMin, item.bbox.yMax);
    f.confidence = conf;
    fragments.push_back(std::move(f));
  }
  return fragments;
}
