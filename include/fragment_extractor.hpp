#pragma once

#include <string>
#include <vector>

struct BoundingBox {
  double xMin = 0.0;
  double yMin = 0.0;
  double xMax = 0.0;
  double yMax = 0.0;

  double width() const { return xMax - xMin; }
  double height() const { return yMax - yMin; }
  double xCenter() const { return (xMin + xMax) * 0.5; }
  double yCenter() const { return (yMin + yMax) * 0.5; }
};

// One recognized text unit as reported by the OCR engine, before cleanup.
// confidence is in [0,1]; 0 means the engine did not report one.
struct RawOcrItem {
  std::string text;
  BoundingBox bbox;
  double confidence = 0.0;
};

struct TextFragment {
  std::string text;
  BoundingBox bbox;
  double confidence = 0.0;
};

struct ExtractOptions {
  // Fragments with a known confidence below this are dropped.
  double minConfidence = 0.0;
};

// Normalizes raw OCR output into fragments: trims text, drops blank items and
// low-confidence items, fixes swapped box corners. Input order is kept.
std::vector<TextFragment> extractFragments(const std::vector<RawOcrItem>& items,
                                           const ExtractOptions& options = {});

std::string trimText(const std::string& s);
