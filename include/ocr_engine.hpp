#pragma once

#include "fragment_extractor.hpp"

#include <string>
#include <vector>

struct OcrOptions {
  std::string language = "eng";
  int pageSegMode = 6;  // one uniform block of text
  int engineMode = 3;   // default engine
};

// Parses `tesseract ... tsv` output. Only word-level rows (level 5) become
// items; bbox is left/top/width/height converted to corners and confidence is
// scaled to [0,1] with tesseract's -1 mapped to 0.
std::vector<RawOcrItem> parseTesseractTsv(const std::string& tsv);

// Runs the tesseract CLI on one image.
// Throws OcrEngineError if tesseract is not installed or fails.
std::vector<RawOcrItem> recognizeImage(const std::string& imagePath, const OcrOptions& options = {});
