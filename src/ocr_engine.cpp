#include "ocr_engine.hpp"

#include "errors.hpp"
#include "process.hpp"

#include <cstdlib>
#include <sstream>
#include <string>
#include <unordered_map>
#include <utility>

namespace {

enum Field { kLevel, kLeft, kTop, kWidth, kHeight, kConf, kText, kFieldCount };

std::vector<std::string> splitTabs(const std::string& line) {
  std::vector<std::string> parts;
  size_t start = 0;
  while (true) {
    size_t tab = line.find('\t', start);
    if (tab == std::string::npos) {
      parts.push_back(line.substr(start));
      break;
    }
    parts.push_back(line.substr(start, tab - start));
    start = tab + 1;
  }
  return parts;
}

bool parseNumber(const std::string& s, double& out) {
  if (s.empty()) return false;
  char* end = nullptr;
  out = std::strtod(s.c_str(), &end);
  return end == s.c_str() + s.size();
}

} // namespace

std::vector<RawOcrItem> parseTesseractTsv(const std::string& tsv) {
  std::vector<RawOcrItem> items;

  // tesseract's fixed column order; replaced by the header when one is present
  size_t col[kFieldCount] = {0, 6, 7, 8, 9, 10, 11};

  std::istringstream in(tsv);
  std::string line;
  bool first = true;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.empty()) continue;
    std::vector<std::string> parts = splitTabs(line);

    if (first) {
      first = false;
      if (parts[0] == "level") {
        std::unordered_map<std::string, size_t> header;
        for (size_t i = 0; i < parts.size(); ++i) header[parts[i]] = i;
        const char* names[kFieldCount] = {"level", "left", "top", "width", "height", "conf", "text"};
        for (int f = 0; f < kFieldCount; ++f) {
          auto it = header.find(names[f]);
          if (it != header.end()) col[f] = it->second;
        }
        continue;
      }
    }

    if (parts.size() <= col[kConf]) continue;
    double level = 0, left = 0, top = 0, width = 0, height = 0, conf = 0;
    if (!parseNumber(parts[col[kLevel]], level) || level != 5) continue;
    if (!parseNumber(parts[col[kLeft]], left) || !parseNumber(parts[col[kTop]], top) ||
        !parseNumber(parts[col[kWidth]], width) || !parseNumber(parts[col[kHeight]], height) ||
        !parseNumber(parts[col[kConf]], conf)) {
      continue;
    }

    RawOcrItem item;
    item.text = col[kText] < parts.size() ? parts[col[kText]] : std::string();
    item.bbox.xMin = left;
    item.bbox.yMin = top;
    item.bbox.xMax = left + width;
    item.bbox.yMax = top + height;
    item.confidence = conf < 0 ? 0.0 : conf / 100.0;
    items.push_back(std::move(item));
  }
  return items;
}

std::vector<RawOcrItem> recognizeImage(const std::string& imagePath, const OcrOptions& options) {
  if (!commandExists("tesseract")) {
    throw OcrEngineError("tesseract not found; install tesseract-ocr");
  }
  std::string cmd = "tesseract " + shellQuote(imagePath) + " stdout";
  cmd += " --oem " + std::to_string(options.engineMode);
  cmd += " --psm " + std::to_string(options.pageSegMode);
  if (!options.language.empty()) cmd += " -l " + shellQuote(options.language);
  cmd += " tsv 2>/dev/null";

  CommandResult r = runCommand(cmd);
  if (r.exitCode != 0) {
    throw OcrEngineError("tesseract failed on " + imagePath + " (exit code " + std::to_string(r.exitCode) + ")");
  }
  return parseTesseractTsv(r.output);
}
