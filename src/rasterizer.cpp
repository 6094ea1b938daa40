#include "rasterizer.hpp"

#include "errors.hpp"
#include "process.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <stdexcept>
#include <system_error>
#include <unistd.h>
#include <utility>

namespace fs = std::filesystem;

ScratchDir::ScratchDir() {
  static std::atomic<unsigned> counter{0};
  auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
  fs::path base = fs::temp_directory_path();
  for (int attempt = 0; attempt < 100; ++attempt) {
    fs::path candidate = base / ("ocrtable-" + std::to_string(::getpid()) + "-" +
                                 std::to_string(stamp) + "-" + std::to_string(counter++));
    if (fs::create_directory(candidate)) {
      path_ = candidate.string();
      return;
    }
  }
  throw std::runtime_error("Cannot create scratch directory in " + base.string());
}

ScratchDir::~ScratchDir() { remove(); }

ScratchDir::ScratchDir(ScratchDir&& other) noexcept : path_(std::move(other.path_)) {
  other.path_.clear();
}

ScratchDir& ScratchDir::operator=(ScratchDir&& other) noexcept {
  if (this != &other) {
    remove();
    path_ = std::move(other.path_);
    other.path_.clear();
  }
  return *this;
}

void ScratchDir::remove() noexcept {
  if (path_.empty()) return;
  std::error_code ec;
  fs::remove_all(path_, ec);
  path_.clear();
}

std::vector<std::string> listPageImages(const std::string& dir, const std::string& prefix) {
  std::vector<std::pair<long, std::string>> found;
  const std::string head = prefix + "-";
  for (const auto& entry : fs::directory_iterator(dir)) {
    if (!entry.is_regular_file()) continue;
    std::string name = entry.path().filename().string();
    if (name.size() <= head.size() + 4 || name.compare(0, head.size(), head) != 0) continue;
    if (entry.path().extension() != ".png") continue;
    std::string digits = name.substr(head.size(), name.size() - head.size() - 4);
    if (digits.empty() || !std::all_of(digits.begin(), digits.end(),
                                       [](unsigned char c) { return std::isdigit(c); })) {
      continue;
    }
    found.emplace_back(std::stol(digits), entry.path().string());
  }
  std::sort(found.begin(), found.end());

  std::vector<std::string> pages;
  pages.reserve(found.size());
  for (auto& f : found) pages.push_back(std::move(f.second));
  return pages;
}

RasterizedPdf rasterizePdf(const std::string& pdfPath, int dpi) {
  if (!commandExists("pdftoppm")) {
    throw RasterizeError("pdftoppm not found; install poppler-utils");
  }
  RasterizedPdf result;
  const std::string prefix = "page";
  std::string cmd = "pdftoppm -q -r " + std::to_string(dpi) + " -png " + shellQuote(pdfPath) +
                    " " + shellQuote((fs::path(result.dir.path()) / prefix).string());

  CommandResult r = runCommand(cmd);
  if (r.exitCode != 0) {
    throw RasterizeError("pdftoppm failed on " + pdfPath + " (exit code " + std::to_string(r.exitCode) + ")");
  }
  result.pages = listPageImages(result.dir.path(), prefix);
  if (result.pages.empty()) {
    throw RasterizeError("pdftoppm produced no pages for " + pdfPath);
  }
  return result;
}
