#include "converter.hpp"

#include "errors.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <ostream>
#include <stdexcept>

namespace fs = std::filesystem;

ConverterBackends defaultBackends() {
  ConverterBackends b;
  b.recognize = [](const std::string& imagePath, const OcrOptions& options) {
    return recognizeImage(imagePath, options);
  };
  b.rasterize = [](const std::string& pdfPath, int dpi) {
    return rasterizePdf(pdfPath, dpi);
  };
  return b;
}

InputKind classifyInput(const std::string& path) {
  std::string ext = fs::path(path).extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (ext == ".pdf") return InputKind::Pdf;
  if (ext == ".jpg" || ext == ".jpeg" || ext == ".png") return InputKind::Image;
  return InputKind::Unsupported;
}

std::string outputFileName(const std::string& inputPath, int pageNumber) {
  std::string stem = fs::path(inputPath).stem().string();
  if (pageNumber > 0) return stem + "_page" + std::to_string(pageNumber) + ".csv";
  return stem + ".csv";
}

Grid buildGrid(const std::vector<RawOcrItem>& items, const ConverterConfig& config) {
  std::vector<TextFragment> fragments = extractFragments(items, config.extract);
  Layout layout = clusterLayout(fragments, config.layout);
  return assembleGrid(fragments, layout);
}

std::string ocrItemsToCsv(const std::vector<RawOcrItem>& items, const ConverterConfig& config) {
  return toCsv(buildGrid(items, config), config.csv);
}

std::vector<PageTable> extractPageTables(const std::string& inputPath, const ConverterConfig& config,
                                         const ConverterBackends& backends) {
  std::vector<PageTable> tables;
  auto recognizePage = [&](const std::string& imagePath, int pageNumber) {
    PageTable t;
    t.pageNumber = pageNumber;
    t.grid = buildGrid(backends.recognize(imagePath, config.ocr), config);
    t.degenerate = isDegenerateGrid(t.grid);
    tables.push_back(std::move(t));
  };

  switch (classifyInput(inputPath)) {
  case InputKind::Pdf: {
    RasterizedPdf pdf = backends.rasterize(inputPath, config.dpi);
    for (size_t i = 0; i < pdf.pages.size(); ++i) {
      recognizePage(pdf.pages[i], static_cast<int>(i + 1));
    }
    break;
  }
  case InputKind::Image:
    recognizePage(inputPath, 0);
    break;
  case InputKind::Unsupported:
    throw UnsupportedInputError("Unsupported file type: " + fs::path(inputPath).filename().string());
  }
  return tables;
}

std::vector<std::string> convertFile(const std::string& inputPath, const ConverterConfig& config,
                                     const ConverterBackends& backends, std::ostream& err) {
  std::vector<PageTable> tables = extractPageTables(inputPath, config, backends);

  std::vector<std::string> written;
  for (const auto& t : tables) {
    std::string target = (fs::path(config.outputDir) / outputFileName(inputPath, t.pageNumber)).string();
    if (t.degenerate) {
      err << "Warning: no table structure detected in " << fs::path(inputPath).filename().string();
      if (t.pageNumber > 0) err << " page " << t.pageNumber;
      err << " (" << t.grid.rows.size() << "x" << t.grid.columnCount << " grid)\n";
    }
    writeCsvFile(t.grid, target, config.csv);
    written.push_back(target);
  }
  return written;
}

BatchSummary convertAll(const ConverterConfig& config, const ConverterBackends& backends,
                        std::ostream& out, std::ostream& err) {
  if (!fs::exists(config.inputPath)) {
    throw std::runtime_error("Input not found: " + config.inputPath);
  }

  std::vector<fs::path> inputs;
  if (fs::is_directory(config.inputPath)) {
    for (const auto& entry : fs::directory_iterator(config.inputPath)) {
      if (entry.is_regular_file()) inputs.push_back(entry.path());
    }
    std::sort(inputs.begin(), inputs.end());
  } else {
    inputs.emplace_back(config.inputPath);
  }

  if (!fs::exists(config.outputDir)) {
    fs::create_directories(config.outputDir);
  }

  BatchSummary summary;
  for (const auto& input : inputs) {
    const std::string name = input.filename().string();
    if (classifyInput(input.string()) == InputKind::Unsupported) {
      err << "Warning: unsupported file type: " << name << "\n";
      summary.skipped++;
      continue;
    }
    out << "Converting " << name << "...\n";
    try {
      std::vector<std::string> files = convertFile(input.string(), config, backends, err);
      out << "Successfully converted " << name << " -> " << files.size() << " file(s)\n";
      summary.written.insert(summary.written.end(), files.begin(), files.end());
      summary.converted++;
    } catch (const std::exception& ex) {
      err << "Error converting " << name << ": " << ex.what() << "\n";
      summary.failed++;
    }
  }
  return summary;
}
