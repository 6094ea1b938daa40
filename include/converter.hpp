#pragma once

#include "csv_writer.hpp"
#include "fragment_extractor.hpp"
#include "grid_assembler.hpp"
#include "layout_clusterer.hpp"
#include "ocr_engine.hpp"
#include "rasterizer.hpp"

#include <functional>
#include <iosfwd>
#include <string>
#include <vector>

enum class InputKind { Pdf, Image, Unsupported };

struct ConverterConfig {
  std::string inputPath = "input";   // directory or single file
  std::string outputDir = "output";
  int dpi = 300;
  ExtractOptions extract;
  LayoutOptions layout;
  OcrOptions ocr;
  CsvOptions csv;
};

// External tools used by the converter. Defaults run tesseract and pdftoppm.
struct ConverterBackends {
  std::function<std::vector<RawOcrItem>(const std::string& imagePath, const OcrOptions&)> recognize;
  std::function<RasterizedPdf(const std::string& pdfPath, int dpi)> rasterize;
};

ConverterBackends defaultBackends();

struct PageTable {
  int pageNumber = 0; // 1-based for PDFs, 0 for single images
  Grid grid;
  bool degenerate = false;
};

struct BatchSummary {
  int converted = 0;
  int skipped = 0;
  int failed = 0;
  std::vector<std::string> written;
};

InputKind classifyInput(const std::string& path);

// "<stem>_page<N>.csv" for PDF pages, "<stem>.csv" for images.
std::string outputFileName(const std::string& inputPath, int pageNumber);

// Fragment extraction, layout clustering and grid assembly for one page.
Grid buildGrid(const std::vector<RawOcrItem>& items, const ConverterConfig& config);

// Full per-page pipeline ending in CSV text.
std::string ocrItemsToCsv(const std::vector<RawOcrItem>& items, const ConverterConfig& config);

// Recognizes every page of one input file.
// Throws UnsupportedInputError, RasterizeError or OcrEngineError.
std::vector<PageTable> extractPageTables(const std::string& inputPath, const ConverterConfig& config,
                                         const ConverterBackends& backends);

// Converts one file and writes its CSV files into config.outputDir.
// Returns the paths written.
std::vector<std::string> convertFile(const std::string& inputPath, const ConverterConfig& config,
                                     const ConverterBackends& backends, std::ostream& err);

// Converts config.inputPath (every regular file of a directory, in name order,
// or a single file). Per-file failures are reported on err and counted; they
// never stop the batch. Throws std::runtime_error if the input does not exist.
BatchSummary convertAll(const ConverterConfig& config, const ConverterBackends& backends,
                        std::ostream& out, std::ostream& err);
