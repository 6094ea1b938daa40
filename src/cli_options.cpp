#include "cli_options.hpp"

#include <cstdlib>
#include <stdexcept>

namespace {

bool takeValue(const std::string& arg, const std::string& flag, std::string& value) {
  const std::string prefix = flag + "=";
  if (arg.rfind(prefix, 0) != 0) return false;
  value = arg.substr(prefix.size());
  return true;
}

double toDouble(const std::string& flag, const std::string& value) {
  char* end = nullptr;
  double d = std::strtod(value.c_str(), &end);
  if (value.empty() || end != value.c_str() + value.size()) {
    throw std::invalid_argument("Invalid number for " + flag + ": '" + value + "'");
  }
  return d;
}

int toInt(const std::string& flag, const std::string& value) {
  char* end = nullptr;
  long n = std::strtol(value.c_str(), &end, 10);
  if (value.empty() || end != value.c_str() + value.size()) {
    throw std::invalid_argument("Invalid integer for " + flag + ": '" + value + "'");
  }
  return static_cast<int>(n);
}

} // namespace

CommandLine parseCommandLine(int argc, const char* const* argv) {
  CommandLine cl;
  ConverterConfig& cfg = cl.config;
  bool haveInput = false;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    std::string value;
    if (arg == "--help" || arg == "-h") {
      cl.showHelp = true;
    } else if (arg == "--quote-all") {
      cfg.csv.quoteAll = true;
    } else if (arg == "--crlf") {
      cfg.csv.crlf = true;
    } else if (takeValue(arg, "--output", value)) {
      cfg.outputDir = value;
    } else if (takeValue(arg, "--min-confidence", value)) {
      cfg.extract.minConfidence = toDouble("--min-confidence", value);
    } else if (takeValue(arg, "--row-tolerance", value)) {
      cfg.layout.rowTolerance = toDouble("--row-tolerance", value);
    } else if (takeValue(arg, "--column-tolerance", value)) {
      cfg.layout.columnTolerance = toDouble("--column-tolerance", value);
    } else if (takeValue(arg, "--dpi", value)) {
      cfg.dpi = toInt("--dpi", value);
      if (cfg.dpi <= 0) throw std::invalid_argument("--dpi must be positive");
    } else if (takeValue(arg, "--lang", value)) {
      cfg.ocr.language = value;
    } else if (takeValue(arg, "--psm", value)) {
      cfg.ocr.pageSegMode = toInt("--psm", value);
    } else if (arg.rfind("--", 0) == 0) {
      throw std::invalid_argument("Unknown option: " + arg);
    } else if (!haveInput) {
      cfg.inputPath = arg;
      haveInput = true;
    } else {
      throw std::invalid_argument("Unexpected argument: " + arg);
    }
  }
  return cl;
}

std::string usageText(const std::string& program) {
  return "Usage: " + program + " [options] [input_dir_or_file]\n"
         "  --output=DIR             where CSV files go (default: output)\n"
         "  --min-confidence=F       drop words below this OCR confidence, 0..1\n"
         "  --row-tolerance=PX       fixed row grouping distance\n"
         "  --column-tolerance=PX    fixed column gap threshold\n"
         "  --dpi=N                  PDF render resolution (default: 300)\n"
         "  --lang=CODE              tesseract language (default: eng)\n"
         "  --psm=N                  tesseract page segmentation mode (default: 6)\n"
         "  --quote-all              quote every CSV cell\n"
         "  --crlf                   CRLF line endings\n";
}
