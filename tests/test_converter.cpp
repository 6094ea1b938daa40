#include <catch2/catch.hpp>

#include "cli_options.hpp"
#include "converter.hpp"
#include "errors.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

RawOcrItem item(const std::string& text, double x0, double y0, double x1, double y1, double conf = 0.9) {
  RawOcrItem r;
  r.text = text;
  r.bbox = BoundingBox{x0, y0, x1, y1};
  r.confidence = conf;
  return r;
}

std::vector<RawOcrItem> nameAgeItems() {
  return {
    item("30", 50, 20, 80, 30),
    item("Name", 0, 0, 40, 10),
    item("Alice", 0, 20, 40, 30),
    item("Age", 50, 0, 80, 10),
  };
}

std::string readFile(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

void touch(const fs::path& p) {
  std::ofstream out(p);
  out << "x";
}

// Table images by default; "blank" images recognize nothing and "broken" ones
// fail like a crashed engine.
ConverterBackends fakeBackends() {
  ConverterBackends b;
  b.recognize = [](const std::string& imagePath, const OcrOptions&) {
    std::string name = fs::path(imagePath).filename().string();
    if (name.find("broken") != std::string::npos) throw OcrEngineError("engine crashed");
    if (name.find("blank") != std::string::npos) return std::vector<RawOcrItem>{};
    return nameAgeItems();
  };
  b.rasterize = [](const std::string&, int) {
    RasterizedPdf pdf;
    pdf.pages = {(fs::path(pdf.dir.path()) / "page-1.png").string(),
                 (fs::path(pdf.dir.path()) / "page-2.png").string()};
    return pdf;
  };
  return b;
}

} // namespace

TEST_CASE("classifyInput recognizes PDFs and images case-insensitively", "[converter]") {
  REQUIRE(classifyInput("docs/report.PDF") == InputKind::Pdf);
  REQUIRE(classifyInput("scan.JpEg") == InputKind::Image);
  REQUIRE(classifyInput("scan.jpg") == InputKind::Image);
  REQUIRE(classifyInput("scan.png") == InputKind::Image);
  REQUIRE(classifyInput("notes.txt") == InputKind::Unsupported);
  REQUIRE(classifyInput("README") == InputKind::Unsupported);
}

TEST_CASE("outputFileName follows the page naming convention", "[converter]") {
  REQUIRE(outputFileName("in/report.pdf", 3) == "report_page3.csv");
  REQUIRE(outputFileName("in/scan.final.png", 0) == "scan.final.csv");
}

TEST_CASE("ocrItemsToCsv runs the whole page pipeline", "[converter]") {
  ConverterConfig config;
  REQUIRE(ocrItemsToCsv(nameAgeItems(), config) == "Name,Age\nAlice,30\n");

  std::vector<RawOcrItem> noisy = nameAgeItems();
  noisy.push_back(item("~", 45, 12, 47, 18, 0.05));
  noisy.push_back(item("  ", 90, 0, 100, 10));
  config.extract.minConfidence = 0.5;
  REQUIRE(ocrItemsToCsv(noisy, config) == "Name,Age\nAlice,30\n");
}

TEST_CASE("ocrItemsToCsv quotes a lone cell containing a comma", "[converter]") {
  ConverterConfig config;
  REQUIRE(ocrItemsToCsv({item("Smith, John", 10, 10, 90, 22)}, config) == "\"Smith, John\"\n");
}

TEST_CASE("ocrItemsToCsv on nothing recognized is empty", "[converter]") {
  ConverterConfig config;
  REQUIRE(ocrItemsToCsv({}, config).empty());
}

TEST_CASE("extractPageTables rejects unsupported files", "[converter]") {
  ConverterConfig config;
  REQUIRE_THROWS_AS(extractPageTables("notes.docx", config, fakeBackends()), UnsupportedInputError);
}

TEST_CASE("convertAll converts every page and keeps going past failures", "[converter]") {
  ScratchDir tmp;
  fs::path inDir = fs::path(tmp.path()) / "input";
  fs::create_directories(inDir);
  touch(inDir / "invoice.png");
  touch(inDir / "report.pdf");
  touch(inDir / "notes.txt");
  touch(inDir / "broken.jpg");
  touch(inDir / "blank.png");

  ConverterConfig config;
  config.inputPath = inDir.string();
  config.outputDir = (fs::path(tmp.path()) / "output").string();

  std::ostringstream out, err;
  BatchSummary summary = convertAll(config, fakeBackends(), out, err);

  REQUIRE(summary.converted == 3);
  REQUIRE(summary.skipped == 1);
  REQUIRE(summary.failed == 1);
  REQUIRE(summary.written.size() == 4);

  fs::path outDir(config.outputDir);
  REQUIRE(readFile((outDir / "invoice.csv").string()) == "Name,Age\nAlice,30\n");
  REQUIRE(readFile((outDir / "report_page1.csv").string()) == "Name,Age\nAlice,30\n");
  REQUIRE(readFile((outDir / "report_page2.csv").string()) == "Name,Age\nAlice,30\n");
  REQUIRE(fs::exists(outDir / "blank.csv"));
  REQUIRE(fs::file_size(outDir / "blank.csv") == 0u);
  REQUIRE_FALSE(fs::exists(outDir / "broken.csv"));
  REQUIRE_FALSE(fs::exists(outDir / "notes.csv"));

  REQUIRE(err.str().find("Error converting broken.jpg: engine crashed") != std::string::npos);
  REQUIRE(err.str().find("unsupported file type: notes.txt") != std::string::npos);
  REQUIRE(err.str().find("no table structure detected in blank.png") != std::string::npos);
  REQUIRE(out.str().find("Successfully converted report.pdf -> 2 file(s)") != std::string::npos);
}

TEST_CASE("convertAll accepts a single file and fails on a missing input", "[converter]") {
  ScratchDir tmp;
  fs::path image = fs::path(tmp.path()) / "scan.PNG";
  touch(image);

  ConverterConfig config;
  config.inputPath = image.string();
  config.outputDir = (fs::path(tmp.path()) / "out").string();
  config.csv.crlf = true;

  std::ostringstream out, err;
  BatchSummary summary = convertAll(config, fakeBackends(), out, err);
  REQUIRE(summary.converted == 1);
  REQUIRE(readFile((fs::path(config.outputDir) / "scan.csv").string()) == "Name,Age\r\nAlice,30\r\n");

  config.inputPath = (fs::path(tmp.path()) / "missing").string();
  REQUIRE_THROWS_AS(convertAll(config, fakeBackends(), out, err), std::runtime_error);
}

TEST_CASE("parseCommandLine reads flags into the converter config", "[cli]") {
  const char* argv[] = {"ocrtable", "--output=csv", "--min-confidence=0.4", "--row-tolerance=5",
                        "--column-tolerance=12.5", "--dpi=200", "--lang=deu", "--psm=4",
                        "--quote-all", "--crlf", "scans"};
  CommandLine cl = parseCommandLine(static_cast<int>(sizeof(argv) / sizeof(argv[0])), argv);

  REQUIRE_FALSE(cl.showHelp);
  REQUIRE(cl.config.inputPath == "scans");
  REQUIRE(cl.config.outputDir == "csv");
  REQUIRE(cl.config.extract.minConfidence == Catch::Detail::Approx(0.4));
  REQUIRE(cl.config.layout.rowTolerance == Catch::Detail::Approx(5.0));
  REQUIRE(cl.config.layout.columnTolerance == Catch::Detail::Approx(12.5));
  REQUIRE(cl.config.dpi == 200);
  REQUIRE(cl.config.ocr.language == "deu");
  REQUIRE(cl.config.ocr.pageSegMode == 4);
  REQUIRE(cl.config.csv.quoteAll);
  REQUIRE(cl.config.csv.crlf);
}

TEST_CASE("parseCommandLine defaults and errors", "[cli]") {
  const char* bare[] = {"ocrtable"};
  CommandLine cl = parseCommandLine(1, bare);
  REQUIRE(cl.config.inputPath == "input");
  REQUIRE(cl.config.outputDir == "output");
  REQUIRE(cl.config.dpi == 300);

  const char* help[] = {"ocrtable", "--help"};
  REQUIRE(parseCommandLine(2, help).showHelp);

  const char* badNumber[] = {"ocrtable", "--dpi=high"};
  REQUIRE_THROWS_AS(parseCommandLine(2, badNumber), std::invalid_argument);

  const char* unknown[] = {"ocrtable", "--tables"};
  REQUIRE_THROWS_AS(parseCommandLine(2, unknown), std::invalid_argument);

  const char* twoInputs[] = {"ocrtable", "a", "b"};
  REQUIRE_THROWS_AS(parseCommandLine(3, twoInputs), std::invalid_argument);
}
