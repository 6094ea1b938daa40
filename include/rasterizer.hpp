#pragma once

#include <string>
#include <vector>

// Temporary directory removed with everything in it when the owner goes away.
class ScratchDir {
public:
  ScratchDir();
  ~ScratchDir();
  ScratchDir(ScratchDir&& other) noexcept;
  ScratchDir& operator=(ScratchDir&& other) noexcept;
  ScratchDir(const ScratchDir&) = delete;
  ScratchDir& operator=(const ScratchDir&) = delete;

  const std::string& path() const { return path_; }

private:
  void remove() noexcept;
  std::string path_;
};

struct RasterizedPdf {
  ScratchDir dir;
  std::vector<std::string> pages; // one PNG per page, in page order
};

// Renders every page of the PDF to PNG with pdftoppm.
// Throws RasterizeError if pdftoppm is missing, fails or produces no pages.
RasterizedPdf rasterizePdf(const std::string& pdfPath, int dpi = 300);

// Page images written by pdftoppm under dir with the given prefix, ordered by
// page number ("page-1.png" ... or zero-padded "page-01.png" ...).
std::vector<std::string> listPageImages(const std::string& dir, const std::string& prefix);
