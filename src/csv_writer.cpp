#include "csv_writer.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>

std::string escapeCsvCell(const std::string& cell, bool forceQuotes) {
  bool needQuotes = forceQuotes || cell.find_first_of(",\"\r\n") != std::string::npos;
  if (!needQuotes) return cell;
  std::string escaped;
  escaped.reserve(cell.size() + 2);
  escaped += '"';
  for (char ch : cell) {
    if (ch == '"') escaped += '"';
    escaped += ch;
  }
  escaped += '"';
  return escaped;
}

std::string toCsv(const Grid& grid, const CsvOptions& options) {
  const char* eol = options.crlf ? "\r\n" : "\n";
  std::string out;
  for (const auto& row : grid.rows) {
    if (row.size() == 1 && row[0].empty()) {
      // a bare terminator would read back as a row with no fields
      out += "\"\"";
    } else {
      for (size_t i = 0; i < row.size(); ++i) {
        out += escapeCsvCell(row[i], options.quoteAll);
        if (i + 1 < row.size()) out += ',';
      }
    }
    out += eol;
  }
  return out;
}

void writeCsvFile(const Grid& grid, const std::string& path, const CsvOptions& options) {
  std::filesystem::path p(path);
  if (p.has_parent_path() && !std::filesystem::exists(p.parent_path())) {
    std::filesystem::create_directories(p.parent_path());
  }
  std::ofstream ofs(p, std::ios::binary | std::ios::trunc);
  if (!ofs) throw std::runtime_error("Cannot open " + path + " for writing");
  ofs << toCsv(grid, options);
  if (!ofs) throw std::runtime_error("Failed writing " + path);
}
