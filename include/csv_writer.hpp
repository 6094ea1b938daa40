#pragma once

#include "grid_assembler.hpp"

#include <string>

struct CsvOptions {
  bool quoteAll = false;
  bool crlf = false;
};

std::string escapeCsvCell(const std::string& cell, bool forceQuotes = false);

// Serializes a grid. Every row ends with the line terminator; an empty grid
// gives an empty string.
std::string toCsv(const Grid& grid, const CsvOptions& options = {});

// Writes toCsv(grid) to path, creating parent directories.
// Throws std::runtime_error on failure.
void writeCsvFile(const Grid& grid, const std::string& path, const CsvOptions& options = {});
