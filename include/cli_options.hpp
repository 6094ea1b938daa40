#pragma once

#include "converter.hpp"

#include <string>

struct CommandLine {
  ConverterConfig config;
  bool showHelp = false;
};

// Parses --name=value flags and an optional positional input path.
// Throws std::invalid_argument on unknown flags or malformed numbers.
CommandLine parseCommandLine(int argc, const char* const* argv);

std::string usageText(const std::string& program);
