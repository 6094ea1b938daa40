#pragma once

#include <string>

struct CommandResult {
  int exitCode = 0;
  std::string output;
};

bool commandExists(const std::string& command);

// Wraps an argument in single quotes for /bin/sh.
std::string shellQuote(const std::string& arg);

// Runs cmd through the shell and captures stdout.
// Throws std::runtime_error if the pipe cannot be opened.
CommandResult runCommand(const std::string& cmd);
