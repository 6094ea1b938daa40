#include "process.hpp"

#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <sys/wait.h>

bool commandExists(const std::string& command) {
  std::string test = "command -v " + shellQuote(command) + " >/dev/null 2>&1";
  return std::system(test.c_str()) == 0;
}

std::string shellQuote(const std::string& arg) {
  std::string out = "'";
  for (char ch : arg) {
    if (ch == '\'') out += "'\\''";
    else out += ch;
  }
  out += "'";
  return out;
}

CommandResult runCommand(const std::string& cmd) {
  FILE* pipe = popen(cmd.c_str(), "r");
  if (!pipe) throw std::runtime_error("Failed to run: " + cmd);

  CommandResult result;
  char buf[8192];
  while (true) {
    size_t n = std::fread(buf, 1, sizeof(buf), pipe);
    if (n > 0) result.output.append(buf, n);
    if (n < sizeof(buf)) break;
  }
  int status = pclose(pipe);
  if (status == -1) {
    result.exitCode = -1;
  } else if (WIFEXITED(status)) {
    result.exitCode = WEXITSTATUS(status);
  } else {
    result.exitCode = 128 + (WIFSIGNALED(status) ? WTERMSIG(status) : 0);
  }
  return result;
}
