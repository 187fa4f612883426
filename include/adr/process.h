#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace adr {

struct ProcessResult {
  int exit_code = -1;
  std::string output;
  std::string error_output;
};

std::string ShellQuote(const std::string &argument);

// Runs argv through the shell with stdout captured and stderr collected
// separately. Throws std::runtime_error when the process cannot be started.
ProcessResult RunProcess(const std::vector<std::string> &argv);

} // namespace adr
