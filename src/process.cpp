#include <adr/process.h>

#include <array>
#include <atomic>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include <sys/wait.h>
#include <unistd.h>

namespace adr {
namespace {

std::filesystem::path StderrCapturePath() {
  static std::atomic<unsigned long> counter{0};
  const auto name = "adr_stderr_" + std::to_string(::getpid()) + "_" +
                    std::to_string(counter.fetch_add(1)) + ".txt";
  return std::filesystem::temp_directory_path() / name;
}

std::string ReadAndRemove(const std::filesystem::path &path) {
  std::string contents;
  {
    std::ifstream stream(path);
    if (stream) {
      std::ostringstream buffer;
      buffer << stream.rdbuf();
      contents = buffer.str();
    }
  }
  std::error_code ignored;
  std::filesystem::remove(path, ignored);
  return contents;
}

} // namespace

std::string ShellQuote(const std::string &argument) {
  std::string quoted = "'";
  for (const auto character : argument) {
    if (character == '\'') {
      quoted.append("'\\''");
    } else {
      quoted.push_back(character);
    }
  }
  quoted.push_back('\'');
  return quoted;
}

ProcessResult RunProcess(const std::vector<std::string> &argv) {
  if (argv.empty()) {
    throw std::invalid_argument("cannot run an empty command");
  }
  std::string command;
  for (const auto &argument : argv) {
    if (!command.empty()) {
      command.push_back(' ');
    }
    command.append(ShellQuote(argument));
  }
  const auto stderr_path = StderrCapturePath();
  command.append(" 2>").append(ShellQuote(stderr_path.string()));

  FILE *pipe = ::popen(command.c_str(), "r");
  if (pipe == nullptr) {
    throw std::runtime_error("failed to start " + argv.front());
  }

  ProcessResult result;
  std::array<char, 4096> buffer{};
  std::size_t read = 0;
  while ((read = std::fread(buffer.data(), 1, buffer.size(), pipe)) > 0) {
    result.output.append(buffer.data(), read);
  }
  const auto status = ::pclose(pipe);
  result.error_output = ReadAndRemove(stderr_path);
  if (status == -1) {
    throw std::runtime_error("failed to wait for " + argv.front());
  }
  result.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
  return result;
}

} // namespace adr
