#include <adr/cancellation.h>
#include <adr/cli_exit_codes.h>
#include <adr/mine_command.h>

#include <atomic>
#include <csignal>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

std::atomic<bool> *g_cancel_flag = nullptr;

extern "C" void HandleInterrupt(int) {
  if (g_cancel_flag != nullptr) {
    g_cancel_flag->store(true);
  }
}

void PrintGlobalUsage() {
  std::cout
      << "Usage: adr-mine <command> [options]\n\n"
      << "Commands:\n"
      << "  mine      Mine architectural decisions (default if no command is "
         "given).\n"
      << "  cache     Manage the extraction cache (subcommands: clean).\n\n"
      << "Run 'adr-mine mine --help' for mining options.\n";
}

} // namespace

int main(int argc, char **argv) {
  try {
    const std::vector<std::string> arguments(argv + 1, argv + argc);

    if (!arguments.empty() &&
        (arguments.front() == "--help" || arguments.front() == "-h")) {
      PrintGlobalUsage();
      return adr::kExitSuccess;
    }

    std::string command = "mine";
    std::size_t first_argument_index = 0;
    if (!arguments.empty() && arguments.front().rfind('-', 0) != 0) {
      command = arguments.front();
      first_argument_index = 1;
    }
    const std::vector<std::string> command_arguments(
        arguments.begin() + static_cast<std::ptrdiff_t>(first_argument_index),
        arguments.end());

    if (command == "mine") {
      const adr::CancellationToken cancellation;
      g_cancel_flag = cancellation.Flag();
      std::signal(SIGINT, HandleInterrupt);
      std::signal(SIGTERM, HandleInterrupt);
      const int exit_code = adr::RunMine(command_arguments, cancellation);
      std::signal(SIGINT, SIG_DFL);
      std::signal(SIGTERM, SIG_DFL);
      g_cancel_flag = nullptr;
      return exit_code;
    }

    if (command == "cache") {
      return adr::RunCacheCommand(command_arguments);
    }

    throw std::invalid_argument("Unknown command: " + command);
  } catch (const std::exception &ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    PrintGlobalUsage();
    return adr::kExitUsageError;
  }
}
