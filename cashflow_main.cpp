#include "cli/command_line.hpp"

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
  using namespace cashflow;

  std::vector<std::string> args(argv + 1, argv + argc);
  const cli::ParseResult parsed = cli::parseCommandLine(args);
  if (!parsed.ok()) {
    std::cerr << "error: " << parsed.error << "\n\n" << cli::usage();
    return 2;
  }
  const cli::CommandLine& options = *parsed.command_line;

  // Logs go to stderr so stdout carries only the report.
  observability::Logger& logger = observability::Logger::getInstance();
  logger.setOutputStream(std::cerr);
  logger.setLogLevel(options.log_level);

  try {
    return cli::run(options, Date::today(), std::cout, std::cerr);
  } catch (const std::exception& e) {
    LOG_FATAL(std::string("Unexpected error: ") + e.what());
    std::cerr << "Unexpected error: " << e.what() << std::endl;
    return 1;
  }
}
