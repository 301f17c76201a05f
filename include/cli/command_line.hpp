#ifndef CASHFLOW_CLI_COMMAND_LINE_HPP_
#define CASHFLOW_CLI_COMMAND_LINE_HPP_

#include "common/date.hpp"
#include "observability/logger.hpp"

#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace cashflow {
namespace cli {

enum class Command {
  SUMMARIZE,
  SIMULATOR
};

constexpr int kDefaultWindowDays = 60;

/**
 * Parsed process options.
 */
struct CommandLine {
  Command command = Command::SIMULATOR;
  std::string user;
  std::string month;  // summarize only, YYYYMM
  int window_days = kDefaultWindowDays;
  std::optional<Date> start_date;  // simulator only; defaults to today
  bool write_json = false;
  std::filesystem::path users_dir = "users";
  observability::LogLevel log_level = observability::LogLevel::INFO;
};

/**
 * Result of argument parsing: either options or a usage error.
 */
struct ParseResult {
  std::optional<CommandLine> command_line;
  std::string error;

  bool ok() const { return command_line.has_value(); }
};

ParseResult parseCommandLine(const std::vector<std::string>& args);

std::string usage();

std::string commandName(Command command);

/**
 * Runs the summarize command. Returns the process exit code.
 */
int runSummarize(const CommandLine& options, const Date& today, std::ostream& out,
                 std::ostream& err);

/**
 * Runs the simulator command. Returns the process exit code.
 */
int runSimulator(const CommandLine& options, const Date& today, std::ostream& out,
                 std::ostream& err);

// Dispatches to the command named in `options`.
int run(const CommandLine& options, const Date& today, std::ostream& out, std::ostream& err);

}  // namespace cli
}  // namespace cashflow

#endif  // CASHFLOW_CLI_COMMAND_LINE_HPP_
