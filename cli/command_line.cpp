#include "cli/command_line.hpp"

#include "data/data_loader.hpp"
#include "report/pnl_summary.hpp"
#include "report/simulation_report.hpp"
#include "simulation/simulation_error.hpp"
#include "simulation/simulation_orchestrator.hpp"

#include <sstream>
#include <stdexcept>

namespace cashflow {
namespace cli {

namespace {

std::optional<int> parseInt(const std::string& text) {
  try {
    size_t consumed = 0;
    const int value = std::stoi(text, &consumed);
    if (consumed != text.size()) return std::nullopt;
    return value;
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

ParseResult fail(const std::string& message) {
  ParseResult result;
  result.error = message;
  return result;
}

}  // namespace

std::string usage() {
  return "usage: cashflow [--users-dir DIR] [--log-level LEVEL] <command> [options]\n"
         "\n"
         "commands:\n"
         "  summarize --user NAME --month YYYYMM\n"
         "      Generate a P&L summary for a specific month.\n"
         "  simulator --user NAME [--window N] [--start-date YYYY-MM-DD] [--json]\n"
         "      Project cash flow over a given time window (default 60 days).\n"
         "\n"
         "Each user directory DIR/NAME holds config.json and ledger.csv.\n"
         "config.yaml is not read; convert it to config.json with the keys\n"
         "current_balance, target_balance and optionally account_nickname and categories.\n";
}

std::string commandName(Command command) {
  switch (command) {
    case Command::SUMMARIZE: return "summarize";
    case Command::SIMULATOR: return "simulator";
    default: return "unknown";
  }
}

ParseResult parseCommandLine(const std::vector<std::string>& args) {
  CommandLine options;
  std::optional<Command> command;

  for (size_t i = 0; i < args.size(); ++i) {
    const std::string& arg = args[i];

    auto next = [&](std::string& value) {
      if (i + 1 >= args.size()) return false;
      value = args[++i];
      return true;
    };

    std::string value;
    if (arg == "summarize" && !command) {
      command = Command::SUMMARIZE;
    } else if (arg == "simulator" && !command) {
      command = Command::SIMULATOR;
    } else if (arg == "--user") {
      if (!next(options.user)) return fail("--user requires a value");
    } else if (arg == "--month") {
      if (!next(options.month)) return fail("--month requires a value");
    } else if (arg == "--window") {
      if (!next(value)) return fail("--window requires a value");
      auto window = parseInt(value);
      if (!window) return fail("--window must be an integer: '" + value + "'");
      options.window_days = *window;
    } else if (arg == "--start-date") {
      if (!next(value)) return fail("--start-date requires a value");
      options.start_date = Date::parse(value);
      if (!options.start_date) return fail("--start-date must be YYYY-MM-DD: '" + value + "'");
    } else if (arg == "--json") {
      options.write_json = true;
    } else if (arg == "--users-dir") {
      if (!next(value)) return fail("--users-dir requires a value");
      options.users_dir = value;
    } else if (arg == "--log-level") {
      if (!next(value)) return fail("--log-level requires a value");
      auto level = observability::parseLogLevel(value);
      if (!level) return fail("unknown log level: '" + value + "'");
      options.log_level = *level;
    } else {
      return fail("unrecognized argument: '" + arg + "'");
    }
  }

  if (!command) return fail("a command is required (summarize or simulator)");
  options.command = *command;

  if (options.user.empty()) return fail("--user is required");
  if (options.command == Command::SUMMARIZE) {
    if (options.month.empty()) return fail("--month is required for summarize");
  } else if (!options.month.empty()) {
    return fail("--month is only valid for summarize");
  }

  ParseResult result;
  result.command_line = options;
  return result;
}

int runSummarize(const CommandLine& options, const Date& today, std::ostream& out,
                 std::ostream& err) {
  const std::filesystem::path user_dir = options.users_dir / options.user;

  try {
    const data::UserConfig config = data::loadConfig(user_dir);
    const std::vector<Transaction> ledger = data::loadLedger(user_dir);

    const report::PnlReport pnl = report::calculatePnl(ledger, options.month, config.categories);
    const std::vector<Transaction> uncategorized =
        report::findUncategorized(ledger, config.categories);

    out << report::formatPnl(pnl) << "\n";

    if (!uncategorized.empty()) {
      out << "\nWARNING: Uncategorized transactions found:\n";
      for (const Transaction& tx : uncategorized) {
        out << "  " << tx.date << " | " << tx.description << " | Category: '" << tx.category
            << "'\n";
      }

      const std::filesystem::path output_file =
          user_dir / ("uncategorized_" + today.toCompactString() + ".csv");
      if (!report::writeUncategorizedCsv(uncategorized, output_file)) {
        err << "Error: could not write " << output_file.string() << "\n";
        return 1;
      }
      out << "\nUncategorized transactions saved to: " << output_file.string() << "\n";
      LOG_INFO("Wrote uncategorized report: " + output_file.string());
      LOG_BUILDER(observability::LogLevel::WARN, "Uncategorized transactions")
          .field("user", options.user)
          .field("count", static_cast<int>(uncategorized.size()));
    }
    return 0;

  } catch (const data::DataLoadError& e) {
    LOG_ERROR(e.what());
    err << "Error: " << e.what() << "\n";
    return 1;
  } catch (const std::invalid_argument& e) {
    LOG_ERROR(e.what());
    err << "Error: " << e.what() << "\n";
    return 1;
  } catch (const std::overflow_error& e) {
    LOG_ERROR(e.what());
    err << "Error: " << e.what() << "\n";
    return 1;
  }
}

int runSimulator(const CommandLine& options, const Date& today, std::ostream& out,
                 std::ostream& err) {
  const std::filesystem::path user_dir = options.users_dir / options.user;
  const Date start_date = options.start_date ? *options.start_date : today;

  try {
    const data::UserConfig config = data::loadConfig(user_dir);
    const std::vector<Transaction> forecast = data::forecastOnly(data::loadLedger(user_dir));

    LOG_BUILDER(observability::LogLevel::INFO, "Starting simulation")
        .field("user", options.user)
        .field("start_date", start_date.toString())
        .field("window_days", options.window_days)
        .field("current_balance", config.current_balance)
        .field("target_balance", config.target_balance)
        .field("forecast_rows", static_cast<int>(forecast.size()))
        .field("write_json", options.write_json);

    SimulationOrchestrator orchestrator;
    const SimulationResult result =
        orchestrator.simulate(config.current_balance, config.target_balance, forecast,
                              start_date, options.window_days);

    // simulate() already accepted the target, so the conversion cannot fail.
    const Cents target = money::fromDouble(config.target_balance).value_or(0);
    out << report::formatSimulationSummary(result, target);

    const std::string stem = "simulation_output_" + today.toCompactString();
    const std::filesystem::path csv_file = user_dir / (stem + ".csv");
    if (!report::writeSimulationCsv(result, csv_file)) {
      err << "Error: could not write " << csv_file.string() << "\n";
      return 1;
    }
    out << "\nSimulation results saved to: " << csv_file.string() << "\n";
    LOG_INFO("Wrote simulation results: " + csv_file.string());

    if (options.write_json) {
      const std::filesystem::path json_file = user_dir / (stem + ".json");
      if (!report::writeSimulationJson(result, json_file)) {
        err << "Error: could not write " << json_file.string() << "\n";
        return 1;
      }
      out << "Simulation JSON saved to: " << json_file.string() << "\n";
    }
    return 0;

  } catch (const data::DataLoadError& e) {
    LOG_ERROR(e.what());
    err << "Error: " << e.what() << "\n";
    return 1;
  } catch (const SimulationError& e) {
    LOG_ERROR(e.what());
    err << "Simulation error: " << e.what() << "\n";
    return 1;
  }
}

int run(const CommandLine& options, const Date& today, std::ostream& out, std::ostream& err) {
  out << "Executing command: " << commandName(options.command) << "\n";
  switch (options.command) {
    case Command::SUMMARIZE: return runSummarize(options, today, out, err);
    case Command::SIMULATOR: return runSimulator(options, today, out, err);
    default: return 2;
  }
}

}  // namespace cli
}  // namespace cashflow
