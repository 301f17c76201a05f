#include "report/simulation_report.hpp"

#include "data/data_loader.hpp"
#include "observability/logger.hpp"

#include <fstream>
#include <sstream>

namespace cashflow {
namespace report {

namespace {

void appendTransferNotice(std::ostringstream& out, const Transaction& transfer) {
  out << "\nSYSTEM_TRANSFER:\n";
  out << "  Recommended Transfer: " << money::format(-transfer.amount) << "\n";
  out << "  A virtual transfer has been added to the simulation on " << transfer.date << "\n";
}

}  // namespace

std::string formatSimulationSummary(const SimulationResult& result, Cents target_balance) {
  std::ostringstream out;
  out << "\nSIMULATION SUMMARY\n";
  out << std::string(40, '=') << "\n";

  bool header_written = false;
  for (const DayRecord& day : result.days) {
    if (day.alert_type != AlertType::BELOW_TARGET) continue;
    if (!header_written) {
      out << "\nALERTS:\n";
      header_written = true;
    }
    out << "  " << day.date << ": Balance drops to " << money::format(day.end_balance)
        << " (below target of " << money::format(target_balance) << ")\n";
    out << "    SYSTEM RECOMMENDATION: Add " << money::format(day.shortfall)
        << " to reach target balance\n";
  }

  // The last transfer may be dated the day after the window ends.
  for (const Transaction& transfer : result.transfers) {
    if (transfer.isVirtualTransfer()) appendTransferNotice(out, transfer);
  }

  return out.str();
}

void writeSimulationCsv(const SimulationResult& result, std::ostream& out) {
  out << "date,start_balance,transactions_summary,net_change,end_balance,alert_type,shortfall\n";
  for (const DayRecord& day : result.days) {
    out << day.date << ',' << money::format(day.start_balance) << ','
        << data::escapeCsvField(day.transactions_summary) << ','
        << money::format(day.net_change) << ',' << money::format(day.end_balance) << ','
        << alertTypeToString(day.alert_type) << ',' << money::format(day.shortfall) << '\n';
  }
}

bool writeSimulationCsv(const SimulationResult& result, const std::filesystem::path& path) {
  std::ofstream file(path);
  if (!file) {
    LOG_ERROR("Cannot open simulation output: " + path.string());
    return false;
  }
  writeSimulationCsv(result, file);
  LOG_DEBUG("Wrote simulation CSV: " + path.string());
  return static_cast<bool>(file);
}

nlohmann::json simulationToJson(const SimulationResult& result) {
  nlohmann::json doc;
  doc["days"] = nlohmann::json::array();
  for (const DayRecord& day : result.days) {
    doc["days"].push_back({
        {"date", day.date.toString()},
        {"start_balance", money::toDouble(day.start_balance)},
        {"transactions_summary", day.transactions_summary},
        {"net_change", money::toDouble(day.net_change)},
        {"end_balance", money::toDouble(day.end_balance)},
        {"alert_type", alertTypeToString(day.alert_type)},
        {"shortfall", money::toDouble(day.shortfall)},
    });
  }

  doc["transfers"] = nlohmann::json::array();
  for (const Transaction& transfer : result.transfers) {
    doc["transfers"].push_back({
        {"date", transfer.date.toString()},
        {"amount", money::toDouble(transfer.amount)},
        {"description", transfer.description},
    });
  }
  return doc;
}

bool writeSimulationJson(const SimulationResult& result, const std::filesystem::path& path) {
  std::ofstream file(path);
  if (!file) {
    LOG_ERROR("Cannot open simulation output: " + path.string());
    return false;
  }
  file << simulationToJson(result).dump(2) << '\n';
  LOG_DEBUG("Wrote simulation JSON: " + path.string());
  return static_cast<bool>(file);
}

bool writeUncategorizedCsv(const std::vector<Transaction>& rows,
                           const std::filesystem::path& path) {
  std::ofstream file(path);
  if (!file) {
    LOG_ERROR("Cannot open uncategorized output: " + path.string());
    return false;
  }
  file << "date,amount,description,category,forecast\n";
  for (const Transaction& tx : rows) {
    file << tx.date << ',' << money::format(tx.amount) << ','
         << data::escapeCsvField(tx.description) << ',' << data::escapeCsvField(tx.category)
         << ',' << (tx.is_forecast ? "1" : "0") << '\n';
  }
  return static_cast<bool>(file);
}

}  // namespace report
}  // namespace cashflow
