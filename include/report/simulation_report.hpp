#ifndef CASHFLOW_REPORT_SIMULATION_REPORT_HPP_
#define CASHFLOW_REPORT_SIMULATION_REPORT_HPP_

#include "simulation/transaction.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <ostream>
#include <string>
#include <vector>

namespace cashflow {
namespace report {

/**
 * Console summary of a simulation: below-target alerts with the amount
 * needed to recover, then one SYSTEM_TRANSFER block per injected sweep.
 */
std::string formatSimulationSummary(const SimulationResult& result, Cents target_balance);

/**
 * Day table as CSV:
 * date,start_balance,transactions_summary,net_change,end_balance,alert_type,shortfall
 * where shortfall is the amount to add to get back to target (0.00 when OK).
 */
void writeSimulationCsv(const SimulationResult& result, std::ostream& out);
bool writeSimulationCsv(const SimulationResult& result, const std::filesystem::path& path);

// Day table plus the injected transfers.
nlohmann::json simulationToJson(const SimulationResult& result);
bool writeSimulationJson(const SimulationResult& result, const std::filesystem::path& path);

// Uncategorized rows in ledger format.
bool writeUncategorizedCsv(const std::vector<Transaction>& rows,
                           const std::filesystem::path& path);

}  // namespace report
}  // namespace cashflow

#endif  // CASHFLOW_REPORT_SIMULATION_REPORT_HPP_
