#ifndef CASHFLOW_DATA_DATA_LOADER_HPP_
#define CASHFLOW_DATA_DATA_LOADER_HPP_

#include "simulation/transaction.hpp"

#include <filesystem>
#include <istream>
#include <stdexcept>
#include <string>
#include <vector>

namespace cashflow {
namespace data {

constexpr const char* kConfigFileName = "config.json";
constexpr const char* kLedgerFileName = "ledger.csv";
// Written by older tools; recognised only to explain why it is not read.
constexpr const char* kLegacyConfigFileName = "config.yaml";

/**
 * Raised for missing or malformed user data files.
 */
class DataLoadError : public std::runtime_error {
 public:
  explicit DataLoadError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * Decoded per-user configuration.
 */
struct UserConfig {
  std::string account_nickname;
  double current_balance = 0.0;
  double target_balance = 0.0;
  std::vector<std::string> categories;
};

/**
 * Reads `<user_dir>/config.json`.
 *
 * {
 *   "account_nickname": "Checking",
 *   "current_balance": 1000.00,
 *   "target_balance": 500.00,
 *   "categories": ["Revenue", "Fixed", "Variable"]
 * }
 *
 * A directory holding only config.yaml raises DataLoadError asking for the
 * file to be converted to config.json.
 */
UserConfig loadConfig(const std::filesystem::path& user_dir);

// Decodes configuration from JSON text (used by loadConfig).
UserConfig parseConfig(const std::string& json_text, const std::string& source = "config");

/**
 * Reads `<user_dir>/ledger.csv` with header
 * `date,amount,description,category,forecast`.
 */
std::vector<Transaction> loadLedger(const std::filesystem::path& user_dir);

// Decodes ledger rows from CSV text (used by loadLedger).
std::vector<Transaction> parseLedger(std::istream& input, const std::string& source = "ledger");

// Rows flagged as forecasts, in ledger order.
std::vector<Transaction> forecastOnly(const std::vector<Transaction>& transactions);

/**
 * Splits one CSV line. Handles double-quoted fields and "" escapes.
 */
std::vector<std::string> splitCsvLine(const std::string& line);

// Quotes a field for CSV output when it contains a comma, quote or newline.
std::string escapeCsvField(const std::string& field);

}  // namespace data
}  // namespace cashflow

#endif  // CASHFLOW_DATA_DATA_LOADER_HPP_
