#include "data/data_loader.hpp"

#include "observability/logger.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>
#include <unordered_map>

namespace cashflow {
namespace data {

namespace {

std::string trim(const std::string& text) {
  const auto begin = text.find_first_not_of(" \t");
  if (begin == std::string::npos) return "";
  const auto end = text.find_last_not_of(" \t");
  return text.substr(begin, end - begin + 1);
}

double requireNumber(const nlohmann::json& doc, const std::string& key, const std::string& source) {
  if (!doc.contains(key)) {
    throw DataLoadError(source + ": missing required key '" + key + "'");
  }
  const nlohmann::json& value = doc.at(key);
  if (!value.is_number()) {
    throw DataLoadError(source + ": '" + key + "' must be a number");
  }
  return value.get<double>();
}

}  // namespace

UserConfig parseConfig(const std::string& json_text, const std::string& source) {
  nlohmann::json doc;
  try {
    doc = nlohmann::json::parse(json_text);
  } catch (const nlohmann::json::parse_error& e) {
    throw DataLoadError(source + ": invalid JSON: " + std::string(e.what()));
  }
  if (!doc.is_object()) {
    throw DataLoadError(source + ": top-level value must be an object");
  }

  UserConfig config;
  config.current_balance = requireNumber(doc, "current_balance", source);
  config.target_balance = requireNumber(doc, "target_balance", source);

  if (doc.contains("account_nickname")) {
    if (!doc["account_nickname"].is_string()) {
      throw DataLoadError(source + ": 'account_nickname' must be a string");
    }
    config.account_nickname = doc["account_nickname"].get<std::string>();
  }

  if (doc.contains("categories")) {
    const nlohmann::json& categories = doc["categories"];
    if (!categories.is_array()) {
      throw DataLoadError(source + ": 'categories' must be an array");
    }
    for (const auto& category : categories) {
      if (!category.is_string()) {
        throw DataLoadError(source + ": 'categories' entries must be strings");
      }
      config.categories.push_back(category.get<std::string>());
    }
  }
  return config;
}

UserConfig loadConfig(const std::filesystem::path& user_dir) {
  const std::filesystem::path config_path = user_dir / kConfigFileName;
  std::ifstream file(config_path);
  if (!file) {
    const std::filesystem::path legacy_path = user_dir / kLegacyConfigFileName;
    std::error_code ec;
    if (std::filesystem::exists(legacy_path, ec)) {
      LOG_WARN("Ignoring YAML config: " + legacy_path.string());
      throw DataLoadError("Config file not found: " + config_path.string() + " (found " +
                          legacy_path.string() +
                          ", which is not read; convert it to config.json)");
    }
    throw DataLoadError("Config file not found: " + config_path.string());
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  UserConfig config = parseConfig(buffer.str(), config_path.string());

  LOG_BUILDER(observability::LogLevel::DEBUG, "Loaded config")
      .field("path", config_path.string())
      .field("categories", static_cast<int>(config.categories.size()));
  return config;
}

std::vector<std::string> splitCsvLine(const std::string& line) {
  std::vector<std::string> fields;
  std::string current;
  bool in_quotes = false;

  for (size_t i = 0; i < line.size(); ++i) {
    const char c = line[i];
    if (in_quotes) {
      if (c == '"') {
        if (i + 1 < line.size() && line[i + 1] == '"') {
          current += '"';
          ++i;
        } else {
          in_quotes = false;
        }
      } else {
        current += c;
      }
    } else if (c == '"') {
      in_quotes = true;
    } else if (c == ',') {
      fields.push_back(current);
      current.clear();
    } else {
      current += c;
    }
  }
  fields.push_back(current);
  return fields;
}

std::string escapeCsvField(const std::string& field) {
  if (field.find_first_of(",\"\n\r") == std::string::npos) {
    return field;
  }
  std::string out = "\"";
  for (char c : field) {
    if (c == '"') out += '"';
    out += c;
  }
  out += '"';
  return out;
}

std::vector<Transaction> parseLedger(std::istream& input, const std::string& source) {
  std::string line;
  if (!std::getline(input, line)) {
    throw DataLoadError(source + ": missing header row");
  }
  if (!line.empty() && line.back() == '\r') line.pop_back();

  // Columns are located by name, like the header of a spreadsheet export.
  std::unordered_map<std::string, size_t> columns;
  const std::vector<std::string> header = splitCsvLine(line);
  for (size_t i = 0; i < header.size(); ++i) {
    columns[trim(header[i])] = i;
  }
  for (const char* required : {"date", "amount"}) {
    if (columns.find(required) == columns.end()) {
      throw DataLoadError(source + ": header is missing column '" + required + "'");
    }
  }

  auto column = [&columns](const std::vector<std::string>& row, const char* name) {
    auto it = columns.find(name);
    if (it == columns.end() || it->second >= row.size()) return std::string();
    return row[it->second];
  };

  std::vector<Transaction> transactions;
  int line_number = 1;
  while (std::getline(input, line)) {
    ++line_number;
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (trim(line).empty()) continue;

    const std::vector<std::string> row = splitCsvLine(line);
    if (row.size() != header.size()) {
      throw DataLoadError(source + ":" + std::to_string(line_number) + ": expected " +
                          std::to_string(header.size()) + " fields, found " +
                          std::to_string(row.size()));
    }

    const std::string date_text = trim(column(row, "date"));
    auto date = Date::parse(date_text);
    if (!date) {
      throw DataLoadError(source + ":" + std::to_string(line_number) + ": invalid date '" +
                          date_text + "'");
    }

    const std::string amount_text = column(row, "amount");
    auto amount = money::parse(amount_text);
    if (!amount) {
      throw DataLoadError(source + ":" + std::to_string(line_number) + ": invalid amount '" +
                          amount_text + "'");
    }

    const std::string forecast = trim(column(row, "forecast"));
    transactions.emplace_back(*date, *amount, column(row, "description"),
                              column(row, "category"), forecast == "1");
  }
  return transactions;
}

std::vector<Transaction> loadLedger(const std::filesystem::path& user_dir) {
  const std::filesystem::path ledger_path = user_dir / kLedgerFileName;
  std::ifstream file(ledger_path);
  if (!file) {
    throw DataLoadError("Ledger file not found: " + ledger_path.string());
  }

  std::vector<Transaction> transactions = parseLedger(file, ledger_path.string());
  LOG_BUILDER(observability::LogLevel::DEBUG, "Loaded ledger")
      .field("path", ledger_path.string())
      .field("rows", static_cast<int>(transactions.size()));
  return transactions;
}

std::vector<Transaction> forecastOnly(const std::vector<Transaction>& transactions) {
  std::vector<Transaction> forecast;
  for (const Transaction& tx : transactions) {
    if (tx.is_forecast) forecast.push_back(tx);
  }
  return forecast;
}

}  // namespace data
}  // namespace cashflow
