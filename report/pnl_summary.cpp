#include "report/pnl_summary.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace cashflow {
namespace report {

namespace {

// Throws std::overflow_error when a monthly total leaves the range of Cents.
Cents checked(std::optional<Cents> value, const std::string& month) {
  if (!value) {
    throw std::overflow_error("P&L totals overflow for month " + month);
  }
  return *value;
}

bool isValidCategory(const std::string& category, const std::vector<std::string>& valid) {
  return std::find(valid.begin(), valid.end(), category) != valid.end();
}

// First and last day of a "YYYYMM" month.
std::pair<Date, Date> monthBounds(const std::string& month) {
  if (month.size() != 6 ||
      !std::all_of(month.begin(), month.end(), [](unsigned char c) { return std::isdigit(c); })) {
    throw std::invalid_argument("Month must be in YYYYMM format: '" + month + "'");
  }
  const int year = std::stoi(month.substr(0, 4));
  const unsigned mon = static_cast<unsigned>(std::stoi(month.substr(4, 2)));
  if (mon < 1 || mon > 12) {
    throw std::invalid_argument("Month out of range: '" + month + "'");
  }
  const Date first(year, mon, 1);
  return {first, Date(year, mon, Date::daysInMonth(year, mon))};
}

}  // namespace

std::vector<Transaction> findUncategorized(const std::vector<Transaction>& transactions,
                                           const std::vector<std::string>& valid_categories) {
  std::vector<Transaction> uncategorized;
  for (const Transaction& tx : transactions) {
    if (!isValidCategory(tx.category, valid_categories)) {
      uncategorized.push_back(tx);
    }
  }
  return uncategorized;
}

PnlReport calculatePnl(const std::vector<Transaction>& transactions, const std::string& month,
                       const std::vector<std::string>& valid_categories) {
  const auto [first_day, last_day] = monthBounds(month);

  PnlReport report;
  for (const std::string& category : valid_categories) {
    report.categories.emplace_back(category, std::map<std::string, Cents>{});
  }

  PnlSummary& summary = report.summary;
  for (const Transaction& tx : transactions) {
    if (tx.date < first_day || tx.date > last_day) continue;
    if (!isValidCategory(tx.category, valid_categories)) continue;

    for (auto& [name, totals] : report.categories) {
      if (name == tx.category) {
        Cents& total = totals[tx.description];
        total = checked(money::add(total, tx.amount), month);
        break;
      }
    }

    // Expense lines are forced negative and income lines positive, whatever
    // sign the ledger used.
    const Cents magnitude = tx.amount < 0 ? checked(money::subtract(0, tx.amount), month)
                                          : tx.amount;
    if (tx.category == "Revenue") {
      summary.revenue = checked(money::add(summary.revenue, tx.amount), month);
    } else if (tx.category == "Fixed") {
      summary.fixed_expenses = checked(money::subtract(summary.fixed_expenses, magnitude), month);
    } else if (tx.category == "Variable") {
      summary.variable_expenses =
          checked(money::subtract(summary.variable_expenses, magnitude), month);
    } else if (tx.category == "Misc Income") {
      summary.misc_income = checked(money::add(summary.misc_income, magnitude), month);
    } else if (tx.category == "Misc Expense") {
      summary.misc_expenses = checked(money::subtract(summary.misc_expenses, magnitude), month);
    }
  }

  summary.profit_margin = checked(money::add(summary.revenue, summary.fixed_expenses), month);
  summary.profit_margin =
      checked(money::add(summary.profit_margin, summary.variable_expenses), month);
  summary.net_income = checked(money::add(summary.profit_margin, summary.misc_income), month);
  summary.net_income = checked(money::add(summary.net_income, summary.misc_expenses), month);
  return report;
}

std::string formatPnl(const PnlReport& report) {
  std::ostringstream out;
  out << "CASH FLOW SUMMARY\n";
  out << std::string(40, '=') << "\n";

  for (const auto& [category, totals] : report.categories) {
    if (totals.empty()) continue;
    out << "\n" << category << ":\n";
    for (const auto& [description, amount] : totals) {
      out << "  " << description << ": " << money::format(amount) << "\n";
    }
  }

  const PnlSummary& s = report.summary;
  out << "\nCASH FLOW STATEMENT:\n";
  out << "  Revenue: " << money::format(s.revenue) << "\n";
  out << "  Fixed Expenses: " << money::format(s.fixed_expenses) << "\n";
  out << "  Variable Expenses: " << money::format(s.variable_expenses) << "\n";
  out << "  Profit Margin: " << money::format(s.profit_margin) << "\n";
  out << "  Misc Income: " << money::format(s.misc_income) << "\n";
  out << "  Misc Expenses: " << money::format(s.misc_expenses) << "\n";
  out << "  Net Income: " << money::format(s.net_income);
  return out.str();
}

}  // namespace report
}  // namespace cashflow
