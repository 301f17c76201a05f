#ifndef CASHFLOW_REPORT_PNL_SUMMARY_HPP_
#define CASHFLOW_REPORT_PNL_SUMMARY_HPP_

#include "simulation/transaction.hpp"

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace cashflow {
namespace report {

/**
 * Cash flow statement lines for one month.
 */
struct PnlSummary {
  Cents revenue = 0;
  Cents fixed_expenses = 0;
  Cents variable_expenses = 0;
  Cents profit_margin = 0;
  Cents misc_income = 0;
  Cents misc_expenses = 0;
  Cents net_income = 0;
};

/**
 * Monthly profit and loss: per-category totals by description, in the order
 * the categories were configured, plus the statement summary.
 */
struct PnlReport {
  std::vector<std::pair<std::string, std::map<std::string, Cents>>> categories;
  PnlSummary summary;
};

/**
 * Transactions whose category is not one of `valid_categories`, in ledger
 * order.
 */
std::vector<Transaction> findUncategorized(const std::vector<Transaction>& transactions,
                                           const std::vector<std::string>& valid_categories);

/**
 * Aggregates the categorized transactions of `month` ("YYYYMM").
 * Throws std::invalid_argument for a malformed month and std::overflow_error
 * when a total does not fit in Cents.
 */
PnlReport calculatePnl(const std::vector<Transaction>& transactions, const std::string& month,
                       const std::vector<std::string>& valid_categories);

// Console rendering of a P&L report.
std::string formatPnl(const PnlReport& report);

}  // namespace report
}  // namespace cashflow

#endif  // CASHFLOW_REPORT_PNL_SUMMARY_HPP_
