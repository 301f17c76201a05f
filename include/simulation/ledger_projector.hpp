#ifndef CASHFLOW_SIMULATION_LEDGER_PROJECTOR_HPP_
#define CASHFLOW_SIMULATION_LEDGER_PROJECTOR_HPP_

#include "simulation/transaction.hpp"

#include <string>
#include <vector>

namespace cashflow {

/**
 * Day-by-day balance projection over a fixed window.
 *
 * Stateless: every call is a pure function of its arguments, so the same
 * instance is used both for the outer simulation and for nested look-aheads.
 * Knows nothing about months or transfers.
 */
class DailyLedgerProjector {
 public:
  DailyLedgerProjector() = default;

  /**
   * Projects `window_days` consecutive days starting at `start_date`.
   * Transactions outside the window are ignored.
   *
   * Throws InvalidWindowError when window_days <= 0 and InvalidBalanceError
   * when a balance is not a finite, representable amount.
   */
  std::vector<DayRecord> project(double start_balance, double target_balance,
                                 const std::vector<Transaction>& transactions,
                                 const Date& start_date, int window_days) const;

  /**
   * Same projection on already-validated cent amounts.
   */
  std::vector<DayRecord> projectCents(Cents start_balance, Cents target_balance,
                                      const std::vector<Transaction>& transactions,
                                      const Date& start_date, int window_days) const;

  /**
   * Simulates a single day: sums every transaction dated `date` and
   * classifies the resulting balance against the target.
   * Throws BalanceOverflowError if the day's totals do not fit in Cents.
   */
  DayRecord projectDay(Cents start_balance, Cents target_balance,
                       const std::vector<Transaction>& transactions, const Date& date) const;

  // Input validation shared with the orchestrator.
  static void validateWindow(int window_days);
  static Cents validateBalance(const std::string& name, double value);
};

}  // namespace cashflow

#endif  // CASHFLOW_SIMULATION_LEDGER_PROJECTOR_HPP_
