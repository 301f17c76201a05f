#ifndef CASHFLOW_SIMULATION_SIMULATION_ORCHESTRATOR_HPP_
#define CASHFLOW_SIMULATION_SIMULATION_ORCHESTRATOR_HPP_

#include "simulation/ledger_projector.hpp"
#include "simulation/transfer_advisor.hpp"
#include "simulation/transaction.hpp"

#include <memory>
#include <vector>

namespace cashflow {

/**
 * Runs the day-by-day projection and applies the month-end surplus rule.
 *
 * At the last calendar day of each month inside the window, a 30-day
 * look-ahead is projected from the target balance (as if the whole surplus
 * had been swept). The advisor turns that series into a transfer amount, and
 * a virtual transfer dated the first of the next month is appended to the
 * run's working ledger. Later days and later look-aheads see it; the caller's
 * transactions are never touched.
 */
class SimulationOrchestrator {
 public:
  static constexpr int kLookAheadDays = 30;

  SimulationOrchestrator();
  explicit SimulationOrchestrator(std::unique_ptr<TransferAdvisor> advisor);
  ~SimulationOrchestrator() = default;

  // Non-copyable
  SimulationOrchestrator(const SimulationOrchestrator&) = delete;
  SimulationOrchestrator& operator=(const SimulationOrchestrator&) = delete;

  /**
   * Simulates `window_days` days from `start_date`.
   *
   * Throws InvalidWindowError / InvalidBalanceError before doing any work.
   */
  SimulationResult simulate(double start_balance, double target_balance,
                            const std::vector<Transaction>& transactions,
                            const Date& start_date, int window_days) const;

 private:
  // Evaluates one decision point. Returns the transfer amount (0 for none).
  Cents decideTransfer(const DayRecord& month_end, Cents target_balance,
                       const std::vector<Transaction>& working) const;

  DailyLedgerProjector projector_;
  std::unique_ptr<TransferAdvisor> advisor_;
};

}  // namespace cashflow

#endif  // CASHFLOW_SIMULATION_SIMULATION_ORCHESTRATOR_HPP_
