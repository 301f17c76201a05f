#include "simulation/simulation_orchestrator.hpp"

#include "observability/logger.hpp"

#include <algorithm>
#include <stdexcept>

namespace cashflow {

using observability::LogLevel;

SimulationOrchestrator::SimulationOrchestrator()
    : advisor_(std::make_unique<SurplusTransferAdvisor>()) {}

SimulationOrchestrator::SimulationOrchestrator(std::unique_ptr<TransferAdvisor> advisor)
    : advisor_(std::move(advisor)) {
  if (!advisor_) {
    throw std::invalid_argument("SimulationOrchestrator requires a transfer advisor");
  }
}

SimulationResult SimulationOrchestrator::simulate(double start_balance, double target_balance,
                                                  const std::vector<Transaction>& transactions,
                                                  const Date& start_date,
                                                  int window_days) const {
  DailyLedgerProjector::validateWindow(window_days);
  const Cents start = DailyLedgerProjector::validateBalance("start_balance", start_balance);
  const Cents target = DailyLedgerProjector::validateBalance("target_balance", target_balance);

  // Run-local copy; only ever appended to.
  std::vector<Transaction> working(transactions);

  SimulationResult result;
  result.days.reserve(static_cast<size_t>(window_days));

  Cents balance = start;
  for (int offset = 0; offset < window_days; ++offset) {
    const Date date = start_date.addDays(offset);
    DayRecord record = projector_.projectDay(balance, target, working, date);
    balance = record.end_balance;

    if (date.isLastDayOfMonth()) {
      const Cents transfer = decideTransfer(record, target, working);
      if (transfer > 0) {
        Transaction sweep = Transaction::virtualTransfer(date.firstOfNextMonth(), transfer);
        LOG_BUILDER(LogLevel::INFO, "Surplus transfer injected")
            .field("decision_date", date.toString())
            .field("transfer_date", sweep.date.toString())
            .field("amount", money::format(transfer));
        working.push_back(sweep);
        result.transfers.push_back(std::move(sweep));
      }
    }

    result.days.push_back(std::move(record));
  }

  LOG_BUILDER(LogLevel::DEBUG, "Simulation complete")
      .field("start_date", start_date.toString())
      .field("window_days", window_days)
      .field("transfers", static_cast<int>(result.transfers.size()));
  return result;
}

Cents SimulationOrchestrator::decideTransfer(const DayRecord& month_end, Cents target_balance,
                                             const std::vector<Transaction>& working) const {
  if (month_end.end_balance <= target_balance) {
    LOG_BUILDER(LogLevel::DEBUG, "No surplus at month end")
        .field("date", month_end.date.toString())
        .field("balance", money::format(month_end.end_balance));
    return 0;
  }

  // Stress test from the post-sweep balance; the result is discarded after
  // the advisor has seen it.
  const std::vector<DayRecord> look_ahead = projector_.projectCents(
      target_balance, target_balance, working, month_end.date.addDays(1), kLookAheadDays);

  std::vector<Cents> future_balances;
  future_balances.reserve(look_ahead.size());
  for (const DayRecord& day : look_ahead) {
    future_balances.push_back(day.end_balance);
  }

  const Cents recommended =
      advisor_->recommend(month_end.end_balance, target_balance, future_balances);

  LOG_BUILDER(LogLevel::DEBUG, "Month-end transfer decision")
      .field("date", month_end.date.toString())
      .field("month_end_balance", money::format(month_end.end_balance))
      .field("lowest_future",
             money::format(*std::min_element(future_balances.begin(), future_balances.end())))
      .field("recommended", money::format(recommended));

  // A custom advisor must not be able to turn a sweep into a deposit.
  return std::max<Cents>(0, recommended);
}

}  // namespace cashflow
