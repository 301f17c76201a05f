#ifndef CASHFLOW_SIMULATION_TRANSFER_ADVISOR_HPP_
#define CASHFLOW_SIMULATION_TRANSFER_ADVISOR_HPP_

#include "common/money.hpp"

#include <vector>

namespace cashflow {

/**
 * Abstract base class for month-end transfer decisions.
 * Implementations are pure functions of their inputs and know nothing about
 * dates.
 */
class TransferAdvisor {
 public:
  virtual ~TransferAdvisor() = default;

  /**
   * Returns the amount to sweep out of the account (never negative).
   * `future_balances` is a look-ahead projection that already assumes the
   * full surplus has been removed.
   * Throws BalanceOverflowError when the inputs are too far apart to subtract.
   */
  virtual Cents recommend(Cents month_end_balance, Cents target_balance,
                          const std::vector<Cents>& future_balances) const = 0;
};

/**
 * Sweeps the surplus above target, holding back whatever the look-ahead
 * says would be needed to stay at or above target.
 *
 *   surplus   = max(0, month_end - target)
 *   shortfall = max(0, target - min(future))
 *   transfer  = max(0, surplus - shortfall)
 */
class SurplusTransferAdvisor : public TransferAdvisor {
 public:
  SurplusTransferAdvisor() = default;

  Cents recommend(Cents month_end_balance, Cents target_balance,
                  const std::vector<Cents>& future_balances) const override;
};

}  // namespace cashflow

#endif  // CASHFLOW_SIMULATION_TRANSFER_ADVISOR_HPP_
