#include "simulation/transfer_advisor.hpp"

#include "simulation/simulation_error.hpp"

#include <algorithm>

namespace cashflow {

Cents SurplusTransferAdvisor::recommend(Cents month_end_balance, Cents target_balance,
                                        const std::vector<Cents>& future_balances) const {
  auto checked = [](std::optional<Cents> value) {
    if (!value) throw BalanceOverflowError("in transfer recommendation");
    return *value;
  };

  const Cents surplus =
      std::max<Cents>(0, checked(money::subtract(month_end_balance, target_balance)));
  if (surplus == 0) {
    return 0;
  }

  // An empty look-ahead has nothing that could dip below target.
  if (future_balances.empty()) {
    return surplus;
  }

  const Cents lowest_future = *std::min_element(future_balances.begin(), future_balances.end());
  const Cents shortfall =
      std::max<Cents>(0, checked(money::subtract(target_balance, lowest_future)));
  return std::max<Cents>(0, surplus - shortfall);
}

}  // namespace cashflow
