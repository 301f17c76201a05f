#ifndef CASHFLOW_SIMULATION_TRANSACTION_HPP_
#define CASHFLOW_SIMULATION_TRANSACTION_HPP_

#include "common/date.hpp"
#include "common/money.hpp"

#include <string>
#include <vector>

namespace cashflow {

// Description carried by every transfer the simulation injects.
constexpr const char* kSurplusTransferMarker = "Surplus Transfer";
constexpr const char* kSystemCategory = "System";

/**
 * A dated cash event from the ledger (historical or forecast).
 * Positive amounts are inflows, negative amounts are outflows.
 */
struct Transaction {
  Date date;
  Cents amount = 0;
  std::string description;
  std::string category;
  bool is_forecast = false;

  Transaction() = default;
  Transaction(const Date& d, Cents amt, const std::string& desc,
              const std::string& cat = "", bool forecast = false)
      : date(d), amount(amt), description(desc), category(cat), is_forecast(forecast) {}

  /**
   * Synthetic outflow representing a surplus sweep. Lives only inside one
   * simulation run.
   */
  static Transaction virtualTransfer(const Date& date, Cents transfer_amount) {
    return Transaction(date, -transfer_amount, kSurplusTransferMarker, kSystemCategory, true);
  }

  bool isVirtualTransfer() const {
    return description == kSurplusTransferMarker && category == kSystemCategory;
  }
};

enum class AlertType {
  OK,
  BELOW_TARGET
};

std::string alertTypeToString(AlertType type);

/**
 * One simulated day.
 */
struct DayRecord {
  Date date;
  Cents start_balance = 0;
  std::string transactions_summary;
  Cents net_change = 0;
  Cents end_balance = 0;
  AlertType alert_type = AlertType::OK;
  // Amount needed to bring end_balance back up to the target (0 when OK).
  Cents shortfall = 0;
};

/**
 * Output of a full simulation: the day table plus the transfers the run
 * injected, in chronological order.
 */
struct SimulationResult {
  std::vector<DayRecord> days;
  std::vector<Transaction> transfers;
};

}  // namespace cashflow

#endif  // CASHFLOW_SIMULATION_TRANSACTION_HPP_
