#include "simulation/ledger_projector.hpp"

#include "simulation/simulation_error.hpp"

namespace cashflow {

void DailyLedgerProjector::validateWindow(int window_days) {
  if (window_days <= 0) {
    throw InvalidWindowError(window_days);
  }
}

Cents DailyLedgerProjector::validateBalance(const std::string& name, double value) {
  auto cents = money::fromDouble(value);
  if (!cents) {
    throw InvalidBalanceError(name, value);
  }
  return *cents;
}

std::vector<DayRecord> DailyLedgerProjector::project(double start_balance, double target_balance,
                                                     const std::vector<Transaction>& transactions,
                                                     const Date& start_date,
                                                     int window_days) const {
  validateWindow(window_days);
  const Cents start = validateBalance("start_balance", start_balance);
  const Cents target = validateBalance("target_balance", target_balance);
  return projectCents(start, target, transactions, start_date, window_days);
}

std::vector<DayRecord> DailyLedgerProjector::projectCents(
    Cents start_balance, Cents target_balance, const std::vector<Transaction>& transactions,
    const Date& start_date, int window_days) const {
  validateWindow(window_days);

  std::vector<DayRecord> days;
  days.reserve(static_cast<size_t>(window_days));

  Cents balance = start_balance;
  for (int offset = 0; offset < window_days; ++offset) {
    days.push_back(projectDay(balance, target_balance, transactions, start_date.addDays(offset)));
    balance = days.back().end_balance;
  }
  return days;
}

DayRecord DailyLedgerProjector::projectDay(Cents start_balance, Cents target_balance,
                                           const std::vector<Transaction>& transactions,
                                           const Date& date) const {
  DayRecord record;
  record.date = date;
  record.start_balance = start_balance;

  auto checked = [&date](std::optional<Cents> value) {
    if (!value) throw BalanceOverflowError("on " + date.toString());
    return *value;
  };

  // Ledger order is preserved so the summary reads the way the ledger does.
  for (const Transaction& tx : transactions) {
    if (tx.date != date) continue;
    record.net_change = checked(money::add(record.net_change, tx.amount));
    if (!record.transactions_summary.empty()) {
      record.transactions_summary += ", ";
    }
    record.transactions_summary += tx.description + ": " + money::format(tx.amount);
  }

  record.end_balance = checked(money::add(start_balance, record.net_change));
  if (record.end_balance < target_balance) {
    record.alert_type = AlertType::BELOW_TARGET;
    record.shortfall = checked(money::subtract(target_balance, record.end_balance));
  } else {
    record.alert_type = AlertType::OK;
  }
  return record;
}

std::string alertTypeToString(AlertType type) {
  switch (type) {
    case AlertType::OK: return "OK";
    case AlertType::BELOW_TARGET: return "BELOW_TARGET";
    default: return "UNKNOWN";
  }
}

}  // namespace cashflow
