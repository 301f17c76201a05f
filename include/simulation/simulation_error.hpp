#ifndef CASHFLOW_SIMULATION_SIMULATION_ERROR_HPP_
#define CASHFLOW_SIMULATION_SIMULATION_ERROR_HPP_

#include <stdexcept>
#include <string>

namespace cashflow {

/**
 * Base for caller-input errors raised by the projection core. Thrown before
 * any day is simulated, so no partial result ever exists.
 */
class SimulationError : public std::runtime_error {
 public:
  explicit SimulationError(const std::string& message) : std::runtime_error(message) {}
};

// window_days <= 0
class InvalidWindowError : public SimulationError {
 public:
  explicit InvalidWindowError(int window_days)
      : SimulationError("Invalid simulation window: " + std::to_string(window_days) +
                        " days (must be positive)"),
        window_days_(window_days) {}

  int windowDays() const { return window_days_; }

 private:
  int window_days_;
};

// Non-finite or unrepresentable start/target balance.
class InvalidBalanceError : public SimulationError {
 public:
  InvalidBalanceError(const std::string& name, double value)
      : SimulationError("Invalid " + name + ": " + std::to_string(value)), name_(name) {}

  const std::string& balanceName() const { return name_; }

 private:
  std::string name_;
};

// A running balance or total left the range of Cents.
class BalanceOverflowError : public SimulationError {
 public:
  explicit BalanceOverflowError(const std::string& where)
      : SimulationError("Balance overflow " + where) {}
};

}  // namespace cashflow

#endif  // CASHFLOW_SIMULATION_SIMULATION_ERROR_HPP_
