#ifndef CASHFLOW_COMMON_MONEY_HPP_
#define CASHFLOW_COMMON_MONEY_HPP_

#include <cstdint>
#include <optional>
#include <string>

namespace cashflow {

// Amounts are fixed-point with two fractional digits (smallest currency unit).
using Cents = std::int64_t;

namespace money {

// Largest magnitude accepted from floating-point input (keeps sums far from
// int64 overflow).
constexpr double kMaxAbsUnits = 1e13;

/**
 * Converts a decimal currency value to cents, rounding half away from zero.
 * Returns nullopt when the value is NaN, infinite or out of range.
 */
std::optional<Cents> fromDouble(double value);

/**
 * Parses text such as "-1500.00", "+42", "3.5" or "1,200.00". At most two
 * fractional digits are accepted.
 */
std::optional<Cents> parse(const std::string& text);

// "-1500.00"
std::string format(Cents amount);

// Overflow-checked arithmetic. nullopt when the result does not fit in Cents.
std::optional<Cents> add(Cents lhs, Cents rhs);
std::optional<Cents> subtract(Cents lhs, Cents rhs);

inline double toDouble(Cents amount) { return static_cast<double>(amount) / 100.0; }

}  // namespace money
}  // namespace cashflow

#endif  // CASHFLOW_COMMON_MONEY_HPP_
