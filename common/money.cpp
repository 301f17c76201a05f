#include "common/money.hpp"

#include <cctype>
#include <cmath>

namespace cashflow {
namespace money {

std::optional<Cents> fromDouble(double value) {
  if (!std::isfinite(value) || std::fabs(value) > kMaxAbsUnits) {
    return std::nullopt;
  }
  return static_cast<Cents>(std::llround(value * 100.0));
}

std::optional<Cents> parse(const std::string& text) {
  size_t begin = 0;
  size_t end = text.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
  while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
  if (begin == end) return std::nullopt;

  bool negative = false;
  if (text[begin] == '-' || text[begin] == '+') {
    negative = text[begin] == '-';
    ++begin;
  }

  Cents units = 0;
  Cents fraction = 0;
  int fraction_digits = 0;
  bool seen_digit = false;
  bool in_fraction = false;

  for (size_t i = begin; i < end; ++i) {
    const char c = text[i];
    if (c == '.') {
      if (in_fraction) return std::nullopt;
      in_fraction = true;
    } else if (c == ',' && !in_fraction) {
      // thousands separator
      continue;
    } else if (std::isdigit(static_cast<unsigned char>(c))) {
      seen_digit = true;
      if (in_fraction) {
        if (++fraction_digits > 2) return std::nullopt;
        fraction = fraction * 10 + (c - '0');
      } else {
        units = units * 10 + (c - '0');
        if (units > static_cast<Cents>(kMaxAbsUnits)) return std::nullopt;
      }
    } else {
      return std::nullopt;
    }
  }
  if (!seen_digit) return std::nullopt;
  if (fraction_digits == 1) fraction *= 10;

  const Cents total = units * 100 + fraction;
  return negative ? -total : total;
}

std::optional<Cents> add(Cents lhs, Cents rhs) {
  Cents sum = 0;
  if (__builtin_add_overflow(lhs, rhs, &sum)) return std::nullopt;
  return sum;
}

std::optional<Cents> subtract(Cents lhs, Cents rhs) {
  Cents difference = 0;
  if (__builtin_sub_overflow(lhs, rhs, &difference)) return std::nullopt;
  return difference;
}

std::string format(Cents amount) {
  const bool negative = amount < 0;
  // Work in unsigned space so INT64_MIN does not overflow on negation.
  const std::uint64_t magnitude =
      negative ? static_cast<std::uint64_t>(-(amount + 1)) + 1 : static_cast<std::uint64_t>(amount);
  const std::uint64_t units = magnitude / 100;
  const std::uint64_t cents = magnitude % 100;

  std::string out = negative ? "-" : "";
  out += std::to_string(units);
  out += '.';
  if (cents < 10) out += '0';
  out += std::to_string(cents);
  return out;
}

}  // namespace money
}  // namespace cashflow
