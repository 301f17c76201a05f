#include "common/date.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace cashflow {

namespace {

struct Civil {
  int year;
  unsigned month;
  unsigned day;
};

// Days since 1970-01-01 for a proleptic Gregorian date (era-based, valid for
// any year representable in int).
long daysFromCivil(int y, unsigned m, unsigned d) {
  y -= m <= 2 ? 1 : 0;
  const long era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<long>(doe) - 719468;
}

Civil civilFromDays(long z) {
  z += 719468;
  const long era = (z >= 0 ? z : z - 146096) / 146097;
  const unsigned doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const long y = static_cast<long>(yoe) + era * 400;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp = (5 * doy + 2) / 153;
  const unsigned d = doy - (153 * mp + 2) / 5 + 1;
  const unsigned m = mp < 10 ? mp + 3 : mp - 9;
  return Civil{static_cast<int>(y + (m <= 2 ? 1 : 0)), m, d};
}

bool allDigits(const std::string& s, size_t pos, size_t len) {
  for (size_t i = pos; i < pos + len; ++i) {
    if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
  }
  return true;
}

}  // namespace

Date::Date(int year, unsigned month, unsigned day) {
  if (month < 1 || month > 12 || day < 1 || day > daysInMonth(year, month)) {
    throw std::invalid_argument("Invalid calendar date: " + std::to_string(year) + "-" +
                                std::to_string(month) + "-" + std::to_string(day));
  }
  days_ = daysFromCivil(year, month, day);
}

std::optional<Date> Date::parse(const std::string& text) {
  if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
    return std::nullopt;
  }
  if (!allDigits(text, 0, 4) || !allDigits(text, 5, 2) || !allDigits(text, 8, 2)) {
    return std::nullopt;
  }
  const int year = std::stoi(text.substr(0, 4));
  const unsigned month = static_cast<unsigned>(std::stoi(text.substr(5, 2)));
  const unsigned day = static_cast<unsigned>(std::stoi(text.substr(8, 2)));
  if (month < 1 || month > 12 || day < 1 || day > daysInMonth(year, month)) {
    return std::nullopt;
  }
  return Date(year, month, day);
}

Date Date::today() {
  std::time_t now = std::time(nullptr);
  std::tm local{};
  localtime_r(&now, &local);
  return Date(local.tm_year + 1900, static_cast<unsigned>(local.tm_mon + 1),
              static_cast<unsigned>(local.tm_mday));
}

int Date::year() const { return civilFromDays(days_).year; }

unsigned Date::month() const { return civilFromDays(days_).month; }

unsigned Date::day() const { return civilFromDays(days_).day; }

bool Date::isLastDayOfMonth() const {
  const Civil c = civilFromDays(days_);
  return c.day == daysInMonth(c.year, c.month);
}

Date Date::firstOfNextMonth() const {
  const Civil c = civilFromDays(days_);
  if (c.month == 12) {
    return Date(c.year + 1, 1, 1);
  }
  return Date(c.year, c.month + 1, 1);
}

std::string Date::toString() const {
  const Civil c = civilFromDays(days_);
  std::ostringstream ss;
  ss << std::setfill('0') << std::setw(4) << c.year << '-' << std::setw(2) << c.month << '-'
     << std::setw(2) << c.day;
  return ss.str();
}

std::string Date::toCompactString() const {
  const Civil c = civilFromDays(days_);
  std::ostringstream ss;
  ss << std::setfill('0') << std::setw(4) << c.year << std::setw(2) << c.month << std::setw(2)
     << c.day;
  return ss.str();
}

bool Date::isLeapYear(int year) {
  return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

unsigned Date::daysInMonth(int year, unsigned month) {
  static const unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (month == 2 && isLeapYear(year)) return 29;
  return kDays[month - 1];
}

std::ostream& operator<<(std::ostream& os, const Date& date) {
  return os << date.toString();
}

}  // namespace cashflow
