#ifndef CASHFLOW_COMMON_DATE_HPP_
#define CASHFLOW_COMMON_DATE_HPP_

#include <optional>
#include <ostream>
#include <string>

namespace cashflow {

/**
 * Calendar date without a time component (proleptic Gregorian).
 * Stored as a day count relative to 1970-01-01 so that ordering and
 * day arithmetic are plain integer operations.
 */
class Date {
 public:
  Date() = default;

  /**
   * Builds a date from its fields. Throws std::invalid_argument when the
   * fields do not name a real calendar day.
   */
  Date(int year, unsigned month, unsigned day);

  static Date fromDayNumber(long days) {
    Date d;
    d.days_ = days;
    return d;
  }

  /**
   * Parses "YYYY-MM-DD". Returns nullopt for malformed text or impossible
   * dates such as 2023-02-30.
   */
  static std::optional<Date> parse(const std::string& text);

  // Current local calendar date.
  static Date today();

  long dayNumber() const { return days_; }

  int year() const;
  unsigned month() const;
  unsigned day() const;

  Date addDays(long n) const { return fromDayNumber(days_ + n); }

  bool isLastDayOfMonth() const;
  Date firstOfNextMonth() const;

  // "YYYY-MM-DD"
  std::string toString() const;
  // "YYYYMMDD", used in output file names
  std::string toCompactString() const;

  bool operator==(const Date& other) const { return days_ == other.days_; }
  bool operator!=(const Date& other) const { return days_ != other.days_; }
  bool operator<(const Date& other) const { return days_ < other.days_; }
  bool operator<=(const Date& other) const { return days_ <= other.days_; }
  bool operator>(const Date& other) const { return days_ > other.days_; }
  bool operator>=(const Date& other) const { return days_ >= other.days_; }

  static bool isLeapYear(int year);
  static unsigned daysInMonth(int year, unsigned month);

 private:
  long days_ = 0;
};

std::ostream& operator<<(std::ostream& os, const Date& date);

}  // namespace cashflow

#endif  // CASHFLOW_COMMON_DATE_HPP_
