#pragma once

#include <optional>
#include <string>

/**
 * @brief Proleptic Gregorian calendar date
 *
 * Ledger partitions are keyed by this type. Arithmetic is done on a
 * day count relative to 1970-01-01 so no time zone is involved.
 */
struct CalendarDate {
  int year = 1970;
  int month = 1; // 1-12
  int day = 1;   // 1-31

  /**
   * @brief Parse "YYYY-MM-DD"
   * @return Date if the string is well-formed and the day exists
   */
  static std::optional<CalendarDate> parse(const std::string &text);

  static CalendarDate fromDaysSinceEpoch(long days);

  long daysSinceEpoch() const;
  CalendarDate addDays(long days) const;

  /**
   * @brief ISO weekday, Monday = 0 ... Sunday = 6
   */
  int weekdayIndex() const;

  /**
   * @brief English weekday name ("Monday" ... "Sunday")
   */
  std::string weekdayName() const;

  bool isValid() const;

  /**
   * @brief Format as "YYYY-MM-DD"
   */
  std::string toString() const;

  bool operator==(const CalendarDate &other) const;
  bool operator!=(const CalendarDate &other) const { return !(*this == other); }
  bool operator<(const CalendarDate &other) const;
  bool operator<=(const CalendarDate &other) const { return !(other < *this); }
  bool operator>(const CalendarDate &other) const { return other < *this; }
};

/**
 * @brief Wall-clock time of day with second resolution
 */
struct TimeOfDay {
  int hour = 0;
  int minute = 0;
  int second = 0;

  /**
   * @brief Parse "HH:MM:SS" or "HH:MM"
   */
  static std::optional<TimeOfDay> parse(const std::string &text);

  bool isValid() const;

  /**
   * @brief Format as "HH:MM:SS"
   */
  std::string toString() const;

  bool operator==(const TimeOfDay &other) const;
  bool operator<(const TimeOfDay &other) const;
};

/**
 * @brief Local date and time of an attendance event
 */
struct LocalDateTime {
  CalendarDate date;
  TimeOfDay time;

  /**
   * @brief Parse "YYYY-MM-DDTHH:MM[:SS[.ffffff]]" (a space is accepted in
   * place of 'T'; fractional seconds are dropped)
   */
  static std::optional<LocalDateTime> parse(const std::string &text);

  /**
   * @brief Current local time from the system clock
   */
  static LocalDateTime now();

  /**
   * @brief Format as "YYYY-MM-DDTHH:MM:SS"
   */
  std::string toIsoString() const;

  bool operator==(const LocalDateTime &other) const;
};
