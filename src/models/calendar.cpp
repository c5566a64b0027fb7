#include "models/calendar.h"
#include <array>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>

namespace {

bool isLeapYear(int year) {
  return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int daysInMonth(int year, int month) {
  static const std::array<int, 12> kDays = {31, 28, 31, 30, 31, 30,
                                            31, 31, 30, 31, 30, 31};
  if (month == 2 && isLeapYear(year)) {
    return 29;
  }
  return kDays[month - 1];
}

// Parses exactly `width` decimal digits starting at `pos`.
bool parseDigits(const std::string &text, size_t pos, size_t width, int &out) {
  if (pos + width > text.size()) {
    return false;
  }
  int value = 0;
  for (size_t i = pos; i < pos + width; ++i) {
    if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
      return false;
    }
    value = value * 10 + (text[i] - '0');
  }
  out = value;
  return true;
}

} // namespace

std::optional<CalendarDate> CalendarDate::parse(const std::string &text) {
  if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
    return std::nullopt;
  }
  CalendarDate date;
  if (!parseDigits(text, 0, 4, date.year) ||
      !parseDigits(text, 5, 2, date.month) ||
      !parseDigits(text, 8, 2, date.day)) {
    return std::nullopt;
  }
  if (!date.isValid()) {
    return std::nullopt;
  }
  return date;
}

// Civil-from-days / days-from-civil after H. Hinnant's chrono algorithms.
CalendarDate CalendarDate::fromDaysSinceEpoch(long days) {
  days += 719468;
  const long era = (days >= 0 ? days : days - 146096) / 146097;
  const long doe = days - era * 146097;
  const long yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const long doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const long mp = (5 * doy + 2) / 153;

  CalendarDate date;
  date.day = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
  date.month = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
  date.year = static_cast<int>(yoe + era * 400 + (date.month <= 2 ? 1 : 0));
  return date;
}

long CalendarDate::daysSinceEpoch() const {
  const long y = year - (month <= 2 ? 1 : 0);
  const long era = (y >= 0 ? y : y - 399) / 400;
  const long yoe = y - era * 400;
  const long doy = (153 * (month > 2 ? month - 3 : month + 9) + 2) / 5 + day - 1;
  const long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + doe - 719468;
}

CalendarDate CalendarDate::addDays(long days) const {
  return fromDaysSinceEpoch(daysSinceEpoch() + days);
}

int CalendarDate::weekdayIndex() const {
  // 1970-01-01 was a Thursday (index 3)
  long days = daysSinceEpoch();
  long index = (days + 3) % 7;
  if (index < 0) {
    index += 7;
  }
  return static_cast<int>(index);
}

std::string CalendarDate::weekdayName() const {
  static const std::array<const char *, 7> kNames = {
      "Monday", "Tuesday", "Wednesday", "Thursday",
      "Friday", "Saturday", "Sunday"};
  return kNames[weekdayIndex()];
}

bool CalendarDate::isValid() const {
  if (year < 1 || year > 9999 || month < 1 || month > 12) {
    return false;
  }
  return day >= 1 && day <= daysInMonth(year, month);
}

std::string CalendarDate::toString() const {
  char buffer[16];
  std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d", year, month, day);
  return buffer;
}

bool CalendarDate::operator==(const CalendarDate &other) const {
  return year == other.year && month == other.month && day == other.day;
}

bool CalendarDate::operator<(const CalendarDate &other) const {
  if (year != other.year) return year < other.year;
  if (month != other.month) return month < other.month;
  return day < other.day;
}

std::optional<TimeOfDay> TimeOfDay::parse(const std::string &text) {
  if (text.size() != 5 && text.size() != 8) {
    return std::nullopt;
  }
  TimeOfDay time;
  if (text[2] != ':' || !parseDigits(text, 0, 2, time.hour) ||
      !parseDigits(text, 3, 2, time.minute)) {
    return std::nullopt;
  }
  if (text.size() == 8 &&
      (text[5] != ':' || !parseDigits(text, 6, 2, time.second))) {
    return std::nullopt;
  }
  if (!time.isValid()) {
    return std::nullopt;
  }
  return time;
}

bool TimeOfDay::isValid() const {
  return hour >= 0 && hour < 24 && minute >= 0 && minute < 60 &&
         second >= 0 && second < 60;
}

std::string TimeOfDay::toString() const {
  char buffer[16];
  std::snprintf(buffer, sizeof(buffer), "%02d:%02d:%02d", hour, minute,
                second);
  return buffer;
}

bool TimeOfDay::operator==(const TimeOfDay &other) const {
  return hour == other.hour && minute == other.minute &&
         second == other.second;
}

bool TimeOfDay::operator<(const TimeOfDay &other) const {
  if (hour != other.hour) return hour < other.hour;
  if (minute != other.minute) return minute < other.minute;
  return second < other.second;
}

std::optional<LocalDateTime> LocalDateTime::parse(const std::string &text) {
  if (text.size() < 16 || (text[10] != 'T' && text[10] != ' ')) {
    return std::nullopt;
  }
  auto date = CalendarDate::parse(text.substr(0, 10));
  if (!date) {
    return std::nullopt;
  }

  std::string timePart = text.substr(11);
  size_t fraction = timePart.find('.');
  if (fraction != std::string::npos) {
    std::string digits = timePart.substr(fraction + 1);
    if (digits.empty() ||
        digits.find_first_not_of("0123456789") != std::string::npos) {
      return std::nullopt;
    }
    timePart = timePart.substr(0, fraction);
  }
  auto time = TimeOfDay::parse(timePart);
  if (!time) {
    return std::nullopt;
  }
  return LocalDateTime{*date, *time};
}

LocalDateTime LocalDateTime::now() {
  auto now = std::chrono::system_clock::now();
  std::time_t time_t = std::chrono::system_clock::to_time_t(now);
  std::tm local{};
  localtime_r(&time_t, &local);

  LocalDateTime result;
  result.date.year = local.tm_year + 1900;
  result.date.month = local.tm_mon + 1;
  result.date.day = local.tm_mday;
  result.time.hour = local.tm_hour;
  result.time.minute = local.tm_min;
  // tm_sec may report a leap second
  result.time.second = local.tm_sec > 59 ? 59 : local.tm_sec;
  return result;
}

std::string LocalDateTime::toIsoString() const {
  return date.toString() + "T" + time.toString();
}

bool LocalDateTime::operator==(const LocalDateTime &other) const {
  return date == other.date && time == other.time;
}
