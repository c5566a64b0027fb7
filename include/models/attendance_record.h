#pragma once

#include "models/calendar.h"
#include <json/json.h>
#include <optional>
#include <string>

/**
 * @brief How a record entered the ledger
 */
enum class EntryKind {
  Automatic, // Produced by a recognition event, subject to daily dedup
  Manual     // Operator correction, never deduplicated
};

std::string entryKindToString(EntryKind kind);
std::optional<EntryKind> entryKindFromString(const std::string &text);

/**
 * @brief One immutable line of the attendance ledger
 */
struct AttendanceRecord {
  static constexpr const char *kStatusPresent = "Present";

  std::string label;       // Identity label
  CalendarDate date;       // Partition key
  TimeOfDay time;          // Time of day of the check-in
  LocalDateTime timestamp; // Full local timestamp
  std::string weekday;     // "Monday" ... "Sunday"
  std::string status = kStatusPresent; // Present, Late, Absent or custom
  EntryKind entryKind = EntryKind::Automatic;

  /**
   * @brief Build a record whose date, time and weekday derive from timestamp
   */
  static AttendanceRecord create(const std::string &label,
                                 const LocalDateTime &timestamp,
                                 const std::string &status, EntryKind kind);

  /**
   * @brief Validate record fields
   */
  bool validate(std::string &error) const;

  /**
   * @brief Serialize with keys name, date, time, timestamp, day_of_week,
   * status, entry_type
   */
  Json::Value toJson() const;

  /**
   * @brief Parse a serialized record
   * @param json JSON value
   * @param error Optional error message output
   * @return Record if valid, nullopt otherwise
   */
  static std::optional<AttendanceRecord> fromJson(const Json::Value &json,
                                                  std::string *error = nullptr);
};
