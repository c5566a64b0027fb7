#pragma once

#include "models/attendance_record.h"
#include "models/calendar.h"
#include <json/json.h>
#include <string>
#include <utility>
#include <vector>

class AttendanceLedger;

/**
 * @brief Summary of the ledger over an inclusive date range
 *
 * Ordered containers keep the JSON output stable: daily counts by date,
 * per-identity counts by first appearance, weekdays Monday first.
 */
struct AttendanceStatistics {
  CalendarDate startDate;
  CalendarDate endDate;
  size_t totalRecords = 0;
  size_t uniqueIdentities = 0;
  size_t numberOfDays = 0;
  double averageDailyAttendance = 0.0;
  std::vector<std::pair<CalendarDate, size_t>> dailyCounts;
  std::vector<std::pair<std::string, size_t>> perIdentityCounts;
  std::vector<std::pair<std::string, size_t>> topIdentities;
  std::vector<std::pair<std::string, size_t>> weekdayDistribution;

  Json::Value toJson() const;
};

/**
 * @brief Read-only reporting over an AttendanceLedger
 */
class ReportAggregator {
public:
  explicit ReportAggregator(AttendanceLedger &ledger) : ledger_(ledger) {}

  /**
   * @brief Records dated within [start, end], by date then insertion order
   * @throws std::invalid_argument if start is after end
   */
  std::vector<AttendanceRecord> range(const CalendarDate &start,
                                      const CalendarDate &end) const;

  /**
   * @brief Aggregate range(start, end)
   * @param topN Length of the top identities list
   */
  AttendanceStatistics statistics(const CalendarDate &start,
                                  const CalendarDate &end,
                                  size_t topN = 10) const;

  /**
   * @brief range(start, end) as CSV with a header row
   */
  std::string exportCsv(const CalendarDate &start,
                        const CalendarDate &end) const;

  /**
   * @brief Summarize an already fetched record list
   */
  static AttendanceStatistics summarize(const std::vector<AttendanceRecord> &records,
                                        const CalendarDate &start,
                                        const CalendarDate &end, size_t topN);

private:
  AttendanceLedger &ledger_;
};
