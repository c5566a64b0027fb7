#include "attendance/report_aggregator.h"
#include "attendance/attendance_ledger.h"
#include "core/logging_flags.h"
#include <plog/Log.h>
#include <algorithm>
#include <array>
#include <iterator>
#include <map>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

namespace {

const std::array<const char *, 7> kWeekdays = {
    "Monday", "Tuesday", "Wednesday", "Thursday",
    "Friday", "Saturday", "Sunday"};

std::string csvField(const std::string &value) {
  if (value.find_first_of(",\"\n\r") == std::string::npos) {
    return value;
  }
  std::string quoted = "\"";
  for (char c : value) {
    if (c == '"') {
      quoted += '"';
    }
    quoted += c;
  }
  quoted += '"';
  return quoted;
}

// Counts keyed by first appearance
void countInOrder(std::vector<std::pair<std::string, size_t>> &counts,
                  std::unordered_map<std::string, size_t> &index,
                  const std::string &key) {
  auto it = index.find(key);
  if (it == index.end()) {
    index.emplace(key, counts.size());
    counts.emplace_back(key, 1);
  } else {
    counts[it->second].second++;
  }
}

} // namespace

Json::Value AttendanceStatistics::toJson() const {
  Json::Value json(Json::objectValue);
  json["total_records"] = static_cast<Json::UInt64>(totalRecords);
  json["unique_identities"] = static_cast<Json::UInt64>(uniqueIdentities);
  json["date_range"] = startDate.toString() + " to " + endDate.toString();
  json["number_of_days"] = static_cast<Json::UInt64>(numberOfDays);
  json["average_daily_attendance"] = averageDailyAttendance;

  Json::Value daily(Json::objectValue);
  for (const auto &[date, count] : dailyCounts) {
    daily[date.toString()] = static_cast<Json::UInt64>(count);
  }
  json["daily_counts"] = daily;

  Json::Value perIdentity(Json::objectValue);
  for (const auto &[label, count] : perIdentityCounts) {
    perIdentity[label] = static_cast<Json::UInt64>(count);
  }
  json["per_identity_counts"] = perIdentity;

  Json::Value top(Json::arrayValue);
  for (const auto &[label, count] : topIdentities) {
    Json::Value item(Json::objectValue);
    item["name"] = label;
    item["count"] = static_cast<Json::UInt64>(count);
    top.append(item);
  }
  json["top_n"] = top;

  Json::Value weekdays(Json::objectValue);
  for (const auto &[weekday, count] : weekdayDistribution) {
    weekdays[weekday] = static_cast<Json::UInt64>(count);
  }
  json["weekday_distribution"] = weekdays;
  return json;
}

std::vector<AttendanceRecord>
ReportAggregator::range(const CalendarDate &start,
                        const CalendarDate &end) const {
  if (!start.isValid() || !end.isValid()) {
    throw std::invalid_argument("Invalid date in report range");
  }
  if (end < start) {
    throw std::invalid_argument("Start date " + start.toString() +
                                " is after end date " + end.toString());
  }

  std::vector<AttendanceRecord> records;
  for (const auto &date : ledger_.partitionDates()) {
    if (date < start || end < date) {
      continue;
    }
    auto day = ledger_.recordsFor(date);
    records.insert(records.end(), std::make_move_iterator(day.begin()),
                   std::make_move_iterator(day.end()));
  }

  if (isAttendanceLoggingEnabled()) {
    PLOG_DEBUG << "[ReportAggregator] " << records.size()
               << " record(s) between " << start.toString() << " and "
               << end.toString();
  }
  return records;
}

AttendanceStatistics
ReportAggregator::summarize(const std::vector<AttendanceRecord> &records,
                            const CalendarDate &start, const CalendarDate &end,
                            size_t topN) {
  AttendanceStatistics stats;
  stats.startDate = start;
  stats.endDate = end;
  stats.totalRecords = records.size();

  std::map<CalendarDate, size_t> daily;
  std::unordered_map<std::string, size_t> identityIndex;
  std::map<std::string, size_t> weekdays;
  for (const auto &record : records) {
    daily[record.date]++;
    countInOrder(stats.perIdentityCounts, identityIndex, record.label);
    weekdays[record.weekday.empty() ? "Unknown" : record.weekday]++;
  }

  stats.dailyCounts.assign(daily.begin(), daily.end());
  stats.numberOfDays = daily.size();
  stats.uniqueIdentities = stats.perIdentityCounts.size();
  if (stats.numberOfDays > 0) {
    stats.averageDailyAttendance = static_cast<double>(stats.totalRecords) /
                                   static_cast<double>(stats.numberOfDays);
  }

  // stable_sort keeps first-seen order among equal counts
  stats.topIdentities = stats.perIdentityCounts;
  std::stable_sort(stats.topIdentities.begin(), stats.topIdentities.end(),
                   [](const auto &a, const auto &b) {
                     return a.second > b.second;
                   });
  if (stats.topIdentities.size() > topN) {
    stats.topIdentities.resize(topN);
  }

  for (const char *name : kWeekdays) {
    auto it = weekdays.find(name);
    if (it != weekdays.end()) {
      stats.weekdayDistribution.emplace_back(name, it->second);
      weekdays.erase(it);
    }
  }
  for (const auto &[name, count] : weekdays) {
    stats.weekdayDistribution.emplace_back(name, count);
  }
  return stats;
}

AttendanceStatistics ReportAggregator::statistics(const CalendarDate &start,
                                                  const CalendarDate &end,
                                                  size_t topN) const {
  return summarize(range(start, end), start, end, topN);
}

std::string ReportAggregator::exportCsv(const CalendarDate &start,
                                        const CalendarDate &end) const {
  std::stringstream csv;
  csv << "name,date,time,timestamp,day_of_week,status,entry_type\n";
  for (const auto &record : range(start, end)) {
    csv << csvField(record.label) << "," << record.date.toString() << ","
        << record.time.toString() << "," << record.timestamp.toIsoString()
        << "," << csvField(record.weekday) << "," << csvField(record.status)
        << "," << entryKindToString(record.entryKind) << "\n";
  }
  return csv.str();
}
