#include "attendance/attendance_ledger.h"
#include "core/attendance_errors.h"
#include "core/logging_flags.h"
#include "storage/attendance_storage.h"
#include <plog/Log.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <set>
#include <stdexcept>

namespace {

std::string toLower(const std::string &text) {
  std::string lower = text;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return lower;
}

long long secondsSinceEpoch(const LocalDateTime &value) {
  return static_cast<long long>(value.date.daysSinceEpoch()) * 86400 +
         value.time.hour * 3600 + value.time.minute * 60 + value.time.second;
}

} // namespace

Json::Value MarkResult::toJson() const {
  Json::Value json(Json::objectValue);
  json["status"] = operationStatusToString(status);
  json["name"] = record.label;
  json["date"] = record.date.toString();
  json["total_today"] = static_cast<Json::UInt64>(totalMarkedToday);
  if (status == OperationStatus::AlreadyMarked) {
    json["first_check_in"] = firstCheckInTime.toString();
    json["message"] = record.label + " already marked present today";
  } else {
    json["time"] = record.time.toString();
    json["timestamp"] = record.timestamp.toIsoString();
    json["message"] = "Attendance marked for " + record.label;
  }
  return json;
}

Json::Value SessionStatistics::toJson() const {
  Json::Value json(Json::objectValue);
  json["session_start"] = sessionStart.toIsoString();
  json["session_duration_minutes"] = durationMinutes;
  json["total_check_ins"] = static_cast<Json::UInt64>(totalCheckIns);
  json["unique_attendees"] = static_cast<Json::UInt64>(uniqueAttendeesToday);
  json["duplicate_attempts"] = static_cast<Json::UInt64>(duplicateAttempts);
  return json;
}

AttendanceLedger::AttendanceLedger(AttendanceStorage &storage, Clock clock)
    : storage_(storage), clock_(std::move(clock)) {
  if (!clock_) {
    throw std::invalid_argument("Ledger clock cannot be empty");
  }
  session_start_ = clock_();

  CalendarDate today = session_start_.date;
  auto part = partitionFor(today);
  std::lock_guard<std::mutex> lock(part->mutex);
  ensureLoadedUnlocked(today, *part);
  PLOG_INFO << "[AttendanceLedger] " << part->marked.size()
            << " identities already marked on " << today.toString();
}

std::shared_ptr<AttendanceLedger::DayPartition>
AttendanceLedger::partitionFor(const CalendarDate &date) {
  std::lock_guard<std::mutex> lock(partitions_mutex_);
  auto &slot = partitions_[date];
  if (!slot) {
    slot = std::make_shared<DayPartition>();
  }
  return slot;
}

void AttendanceLedger::evictIdlePartitions() {
  CalendarDate current = today();
  std::lock_guard<std::mutex> lock(partitions_mutex_);
  for (auto it = partitions_.begin(); it != partitions_.end();) {
    // Only the map holds it, so no caller can be inside its critical section
    if (it->first != current && it->second.use_count() == 1) {
      it = partitions_.erase(it);
    } else {
      ++it;
    }
  }
}

size_t AttendanceLedger::cachedPartitionCount() {
  std::lock_guard<std::mutex> lock(partitions_mutex_);
  return partitions_.size();
}

void AttendanceLedger::ensureLoadedUnlocked(const CalendarDate &date,
                                            DayPartition &part) {
  if (part.loaded) {
    return;
  }
  auto records = storage_.readPartition(date);
  std::unordered_set<std::string> marked;
  for (const auto &record : records) {
    if (record.entryKind == EntryKind::Automatic) {
      marked.insert(record.label);
    }
  }
  part.records = std::move(records);
  part.marked = std::move(marked);
  part.loaded = true;

  if (isAttendanceLoggingEnabled()) {
    PLOG_DEBUG << "[AttendanceLedger] Loaded " << part.records.size()
               << " record(s) for " << date.toString();
  }
}

void AttendanceLedger::checkRecord(const AttendanceRecord &record) {
  std::string error;
  if (!record.validate(error)) {
    throw std::invalid_argument(error);
  }
}

MarkResult AttendanceLedger::mark(const std::string &label,
                                  const LocalDateTime &timestamp) {
  MarkResult result = markInPartition(label, timestamp);
  evictIdlePartitions();
  return result;
}

MarkResult AttendanceLedger::markInPartition(const std::string &label,
                                             const LocalDateTime &timestamp) {
  AttendanceRecord record =
      AttendanceRecord::create(label, timestamp, AttendanceRecord::kStatusPresent,
                               EntryKind::Automatic);
  checkRecord(record);

  auto part = partitionFor(record.date);
  std::lock_guard<std::mutex> lock(part->mutex);
  ensureLoadedUnlocked(record.date, *part);

  MarkResult result;
  if (part->marked.count(label) > 0) {
    duplicate_attempts_++;
    auto first = std::find_if(part->records.begin(), part->records.end(),
                              [&label](const AttendanceRecord &r) {
                                return r.label == label &&
                                       r.entryKind == EntryKind::Automatic;
                              });
    result.status = OperationStatus::AlreadyMarked;
    result.totalMarkedToday = part->marked.size();
    if (first != part->records.end()) {
      result.firstCheckInTime = first->time;
      result.record = *first;
    }
    if (isAttendanceLoggingEnabled()) {
      PLOG_DEBUG << "[AttendanceLedger] '" << label << "' already marked on "
                 << record.date.toString() << " at "
                 << result.firstCheckInTime.toString();
    }
    return result;
  }

  // Storage first; memory changes only once the append is confirmed
  storage_.appendRecord(record.date, record);
  part->records.push_back(record);
  part->marked.insert(label);
  total_check_ins_++;

  result.status = OperationStatus::Success;
  result.firstCheckInTime = record.time;
  result.totalMarkedToday = part->marked.size();
  result.record = record;

  PLOG_INFO << "[AttendanceLedger] Attendance marked for '" << label << "' at "
            << record.timestamp.toIsoString();
  return result;
}

AttendanceRecord AttendanceLedger::manualEntry(const std::string &label,
                                               const CalendarDate &date,
                                               const TimeOfDay &time,
                                               const std::string &status) {
  AttendanceRecord record = AttendanceRecord::create(
      label, LocalDateTime{date, time}, status, EntryKind::Manual);
  checkRecord(record);

  {
    auto part = partitionFor(date);
    std::lock_guard<std::mutex> lock(part->mutex);
    ensureLoadedUnlocked(date, *part);

    storage_.appendRecord(date, record);
    part->records.push_back(record);
  }
  evictIdlePartitions();

  PLOG_INFO << "[AttendanceLedger] Manual entry for '" << label << "' on "
            << date.toString() << " " << time.toString() << " (" << status
            << ")";
  return record;
}

std::vector<AttendanceRecord>
AttendanceLedger::recordsFor(const CalendarDate &date) {
  std::vector<AttendanceRecord> records;
  {
    auto part = partitionFor(date);
    std::lock_guard<std::mutex> lock(part->mutex);
    ensureLoadedUnlocked(date, *part);
    records = part->records;
  }
  evictIdlePartitions();
  return records;
}

std::vector<AttendanceRecord> AttendanceLedger::todayRecords() {
  return recordsFor(today());
}

std::vector<CalendarDate> AttendanceLedger::partitionDates() {
  std::set<CalendarDate> dates;
  for (const auto &date : storage_.listPartitionDates()) {
    dates.insert(date);
  }

  std::vector<std::pair<CalendarDate, std::shared_ptr<DayPartition>>> cached;
  {
    std::lock_guard<std::mutex> lock(partitions_mutex_);
    cached.assign(partitions_.begin(), partitions_.end());
  }
  for (const auto &[date, part] : cached) {
    std::lock_guard<std::mutex> lock(part->mutex);
    if (!part->records.empty()) {
      dates.insert(date);
    }
  }
  return std::vector<CalendarDate>(dates.begin(), dates.end());
}

std::vector<AttendanceRecord>
AttendanceLedger::history(const std::string &label, int daysBack) {
  if (daysBack < 0) {
    throw std::invalid_argument("days_back must be non-negative");
  }

  CalendarDate end = today();
  CalendarDate start = end.addDays(-daysBack);
  std::string wanted = toLower(label);

  std::vector<AttendanceRecord> matches;
  for (const auto &date : partitionDates()) {
    if (date < start || end < date) {
      continue;
    }
    for (auto &record : recordsFor(date)) {
      if (toLower(record.label) == wanted) {
        matches.push_back(std::move(record));
      }
    }
  }
  return matches;
}

bool AttendanceLedger::isMarked(const std::string &label,
                                const CalendarDate &date) {
  bool marked = false;
  {
    auto part = partitionFor(date);
    std::lock_guard<std::mutex> lock(part->mutex);
    ensureLoadedUnlocked(date, *part);
    marked = part->marked.count(label) > 0;
  }
  evictIdlePartitions();
  return marked;
}

size_t AttendanceLedger::markedCount(const CalendarDate &date) {
  size_t count = 0;
  {
    auto part = partitionFor(date);
    std::lock_guard<std::mutex> lock(part->mutex);
    ensureLoadedUnlocked(date, *part);
    count = part->marked.size();
  }
  evictIdlePartitions();
  return count;
}

SessionStatistics AttendanceLedger::sessionStatistics() {
  LocalDateTime now = clock_();

  SessionStatistics stats;
  stats.sessionStart = session_start_;
  long long elapsed = secondsSinceEpoch(now) - secondsSinceEpoch(session_start_);
  stats.durationMinutes =
      std::round(static_cast<double>(std::max(0LL, elapsed)) / 60.0 * 100.0) /
      100.0;
  stats.totalCheckIns = total_check_ins_.load();
  stats.duplicateAttempts = duplicate_attempts_.load();
  stats.uniqueAttendeesToday = markedCount(now.date);
  return stats;
}
