#pragma once

#include "core/operation_status.h"
#include "models/attendance_record.h"
#include "models/calendar.h"
#include <atomic>
#include <functional>
#include <json/json.h>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

class AttendanceStorage;

/**
 * @brief Result of an automatic mark
 *
 * status is Success or AlreadyMarked. On AlreadyMarked, firstCheckInTime is
 * the time of the existing automatic record and record is that record.
 */
struct MarkResult {
  OperationStatus status = OperationStatus::Success;
  TimeOfDay firstCheckInTime;
  size_t totalMarkedToday = 0; // identities with an automatic mark that day
  AttendanceRecord record;

  Json::Value toJson() const;
};

/**
 * @brief Counters for the lifetime of this ledger instance
 */
struct SessionStatistics {
  LocalDateTime sessionStart;
  double durationMinutes = 0.0;
  size_t totalCheckIns = 0;
  size_t uniqueAttendeesToday = 0;
  size_t duplicateAttempts = 0;

  Json::Value toJson() const;
};

/**
 * @brief Append-only attendance records partitioned by calendar date
 *
 * Each date partition carries its own mutex and the set of identities that
 * already hold an automatic record for that day. mark() tests and inserts
 * under that mutex, so concurrent marks for one day are serialized while
 * other days stay uncontended. Partitions are read from storage lazily the
 * first time a date is touched; today's partition is read at construction
 * so a restart keeps the day's marks. Only today's partition stays cached;
 * other days are dropped once no caller holds them and are re-read from
 * storage on the next access.
 */
class AttendanceLedger {
public:
  using Clock = std::function<LocalDateTime()>;

  /**
   * @brief Constructor
   * @param storage Persistence collaborator (not owned, must outlive ledger)
   * @param clock Source of "now", replaceable in tests
   * @throws PersistenceError if today's partition cannot be read
   */
  explicit AttendanceLedger(AttendanceStorage &storage,
                            Clock clock = &LocalDateTime::now);

  /**
   * @brief Record an automatic check-in, at most one per identity per day
   * @throws std::invalid_argument if label or timestamp is invalid
   * @throws PersistenceError if the append fails (no state is changed)
   */
  MarkResult mark(const std::string &label, const LocalDateTime &timestamp);

  /**
   * @brief Append a manual record; never consults or updates the day's
   * mark set
   * @throws std::invalid_argument if any field is invalid
   * @throws PersistenceError if the append fails
   */
  AttendanceRecord manualEntry(const std::string &label,
                               const CalendarDate &date, const TimeOfDay &time,
                               const std::string &status);

  /**
   * @brief All records of date in insertion order
   */
  std::vector<AttendanceRecord> recordsFor(const CalendarDate &date);

  std::vector<AttendanceRecord> todayRecords();

  /**
   * @brief Records of label (case-insensitive) from today - daysBack to
   * today, oldest first
   * @throws std::invalid_argument if daysBack is negative
   */
  std::vector<AttendanceRecord> history(const std::string &label, int daysBack);

  /**
   * @brief Dates with at least one record, persisted or in memory, ascending
   */
  std::vector<CalendarDate> partitionDates();

  bool isMarked(const std::string &label, const CalendarDate &date);
  size_t markedCount(const CalendarDate &date);

  SessionStatistics sessionStatistics();

  CalendarDate today() const { return clock_().date; }

  /**
   * @brief Number of date partitions held in memory
   */
  size_t cachedPartitionCount();

private:
  struct DayPartition {
    std::mutex mutex;
    bool loaded = false;
    std::vector<AttendanceRecord> records;
    std::unordered_set<std::string> marked; // automatic marks only
  };

  AttendanceStorage &storage_;
  Clock clock_;
  LocalDateTime session_start_;

  std::mutex partitions_mutex_;
  std::map<CalendarDate, std::shared_ptr<DayPartition>> partitions_;

  std::atomic<size_t> total_check_ins_{0};
  std::atomic<size_t> duplicate_attempts_{0};

  std::shared_ptr<DayPartition> partitionFor(const CalendarDate &date);

  /**
   * @brief Drop cached partitions other than today's that no caller holds
   */
  void evictIdlePartitions();

  MarkResult markInPartition(const std::string &label,
                             const LocalDateTime &timestamp);

  /**
   * @brief Read the partition from storage if not done yet
   * Caller must hold part.mutex.
   */
  void ensureLoadedUnlocked(const CalendarDate &date, DayPartition &part);

  static void checkRecord(const AttendanceRecord &record);
};
