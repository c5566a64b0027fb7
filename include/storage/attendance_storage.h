#pragma once

#include "models/attendance_record.h"
#include "models/calendar.h"
#include "recognition/gallery_types.h"
#include <string>
#include <vector>

/**
 * @brief Persistence collaborator for the gallery and the ledger
 *
 * Abstract interface so the gallery and ledger stay agnostic of the
 * storage medium. Every method reports failure by throwing
 * PersistenceError; callers mutate in-memory state only after a call
 * returns.
 */
class AttendanceStorage {
public:
  virtual ~AttendanceStorage() = default;

  // ========== Gallery ==========

  /**
   * @brief Load the persisted gallery (empty if nothing was saved yet)
   * @throws PersistenceError if the medium cannot be read
   */
  virtual GallerySnapshot loadGallery() = 0;

  /**
   * @brief Replace the persisted gallery with snapshot
   * @throws PersistenceError on failure; the previous gallery stays intact
   */
  virtual void saveGallery(const GallerySnapshot &snapshot) = 0;

  // ========== Ledger ==========

  /**
   * @brief Append one record to the partition of date
   * @throws PersistenceError on failure
   */
  virtual void appendRecord(const CalendarDate &date,
                            const AttendanceRecord &record) = 0;

  /**
   * @brief Read every record of one day, in append order
   * @return Empty vector when the day has no partition
   * @throws PersistenceError if an existing partition cannot be read
   */
  virtual std::vector<AttendanceRecord>
  readPartition(const CalendarDate &date) = 0;

  /**
   * @brief Dates that have a persisted partition, ascending
   */
  virtual std::vector<CalendarDate> listPartitionDates() = 0;

  /**
   * @brief Copy everything persisted into target_dir
   * @return Number of files copied
   * @throws PersistenceError on failure
   */
  virtual size_t backup(const std::string &target_dir) = 0;
};
