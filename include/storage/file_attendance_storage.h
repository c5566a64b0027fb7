#pragma once

#include "storage/attendance_storage.h"
#include <atomic>
#include <json/json.h>
#include <string>
#include <vector>

/**
 * @brief Filesystem implementation of AttendanceStorage
 *
 * Layout under data_dir:
 *   face_gallery.txt                       label|v1,v2,...  (one embedding per line)
 *   attendance/attendance_YYYY-MM-DD.jsonl one JSON record per line
 */
class FileAttendanceStorage : public AttendanceStorage {
public:
  /**
   * @brief Constructor
   * @param dataDir Root directory (created if missing)
   * @param galleryFile Gallery file name inside dataDir
   * @param attendanceSubdir Partition directory name inside dataDir
   */
  explicit FileAttendanceStorage(const std::string &dataDir,
                                 const std::string &galleryFile = "face_gallery.txt",
                                 const std::string &attendanceSubdir = "attendance");

  GallerySnapshot loadGallery() override;
  void saveGallery(const GallerySnapshot &snapshot) override;

  void appendRecord(const CalendarDate &date,
                    const AttendanceRecord &record) override;
  std::vector<AttendanceRecord> readPartition(const CalendarDate &date) override;
  std::vector<CalendarDate> listPartitionDates() override;

  size_t backup(const std::string &target_dir) override;

  const std::string &galleryPath() const { return gallery_path_; }
  const std::string &attendanceDir() const { return attendance_dir_; }

  /**
   * @brief Get file path for a day's partition
   */
  std::string partitionPath(const CalendarDate &date) const;

  /**
   * @brief Number of malformed lines skipped by the last load or read
   */
  size_t lastSkippedLines() const { return last_skipped_lines_.load(); }

private:
  std::string data_dir_;
  std::string gallery_path_;
  std::string attendance_dir_;
  std::atomic<size_t> last_skipped_lines_{0};

  /**
   * @brief Ensure data and partition directories exist
   * @throws PersistenceError if they cannot be created
   */
  void ensureDirectories() const;

  /**
   * @brief Parse one "label|v1,v2,..." line
   * @return false if the line is malformed
   */
  bool parseGalleryLine(const std::string &line, GalleryEntry &entry,
                        std::string &error) const;
};
