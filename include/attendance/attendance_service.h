#pragma once

#include "attendance/attendance_ledger.h"
#include "attendance/report_aggregator.h"
#include "config/system_config.h"
#include "core/operation_status.h"
#include "recognition/embedding_gallery.h"
#include "recognition/matcher.h"
#include <json/json.h>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

class AttendanceStorage;

/**
 * @brief Running counters of recognize() calls against a non-empty gallery
 */
struct RecognitionStatistics {
  size_t totalRecognitions = 0;
  size_t successfulRecognitions = 0;
  size_t unknownFaces = 0;
  double successRate = 0.0; // percent
  double unknownRate = 0.0; // percent
  double averageConfidence = 0.0;
  size_t registeredIdentities = 0;
  size_t totalEmbeddings = 0;

  Json::Value toJson() const;
};

struct BackupInfo {
  std::string path;
  size_t filesCopied = 0;
};

/**
 * @brief Options for AttendanceService
 */
struct AttendanceServiceOptions {
  SystemConfig::RecognitionConfig recognition;
  SystemConfig::AttendanceConfig attendance;
  std::string backupRoot = "./data/backups";
};

/**
 * @brief Context object that owns the gallery, matcher, ledger and
 * aggregator for one service instance
 *
 * Every operation returns an OperationResult: expected outcomes (already
 * marked, nothing to remove) come back as status tags, structural failures
 * as OperationStatus::Error with the ErrorKind that caused them. The
 * constructor is the only place that throws.
 */
class AttendanceService {
public:
  /**
   * @brief Build the context and restore the gallery from storage
   * @throws PersistenceError if the gallery or today's partition cannot be
   * read
   * @throws DimensionMismatchError if a stored embedding has the wrong length
   */
  AttendanceService(const AttendanceServiceOptions &options,
                    std::unique_ptr<AttendanceStorage> storage,
                    AttendanceLedger::Clock clock = &LocalDateTime::now);

  ~AttendanceService();

  AttendanceService(const AttendanceService &) = delete;
  AttendanceService &operator=(const AttendanceService &) = delete;

  // ========== Gallery ==========

  OperationResult<size_t> addIdentity(const std::string &label,
                                      const std::vector<Embedding> &embeddings);

  /**
   * @brief NotFound (value 0) when the label has no embeddings
   */
  OperationResult<size_t> removeIdentity(const std::string &label);

  /**
   * @param tolerance Overrides the configured tolerance when set
   */
  OperationResult<RecognitionResult>
  recognize(const Embedding &embedding,
            std::optional<double> tolerance = std::nullopt);

  OperationResult<std::vector<RecognitionResult>>
  recognizeBatch(const std::vector<Embedding> &embeddings,
                 std::optional<double> tolerance = std::nullopt);

  /**
   * @param maxPerIdentity Overrides the configured bound when set
   */
  OperationResult<OptimizeResult>
  optimizeGallery(std::optional<size_t> maxPerIdentity = std::nullopt);

  GalleryValidationReport validateGallery() const;
  GalleryStatistics galleryStatistics() const;
  RecognitionStatistics recognitionStatistics() const;

  // ========== Ledger ==========

  /**
   * @param timestamp Defaults to the service clock
   */
  OperationResult<MarkResult>
  markAttendance(const std::string &label,
                 std::optional<LocalDateTime> timestamp = std::nullopt);

  OperationResult<AttendanceRecord>
  manualAttendance(const std::string &label, const CalendarDate &date,
                   const TimeOfDay &time,
                   const std::string &status = AttendanceRecord::kStatusPresent);

  OperationResult<std::vector<AttendanceRecord>> todayAttendance();

  /**
   * @brief NotFound (empty list) when label has no records in the window
   * @param daysBack Defaults to the configured history window
   */
  OperationResult<std::vector<AttendanceRecord>>
  history(const std::string &label, std::optional<int> daysBack = std::nullopt);

  OperationResult<std::vector<AttendanceRecord>>
  getReport(const CalendarDate &start, const CalendarDate &end);

  OperationResult<AttendanceStatistics>
  getStatistics(const CalendarDate &start, const CalendarDate &end);

  OperationResult<std::string> exportCsv(const CalendarDate &start,
                                         const CalendarDate &end);

  SessionStatistics sessionStatistics();

  /**
   * @brief Copy gallery and ledger to <backupRoot>/<name>
   * @param name Plain directory name, defaults to backup_<YYYYMMDD_HHMMSS>.
   *        Names containing a path separator, "." or ".." are an
   *        InvalidArgument error.
   */
  OperationResult<BackupInfo>
  backup(std::optional<std::string> name = std::nullopt);

  CalendarDate today() const { return ledger_->today(); }
  const AttendanceServiceOptions &options() const { return options_; }

private:
  AttendanceServiceOptions options_;
  AttendanceLedger::Clock clock_;
  std::unique_ptr<AttendanceStorage> storage_;
  std::unique_ptr<EmbeddingGallery> gallery_;
  std::unique_ptr<Matcher> matcher_;
  std::unique_ptr<AttendanceLedger> ledger_;
  std::unique_ptr<ReportAggregator> aggregator_;

  mutable std::mutex stats_mutex_;
  size_t total_recognitions_ = 0;
  size_t successful_recognitions_ = 0;
  size_t unknown_faces_ = 0;
  double confidence_sum_ = 0.0;

  void recordRecognition(const RecognitionResult &result);

  template <typename T, typename Fn>
  OperationResult<T> guarded(const char *operation, Fn &&fn);
};
