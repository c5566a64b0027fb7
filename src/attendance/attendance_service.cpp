#include "attendance/attendance_service.h"
#include "core/attendance_errors.h"
#include "core/logging_flags.h"
#include "storage/attendance_storage.h"
#include <plog/Log.h>
#include <cstdio>
#include <filesystem>
#include <stdexcept>

namespace {

std::string backupDirectoryName(const LocalDateTime &now) {
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "backup_%04d%02d%02d_%02d%02d%02d",
                now.date.year, now.date.month, now.date.day, now.time.hour,
                now.time.minute, now.time.second);
  return buffer;
}

// A backup name is a single path component below the backup root
void checkBackupName(const std::string &name) {
  if (name.empty() || name == "." || name == ".." ||
      name.find_first_of("/\\") != std::string::npos ||
      name.find('\0') != std::string::npos) {
    throw std::invalid_argument("Backup name must be a plain directory name: '" +
                                name + "'");
  }
}

} // namespace

Json::Value RecognitionStatistics::toJson() const {
  Json::Value json(Json::objectValue);
  json["total_recognitions"] = static_cast<Json::UInt64>(totalRecognitions);
  json["successful_recognitions"] =
      static_cast<Json::UInt64>(successfulRecognitions);
  json["unknown_faces"] = static_cast<Json::UInt64>(unknownFaces);
  json["success_rate"] = successRate;
  json["unknown_rate"] = unknownRate;
  json["average_confidence"] = averageConfidence;
  json["registered_identities"] =
      static_cast<Json::UInt64>(registeredIdentities);
  json["total_embeddings"] = static_cast<Json::UInt64>(totalEmbeddings);
  return json;
}

AttendanceService::AttendanceService(const AttendanceServiceOptions &options,
                                     std::unique_ptr<AttendanceStorage> storage,
                                     AttendanceLedger::Clock clock)
    : options_(options), clock_(std::move(clock)),
      storage_(std::move(storage)) {
  if (!storage_) {
    throw std::invalid_argument("AttendanceService requires a storage");
  }
  if (!clock_) {
    throw std::invalid_argument("AttendanceService requires a clock");
  }

  gallery_ = std::make_unique<EmbeddingGallery>(
      options_.recognition.embeddingDimension, storage_.get());
  gallery_->restore(storage_->loadGallery());
  matcher_ = std::make_unique<Matcher>(*gallery_);
  ledger_ = std::make_unique<AttendanceLedger>(*storage_, clock_);
  aggregator_ = std::make_unique<ReportAggregator>(*ledger_);

  PLOG_INFO << "[AttendanceService] Ready: " << gallery_->identityCount()
            << " identities, " << gallery_->size() << " embeddings, dimension "
            << gallery_->dimension() << ", tolerance "
            << options_.recognition.tolerance;
}

AttendanceService::~AttendanceService() = default;

template <typename T, typename Fn>
OperationResult<T> AttendanceService::guarded(const char *operation, Fn &&fn) {
  try {
    return fn();
  } catch (const PersistenceError &e) {
    PLOG_ERROR << "[AttendanceService] " << operation << " failed: " << e.what();
    return OperationResult<T>::failure(e.kind(), e.what());
  } catch (const AttendanceError &e) {
    PLOG_WARNING << "[AttendanceService] " << operation
                 << " rejected: " << e.what();
    return OperationResult<T>::failure(e.kind(), e.what());
  } catch (const std::invalid_argument &e) {
    PLOG_WARNING << "[AttendanceService] " << operation
                 << " rejected: " << e.what();
    return OperationResult<T>::failure(ErrorKind::InvalidArgument, e.what());
  }
}

void AttendanceService::recordRecognition(const RecognitionResult &result) {
  // An empty gallery short-circuits and is not counted
  if (!result.distance.has_value()) {
    return;
  }
  std::lock_guard<std::mutex> lock(stats_mutex_);
  total_recognitions_++;
  if (result.matched) {
    successful_recognitions_++;
    confidence_sum_ += result.confidence;
  } else {
    unknown_faces_++;
  }
}

OperationResult<size_t>
AttendanceService::addIdentity(const std::string &label,
                               const std::vector<Embedding> &embeddings) {
  return guarded<size_t>("add_identity", [&] {
    return OperationResult<size_t>::success(gallery_->add(label, embeddings));
  });
}

OperationResult<size_t>
AttendanceService::removeIdentity(const std::string &label) {
  return guarded<size_t>("remove_identity", [&] {
    size_t removed = gallery_->remove(label);
    if (removed == 0) {
      return OperationResult<size_t>::withStatus(
          OperationStatus::NotFound, 0, "Identity '" + label + "' not found");
    }
    return OperationResult<size_t>::success(removed);
  });
}

OperationResult<RecognitionResult>
AttendanceService::recognize(const Embedding &embedding,
                             std::optional<double> tolerance) {
  return guarded<RecognitionResult>("recognize", [&] {
    RecognitionResult result = matcher_->recognize(
        embedding, tolerance.value_or(options_.recognition.tolerance));
    recordRecognition(result);
    return OperationResult<RecognitionResult>::success(result);
  });
}

OperationResult<std::vector<RecognitionResult>>
AttendanceService::recognizeBatch(const std::vector<Embedding> &embeddings,
                                  std::optional<double> tolerance) {
  return guarded<std::vector<RecognitionResult>>("recognize_batch", [&] {
    auto results = matcher_->recognizeBatch(
        embeddings, tolerance.value_or(options_.recognition.tolerance));
    for (const auto &result : results) {
      recordRecognition(result);
    }
    return OperationResult<std::vector<RecognitionResult>>::success(
        std::move(results));
  });
}

OperationResult<OptimizeResult>
AttendanceService::optimizeGallery(std::optional<size_t> maxPerIdentity) {
  return guarded<OptimizeResult>("optimize_gallery", [&] {
    return OperationResult<OptimizeResult>::success(gallery_->optimize(
        maxPerIdentity.value_or(options_.recognition.maxEmbeddingsPerIdentity)));
  });
}

GalleryValidationReport AttendanceService::validateGallery() const {
  return gallery_->validate();
}

GalleryStatistics AttendanceService::galleryStatistics() const {
  return gallery_->statistics();
}

RecognitionStatistics AttendanceService::recognitionStatistics() const {
  RecognitionStatistics stats;
  {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats.totalRecognitions = total_recognitions_;
    stats.successfulRecognitions = successful_recognitions_;
    stats.unknownFaces = unknown_faces_;
    if (total_recognitions_ > 0) {
      stats.successRate = 100.0 * successful_recognitions_ / total_recognitions_;
      stats.unknownRate = 100.0 * unknown_faces_ / total_recognitions_;
    }
    if (successful_recognitions_ > 0) {
      stats.averageConfidence = confidence_sum_ / successful_recognitions_;
    }
  }
  stats.registeredIdentities = gallery_->identityCount();
  stats.totalEmbeddings = gallery_->size();
  return stats;
}

OperationResult<MarkResult>
AttendanceService::markAttendance(const std::string &label,
                                  std::optional<LocalDateTime> timestamp) {
  return guarded<MarkResult>("mark_attendance", [&] {
    MarkResult mark = ledger_->mark(label, timestamp.value_or(clock_()));
    OperationStatus status = mark.status;
    return OperationResult<MarkResult>::withStatus(status, std::move(mark));
  });
}

OperationResult<AttendanceRecord>
AttendanceService::manualAttendance(const std::string &label,
                                    const CalendarDate &date,
                                    const TimeOfDay &time,
                                    const std::string &status) {
  return guarded<AttendanceRecord>("manual_attendance", [&] {
    return OperationResult<AttendanceRecord>::success(
        ledger_->manualEntry(label, date, time, status));
  });
}

OperationResult<std::vector<AttendanceRecord>>
AttendanceService::todayAttendance() {
  return guarded<std::vector<AttendanceRecord>>("today_attendance", [&] {
    return OperationResult<std::vector<AttendanceRecord>>::success(
        ledger_->todayRecords());
  });
}

OperationResult<std::vector<AttendanceRecord>>
AttendanceService::history(const std::string &label,
                           std::optional<int> daysBack) {
  return guarded<std::vector<AttendanceRecord>>("history", [&] {
    auto records =
        ledger_->history(label, daysBack.value_or(options_.attendance.historyDays));
    if (records.empty()) {
      return OperationResult<std::vector<AttendanceRecord>>::withStatus(
          OperationStatus::NotFound, {}, "No records for '" + label + "'");
    }
    return OperationResult<std::vector<AttendanceRecord>>::success(
        std::move(records));
  });
}

OperationResult<std::vector<AttendanceRecord>>
AttendanceService::getReport(const CalendarDate &start,
                             const CalendarDate &end) {
  return guarded<std::vector<AttendanceRecord>>("get_report", [&] {
    return OperationResult<std::vector<AttendanceRecord>>::success(
        aggregator_->range(start, end));
  });
}

OperationResult<AttendanceStatistics>
AttendanceService::getStatistics(const CalendarDate &start,
                                 const CalendarDate &end) {
  return guarded<AttendanceStatistics>("get_statistics", [&] {
    return OperationResult<AttendanceStatistics>::success(
        aggregator_->statistics(start, end, options_.attendance.topN));
  });
}

OperationResult<std::string>
AttendanceService::exportCsv(const CalendarDate &start,
                             const CalendarDate &end) {
  return guarded<std::string>("export_csv", [&] {
    return OperationResult<std::string>::success(
        aggregator_->exportCsv(start, end));
  });
}

SessionStatistics AttendanceService::sessionStatistics() {
  return ledger_->sessionStatistics();
}

OperationResult<BackupInfo>
AttendanceService::backup(std::optional<std::string> name) {
  return guarded<BackupInfo>("backup", [&] {
    std::string directory = name.value_or(backupDirectoryName(clock_()));
    checkBackupName(directory);

    BackupInfo info;
    info.path =
        (std::filesystem::path(options_.backupRoot) / directory).string();
    info.filesCopied = storage_->backup(info.path);
    return OperationResult<BackupInfo>::success(info);
  });
}
