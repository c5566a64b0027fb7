#include "storage/file_attendance_storage.h"
#include "core/attendance_errors.h"
#include "core/logging_flags.h"
#include <plog/Log.h>
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <limits>
#include <memory>
#include <sstream>

namespace fs = std::filesystem;

namespace {

const char *kPartitionPrefix = "attendance_";
const char *kPartitionExtension = ".jsonl";

void trim(std::string &text, const char *whitespace = " \t\r\n") {
  text.erase(0, text.find_first_not_of(whitespace));
  size_t last = text.find_last_not_of(whitespace);
  if (last == std::string::npos) {
    text.clear();
  } else {
    text.erase(last + 1);
  }
}

std::string backupTimestamp() {
  auto now = std::chrono::system_clock::now();
  std::time_t time_t = std::chrono::system_clock::to_time_t(now);
  std::tm local{};
  localtime_r(&time_t, &local);
  std::stringstream ss;
  ss << std::put_time(&local, "%Y-%m-%dT%H:%M:%S");
  return ss.str();
}

} // namespace

FileAttendanceStorage::FileAttendanceStorage(const std::string &dataDir,
                                             const std::string &galleryFile,
                                             const std::string &attendanceSubdir)
    : data_dir_(dataDir),
      gallery_path_((fs::path(dataDir) / galleryFile).string()),
      attendance_dir_((fs::path(dataDir) / attendanceSubdir).string()) {
  ensureDirectories();
  PLOG_INFO << "[FileAttendanceStorage] Gallery file: " << gallery_path_;
  PLOG_INFO << "[FileAttendanceStorage] Attendance directory: "
            << attendance_dir_;
}

void FileAttendanceStorage::ensureDirectories() const {
  try {
    fs::create_directories(data_dir_);
    fs::create_directories(attendance_dir_);
  } catch (const fs::filesystem_error &e) {
    throw PersistenceError("Cannot create storage directories under " +
                           data_dir_ + ": " + e.what());
  }
}

std::string
FileAttendanceStorage::partitionPath(const CalendarDate &date) const {
  return (fs::path(attendance_dir_) /
          (kPartitionPrefix + date.toString() + kPartitionExtension))
      .string();
}

bool FileAttendanceStorage::parseGalleryLine(const std::string &line,
                                             GalleryEntry &entry,
                                             std::string &error) const {
  size_t pos = line.find('|');
  if (pos == std::string::npos) {
    error = "missing '|' separator";
    return false;
  }

  std::string label = line.substr(0, pos);
  if (label.empty()) {
    error = "empty label";
    return false;
  }

  Embedding embedding;
  std::stringstream ss(line.substr(pos + 1));
  std::string value;
  while (std::getline(ss, value, ',')) {
    trim(value);
    if (value.empty()) continue;
    // strtof reports ERANGE for subnormal results too; only overflow is fatal
    char *end = nullptr;
    errno = 0;
    float parsed = std::strtof(value.c_str(), &end);
    if (end == value.c_str() || *end != '\0') {
      error = "failed to parse float value '" + value + "'";
      return false;
    }
    if (errno == ERANGE && std::isinf(parsed)) {
      error = "float value out of range '" + value + "'";
      return false;
    }
    embedding.push_back(parsed);
  }

  if (embedding.empty()) {
    error = "empty embedding for label '" + label + "'";
    return false;
  }

  entry.label = label;
  entry.embedding = std::move(embedding);
  return true;
}

GallerySnapshot FileAttendanceStorage::loadGallery() {
  GallerySnapshot snapshot;
  last_skipped_lines_ = 0;

  if (!fs::exists(gallery_path_)) {
    PLOG_INFO << "[FileAttendanceStorage] No gallery file yet, starting "
                 "with an empty gallery";
    return snapshot;
  }

  std::ifstream file(gallery_path_);
  if (!file.is_open()) {
    throw PersistenceError("Failed to open gallery file: " + gallery_path_);
  }

  int line_number = 0;
  size_t skipped = 0;
  std::string line;
  while (std::getline(file, line)) {
    line_number++;
    trim(line, "\r\n");
    if (line.find_first_not_of(" \t") == std::string::npos) continue;

    GalleryEntry entry;
    std::string error;
    if (!parseGalleryLine(line, entry, error)) {
      PLOG_WARNING << "[FileAttendanceStorage] Skipping gallery line "
                   << line_number << ": " << error;
      skipped++;
      continue;
    }
    snapshot.entries.push_back(std::move(entry));
  }

  if (file.bad()) {
    throw PersistenceError("I/O error while reading gallery file: " +
                           gallery_path_);
  }

  last_skipped_lines_ = skipped;
  PLOG_INFO << "[FileAttendanceStorage] Loaded " << snapshot.entries.size()
            << " embedding(s) from " << gallery_path_;
  if (skipped > 0) {
    PLOG_WARNING << "[FileAttendanceStorage] Encountered " << skipped
                 << " malformed line(s) while loading gallery";
  }
  return snapshot;
}

void FileAttendanceStorage::saveGallery(const GallerySnapshot &snapshot) {
  ensureDirectories();

  // Write a sibling temp file and rename it over the gallery so a failed
  // save never truncates the previous version.
  std::string tmp_path = gallery_path_ + ".tmp";
  {
    std::ofstream file(tmp_path, std::ios::out | std::ios::trunc);
    if (!file.is_open()) {
      throw PersistenceError("Failed to open gallery file for writing: " +
                             tmp_path);
    }

    file << std::setprecision(std::numeric_limits<float>::max_digits10);
    for (const auto &entry : snapshot.entries) {
      file << entry.label << "|";
      for (size_t i = 0; i < entry.embedding.size(); i++) {
        file << entry.embedding[i];
        if (i < entry.embedding.size() - 1) file << ",";
      }
      file << "\n";
    }

    file.flush();
    if (!file.good()) {
      file.close();
      std::error_code ec;
      fs::remove(tmp_path, ec);
      throw PersistenceError("Error flushing gallery file: " + tmp_path);
    }
  }

  std::error_code ec;
  fs::rename(tmp_path, gallery_path_, ec);
  if (ec) {
    fs::remove(tmp_path, ec);
    throw PersistenceError("Failed to replace gallery file " + gallery_path_ +
                           ": " + ec.message());
  }

  if (isRecognitionLoggingEnabled()) {
    PLOG_DEBUG << "[FileAttendanceStorage] Saved " << snapshot.entries.size()
               << " embedding(s) to " << gallery_path_;
  }
}

void FileAttendanceStorage::appendRecord(const CalendarDate &date,
                                         const AttendanceRecord &record) {
  ensureDirectories();

  Json::StreamWriterBuilder builder;
  builder["indentation"] = "";
  std::string line = Json::writeString(builder, record.toJson());

  std::string path = partitionPath(date);
  std::ofstream file(path, std::ios::out | std::ios::app);
  if (!file.is_open()) {
    throw PersistenceError("Failed to open partition for append: " + path);
  }
  file << line << "\n";
  file.flush();
  if (!file.good()) {
    throw PersistenceError("Failed to append record to partition: " + path);
  }

  if (isAttendanceLoggingEnabled()) {
    PLOG_DEBUG << "[FileAttendanceStorage] Appended record for '"
               << record.label << "' to " << path;
  }
}

std::vector<AttendanceRecord>
FileAttendanceStorage::readPartition(const CalendarDate &date) {
  std::vector<AttendanceRecord> records;
  std::string path = partitionPath(date);
  if (!fs::exists(path)) {
    return records;
  }

  std::ifstream file(path);
  if (!file.is_open()) {
    throw PersistenceError("Failed to open partition: " + path);
  }

  Json::CharReaderBuilder builder;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

  int line_number = 0;
  size_t skipped = 0;
  std::string line;
  while (std::getline(file, line)) {
    line_number++;
    trim(line, "\r\n");
    if (line.find_first_not_of(" \t") == std::string::npos) continue;

    Json::Value json;
    std::string errors;
    if (!reader->parse(line.data(), line.data() + line.size(), &json,
                       &errors)) {
      PLOG_WARNING << "[FileAttendanceStorage] Skipping unparsable line "
                   << line_number << " in " << path << ": " << errors;
      skipped++;
      continue;
    }

    std::string error;
    auto record = AttendanceRecord::fromJson(json, &error);
    if (!record) {
      PLOG_WARNING << "[FileAttendanceStorage] Skipping invalid record at line "
                   << line_number << " in " << path << ": " << error;
      skipped++;
      continue;
    }
    records.push_back(std::move(*record));
  }

  if (file.bad()) {
    throw PersistenceError("I/O error while reading partition: " + path);
  }

  last_skipped_lines_ = skipped;
  return records;
}

std::vector<CalendarDate> FileAttendanceStorage::listPartitionDates() {
  std::vector<CalendarDate> dates;
  if (!fs::exists(attendance_dir_)) {
    return dates;
  }

  const std::string prefix = kPartitionPrefix;
  const std::string extension = kPartitionExtension;
  try {
    for (const auto &entry : fs::directory_iterator(attendance_dir_)) {
      if (!entry.is_regular_file() || entry.path().extension() != extension) {
        continue;
      }
      std::string stem = entry.path().stem().string();
      if (stem.rfind(prefix, 0) != 0) {
        continue;
      }
      auto date = CalendarDate::parse(stem.substr(prefix.size()));
      if (date) {
        dates.push_back(*date);
      }
    }
  } catch (const fs::filesystem_error &e) {
    throw PersistenceError("Failed to list partitions in " + attendance_dir_ +
                           ": " + e.what());
  }

  std::sort(dates.begin(), dates.end());
  return dates;
}

size_t FileAttendanceStorage::backup(const std::string &target_dir) {
  size_t copied = 0;
  try {
    fs::create_directories(target_dir);

    if (fs::exists(gallery_path_)) {
      fs::copy_file(gallery_path_,
                    fs::path(target_dir) / fs::path(gallery_path_).filename(),
                    fs::copy_options::overwrite_existing);
      copied++;
    }

    fs::path attendance_target =
        fs::path(target_dir) / fs::path(attendance_dir_).filename();
    fs::create_directories(attendance_target);
    for (const auto &date : listPartitionDates()) {
      fs::path source(partitionPath(date));
      fs::copy_file(source, attendance_target / source.filename(),
                    fs::copy_options::overwrite_existing);
      copied++;
    }

    Json::Value metadata(Json::objectValue);
    metadata["backup_date"] = backupTimestamp();
    metadata["source_directory"] = data_dir_;
    metadata["files_backed_up"] = static_cast<Json::UInt64>(copied);

    std::ofstream file(fs::path(target_dir) / "backup_metadata.json");
    if (!file.is_open()) {
      throw PersistenceError("Failed to write backup metadata in " +
                             target_dir);
    }
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());
    writer->write(metadata, &file);
    file << "\n";
  } catch (const fs::filesystem_error &e) {
    throw PersistenceError("Backup to " + target_dir + " failed: " + e.what());
  }

  PLOG_INFO << "[FileAttendanceStorage] Backed up " << copied << " file(s) to "
            << target_dir;
  return copied;
}
