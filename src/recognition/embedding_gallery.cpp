#include "recognition/embedding_gallery.h"
#include "core/attendance_errors.h"
#include "core/logging_flags.h"
#include "storage/attendance_storage.h"
#include <plog/Log.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <iterator>
#include <mutex>
#include <set>
#include <stdexcept>

namespace {

bool allFinite(const Embedding &embedding) {
  return std::all_of(embedding.begin(), embedding.end(),
                     [](float v) { return std::isfinite(v); });
}

} // namespace

EmbeddingGallery::EmbeddingGallery(size_t dimension, AttendanceStorage *storage)
    : dimension_(dimension), storage_(storage) {
  if (dimension_ == 0) {
    throw std::invalid_argument("Embedding dimension must be positive");
  }
}

void EmbeddingGallery::validateLabel(const std::string &label) {
  if (label.empty()) {
    throw std::invalid_argument("Identity label cannot be empty");
  }
  if (label.find('|') != std::string::npos ||
      label.find('\n') != std::string::npos ||
      label.find('\r') != std::string::npos) {
    throw std::invalid_argument(
        "Identity label cannot contain '|' or line breaks: " + label);
  }
  if (std::isspace(static_cast<unsigned char>(label.front())) ||
      std::isspace(static_cast<unsigned char>(label.back()))) {
    throw std::invalid_argument(
        "Identity label cannot start or end with whitespace: '" + label + "'");
  }
}

std::map<std::string, size_t>
EmbeddingGallery::countByLabel(const std::vector<GalleryEntry> &entries) {
  std::map<std::string, size_t> counts;
  for (const auto &entry : entries) {
    counts[entry.label]++;
  }
  return counts;
}

void EmbeddingGallery::commitUnlocked(std::vector<GalleryEntry> &&next) {
  if (storage_) {
    storage_->saveGallery(GallerySnapshot{next});
  }
  entries_ = std::move(next);
  counts_ = countByLabel(entries_);
}

size_t EmbeddingGallery::add(const std::string &label,
                             const std::vector<Embedding> &embeddings) {
  validateLabel(label);
  for (size_t i = 0; i < embeddings.size(); ++i) {
    if (embeddings[i].size() != dimension_) {
      throw DimensionMismatchError(dimension_, embeddings[i].size(),
                                   "embedding " + std::to_string(i) +
                                       " for '" + label + "'");
    }
    if (!allFinite(embeddings[i])) {
      throw std::invalid_argument("Embedding " + std::to_string(i) + " for '" +
                                  label + "' contains non-finite values");
    }
  }
  if (embeddings.empty()) {
    return 0;
  }

  std::unique_lock<std::shared_mutex> lock(mutex_);
  std::vector<GalleryEntry> next = entries_;
  next.reserve(entries_.size() + embeddings.size());
  for (const auto &embedding : embeddings) {
    next.push_back(GalleryEntry{label, embedding});
  }
  commitUnlocked(std::move(next));

  PLOG_INFO << "[EmbeddingGallery] Added " << embeddings.size()
            << " embedding(s) for '" << label << "' (total "
            << entries_.size() << ")";
  return embeddings.size();
}

size_t EmbeddingGallery::remove(const std::string &label) {
  std::unique_lock<std::shared_mutex> lock(mutex_);

  auto it = counts_.find(label);
  if (it == counts_.end()) {
    if (isRecognitionLoggingEnabled()) {
      PLOG_DEBUG << "[EmbeddingGallery] Remove of unknown identity '" << label
                 << "' ignored";
    }
    return 0;
  }

  std::vector<GalleryEntry> next;
  next.reserve(entries_.size());
  std::copy_if(entries_.begin(), entries_.end(), std::back_inserter(next),
               [&label](const GalleryEntry &e) { return e.label != label; });
  size_t removed = entries_.size() - next.size();
  commitUnlocked(std::move(next));

  PLOG_INFO << "[EmbeddingGallery] Removed " << removed
            << " embedding(s) for '" << label << "'";
  return removed;
}

OptimizeResult EmbeddingGallery::optimize(size_t maxPerIdentity) {
  if (maxPerIdentity == 0) {
    throw std::invalid_argument("max_per_identity must be at least 1");
  }

  std::unique_lock<std::shared_mutex> lock(mutex_);

  OptimizeResult result;
  result.embeddingsBefore = entries_.size();

  std::map<std::string, size_t> kept;
  std::vector<GalleryEntry> next;
  next.reserve(entries_.size());
  for (const auto &entry : entries_) {
    size_t &count = kept[entry.label];
    if (count < maxPerIdentity) {
      next.push_back(entry);
      count++;
    }
  }

  for (const auto &[label, count] : counts_) {
    if (count > maxPerIdentity) {
      result.identitiesTrimmed++;
    }
  }

  if (next.size() != entries_.size()) {
    commitUnlocked(std::move(next));
  }
  result.embeddingsAfter = entries_.size();

  PLOG_INFO << "[EmbeddingGallery] Optimized embeddings: "
            << result.embeddingsBefore << " -> " << result.embeddingsAfter;
  return result;
}

GalleryValidationReport EmbeddingGallery::validate() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);

  GalleryValidationReport report;
  report.totalEmbeddings = entries_.size();
  report.uniqueIdentities = counts_.size();

  for (size_t i = 0; i < entries_.size(); ++i) {
    const auto &entry = entries_[i];
    if (entry.embedding.size() != dimension_) {
      report.valid = false;
      report.errors.push_back("Invalid embedding dimension at index " +
                              std::to_string(i) + ": " +
                              std::to_string(entry.embedding.size()));
    }
    if (!allFinite(entry.embedding)) {
      report.valid = false;
      report.errors.push_back("Non-finite value in embedding at index " +
                              std::to_string(i));
    }
  }

  auto recomputed = countByLabel(entries_);
  if (recomputed != counts_) {
    report.valid = false;
    report.errors.push_back("Mismatch between identity counts and stored "
                            "embeddings");
  }

  size_t counted = 0;
  for (const auto &[label, count] : counts_) {
    if (count == 0) {
      report.valid = false;
      report.errors.push_back("Identity '" + label + "' has no embeddings");
    }
    counted += count;
  }
  if (counted != entries_.size()) {
    report.valid = false;
    report.errors.push_back("Mismatch in embeddings and labels count");
  }

  std::set<Embedding> unique;
  for (const auto &entry : entries_) {
    unique.insert(entry.embedding);
  }
  if (unique.size() < entries_.size()) {
    report.warnings.push_back("Duplicate embeddings detected (" +
                              std::to_string(entries_.size() - unique.size()) +
                              ")");
  }

  return report;
}

GallerySnapshot EmbeddingGallery::snapshot() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return GallerySnapshot{entries_};
}

void EmbeddingGallery::restore(const GallerySnapshot &snapshot) {
  for (size_t i = 0; i < snapshot.entries.size(); ++i) {
    const auto &entry = snapshot.entries[i];
    validateLabel(entry.label);
    if (entry.embedding.size() != dimension_) {
      throw DimensionMismatchError(dimension_, entry.embedding.size(),
                                   "stored entry " + std::to_string(i) +
                                       " for '" + entry.label + "'");
    }
    if (!allFinite(entry.embedding)) {
      throw std::invalid_argument("Stored entry " + std::to_string(i) +
                                  " contains non-finite values");
    }
  }

  std::unique_lock<std::shared_mutex> lock(mutex_);
  entries_ = snapshot.entries;
  counts_ = countByLabel(entries_);
  PLOG_INFO << "[EmbeddingGallery] Restored " << entries_.size()
            << " embedding(s) for " << counts_.size() << " identities";
}

void EmbeddingGallery::read(
    const std::function<void(const std::vector<GalleryEntry> &)> &reader) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  reader(entries_);
}

GalleryStatistics EmbeddingGallery::statistics() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  GalleryStatistics stats;
  stats.totalEmbeddings = entries_.size();
  stats.dimension = dimension_;
  std::set<std::string> seen;
  for (const auto &entry : entries_) {
    if (seen.insert(entry.label).second) {
      stats.identityCounts.emplace_back(entry.label, counts_.at(entry.label));
    }
  }
  return stats;
}

std::vector<std::string> EmbeddingGallery::identities() const {
  std::vector<std::string> labels;
  for (const auto &[label, count] : statistics().identityCounts) {
    labels.push_back(label);
  }
  return labels;
}

bool EmbeddingGallery::contains(const std::string &label) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return counts_.find(label) != counts_.end();
}

size_t EmbeddingGallery::size() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return entries_.size();
}

size_t EmbeddingGallery::identityCount() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return counts_.size();
}
