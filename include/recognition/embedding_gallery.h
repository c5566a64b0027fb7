#pragma once

#include "recognition/gallery_types.h"
#include <functional>
#include <map>
#include <shared_mutex>
#include <string>
#include <vector>

class AttendanceStorage;

/**
 * @brief Owns every (identity, embedding) pair used for matching
 *
 * Thread-safe: readers (matching, statistics, validation) share the lock,
 * add/remove/optimize/restore take it exclusively. When a storage
 * collaborator is attached, each write persists the new collection first
 * and only then swaps it in, so a failed save leaves the gallery untouched.
 */
class EmbeddingGallery {
public:
  /**
   * @brief Constructor
   * @param dimension Required length of every embedding
   * @param storage Optional persistence collaborator (not owned)
   */
  explicit EmbeddingGallery(size_t dimension,
                            AttendanceStorage *storage = nullptr);

  /**
   * @brief Append embeddings under label
   *
   * The same label may be extended by later calls.
   * @return Number of embeddings added
   * @throws std::invalid_argument if label is empty, contains '|' or newline,
   *         or starts or ends with whitespace
   * @throws DimensionMismatchError if any vector has the wrong length (nothing
   * is added)
   * @throws PersistenceError if the new gallery cannot be saved
   */
  size_t add(const std::string &label, const std::vector<Embedding> &embeddings);

  /**
   * @brief Delete every embedding owned by label
   * @return Number of embeddings removed (0 if label is unknown)
   * @throws PersistenceError if the new gallery cannot be saved
   */
  size_t remove(const std::string &label);

  /**
   * @brief Keep at most maxPerIdentity embeddings per label, oldest first
   * @throws std::invalid_argument if maxPerIdentity is 0
   * @throws PersistenceError if the new gallery cannot be saved
   */
  OptimizeResult optimize(size_t maxPerIdentity);

  /**
   * @brief Integrity check; never mutates
   */
  GalleryValidationReport validate() const;

  /**
   * @brief Copy of the full collection in insertion order
   */
  GallerySnapshot snapshot() const;

  /**
   * @brief Replace the collection with snapshot (no save is issued)
   * @throws DimensionMismatchError if any entry has the wrong length
   * @throws std::invalid_argument if any entry has an invalid label
   */
  void restore(const GallerySnapshot &snapshot);

  /**
   * @brief Run reader under the shared lock with the entries in insertion
   * order
   */
  void read(const std::function<void(const std::vector<GalleryEntry> &)> &reader) const;

  GalleryStatistics statistics() const;
  std::vector<std::string> identities() const;
  bool contains(const std::string &label) const;
  size_t size() const;
  size_t identityCount() const;
  size_t dimension() const { return dimension_; }

private:
  const size_t dimension_;
  AttendanceStorage *storage_;

  mutable std::shared_mutex mutex_;
  std::vector<GalleryEntry> entries_;
  std::map<std::string, size_t> counts_; // label -> number of entries

  /**
   * @brief Persist next (if storage is attached) then swap it in
   * Caller must hold the exclusive lock.
   */
  void commitUnlocked(std::vector<GalleryEntry> &&next);

  static std::map<std::string, size_t>
  countByLabel(const std::vector<GalleryEntry> &entries);

  static void validateLabel(const std::string &label);
};
