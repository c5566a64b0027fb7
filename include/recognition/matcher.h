#pragma once

#include "recognition/embedding_gallery.h"
#include <json/json.h>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Outcome of matching one query embedding
 */
struct RecognitionResult {
  static constexpr const char *kUnknownLabel = "Unknown";

  std::string label = kUnknownLabel;
  double confidence = 0.0;            // 1 - distance, not clamped
  std::optional<double> distance;     // unset when the gallery was empty
  bool matched = false;               // distance <= tolerance

  Json::Value toJson() const;
};

/**
 * @brief Nearest-neighbour classifier over an EmbeddingGallery
 *
 * Holds no state of its own; every call reads the gallery under its
 * shared lock. Distance is Euclidean, computed with cv::norm. Ties go to
 * the entry inserted first.
 */
class Matcher {
public:
  explicit Matcher(const EmbeddingGallery &gallery) : gallery_(gallery) {}

  /**
   * @brief Resolve query to an identity or "Unknown"
   *
   * An empty gallery yields ("Unknown", 0.0) for any input.
   * @throws DimensionMismatchError if query length differs from the gallery
   * dimension
   * @throws std::invalid_argument if tolerance is negative or NaN
   */
  RecognitionResult recognize(const Embedding &query, double tolerance) const;

  /**
   * @brief recognize() applied to each query, preserving order
   *
   * All queries are checked before any is matched and the whole batch is
   * evaluated against one consistent view of the gallery.
   */
  std::vector<RecognitionResult>
  recognizeBatch(const std::vector<Embedding> &queries, double tolerance) const;

private:
  const EmbeddingGallery &gallery_;

  void checkQuery(const Embedding &query, size_t index) const;
  static void checkTolerance(double tolerance);

  static RecognitionResult nearest(const std::vector<GalleryEntry> &entries,
                                   const Embedding &query, double tolerance);
};
