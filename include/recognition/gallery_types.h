#pragma once

#include <json/json.h>
#include <map>
#include <string>
#include <vector>

/**
 * @brief Fixed-length face feature vector
 */
using Embedding = std::vector<float>;

/**
 * @brief One labelled embedding, in gallery insertion order
 */
struct GalleryEntry {
  std::string label;
  Embedding embedding;
};

/**
 * @brief Full (label, embedding) collection as handed to storage
 */
struct GallerySnapshot {
  std::vector<GalleryEntry> entries;
};

/**
 * @brief Result of a gallery integrity check
 */
struct GalleryValidationReport {
  bool valid = true;
  std::vector<std::string> errors;
  std::vector<std::string> warnings;
  size_t totalEmbeddings = 0;
  size_t uniqueIdentities = 0;

  Json::Value toJson() const;
};

/**
 * @brief Per-identity embedding counts and totals
 */
struct GalleryStatistics {
  std::vector<std::pair<std::string, size_t>> identityCounts; // first-seen order
  size_t totalEmbeddings = 0;
  size_t dimension = 0;

  Json::Value toJson() const;
};

struct OptimizeResult {
  size_t embeddingsBefore = 0;
  size_t embeddingsAfter = 0;
  size_t identitiesTrimmed = 0;
};
