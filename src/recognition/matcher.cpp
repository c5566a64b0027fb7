#include "recognition/matcher.h"
#include "core/attendance_errors.h"
#include "core/logging_flags.h"
#include <plog/Log.h>
#include <cmath>
#include <limits>
#include <opencv2/core.hpp>
#include <stdexcept>

Json::Value RecognitionResult::toJson() const {
  Json::Value json(Json::objectValue);
  json["label"] = label;
  json["confidence"] = confidence;
  json["matched"] = matched;
  if (distance.has_value()) {
    json["distance"] = distance.value();
  } else {
    json["distance"] = Json::Value::null;
  }
  return json;
}

void Matcher::checkTolerance(double tolerance) {
  if (std::isnan(tolerance) || tolerance < 0.0) {
    throw std::invalid_argument("Tolerance must be a non-negative number");
  }
}

void Matcher::checkQuery(const Embedding &query, size_t index) const {
  if (query.size() != gallery_.dimension()) {
    throw DimensionMismatchError(gallery_.dimension(), query.size(),
                                 "query " + std::to_string(index));
  }
  for (float value : query) {
    if (!std::isfinite(value)) {
      throw std::invalid_argument("Query " + std::to_string(index) +
                                  " contains a non-finite value");
    }
  }
}

RecognitionResult Matcher::nearest(const std::vector<GalleryEntry> &entries,
                                   const Embedding &query, double tolerance) {
  const int dim = static_cast<int>(query.size());
  cv::Mat q(1, dim, CV_32F, const_cast<float *>(query.data()));

  double min_distance = std::numeric_limits<double>::infinity();
  size_t best_index = 0;
  for (size_t i = 0; i < entries.size(); ++i) {
    const auto &stored = entries[i].embedding;
    cv::Mat g(1, dim, CV_32F, const_cast<float *>(stored.data()));
    double d = cv::norm(q, g, cv::NORM_L2);
    // Strict comparison keeps the earliest entry on ties
    if (d < min_distance) {
      min_distance = d;
      best_index = i;
    }
  }

  RecognitionResult result;
  result.distance = min_distance;
  result.confidence = 1.0 - min_distance;
  if (min_distance <= tolerance) {
    result.label = entries[best_index].label;
    result.matched = true;
  }
  return result;
}

RecognitionResult Matcher::recognize(const Embedding &query,
                                     double tolerance) const {
  RecognitionResult result;
  gallery_.read([&](const std::vector<GalleryEntry> &entries) {
    if (entries.empty()) {
      return;
    }
    checkQuery(query, 0);
    checkTolerance(tolerance);
    result = nearest(entries, query, tolerance);
  });

  if (isRecognitionLoggingEnabled()) {
    PLOG_DEBUG << "[Matcher] Result: " << result.label
               << " confidence=" << result.confidence
               << " tolerance=" << tolerance;
  }
  return result;
}

std::vector<RecognitionResult>
Matcher::recognizeBatch(const std::vector<Embedding> &queries,
                        double tolerance) const {
  std::vector<RecognitionResult> results(queries.size());
  gallery_.read([&](const std::vector<GalleryEntry> &entries) {
    if (entries.empty()) {
      return;
    }
    checkTolerance(tolerance);
    for (size_t i = 0; i < queries.size(); ++i) {
      checkQuery(queries[i], i);
    }
    for (size_t i = 0; i < queries.size(); ++i) {
      results[i] = nearest(entries, queries[i], tolerance);
    }
  });

  if (isRecognitionLoggingEnabled()) {
    PLOG_DEBUG << "[Matcher] Batch of " << queries.size()
               << " queries evaluated";
  }
  return results;
}
