#include "recognition/gallery_types.h"

Json::Value GalleryValidationReport::toJson() const {
  Json::Value json(Json::objectValue);
  json["valid"] = valid;

  Json::Value errorList(Json::arrayValue);
  for (const auto &error : errors) {
    errorList.append(error);
  }
  json["errors"] = errorList;

  Json::Value warningList(Json::arrayValue);
  for (const auto &warning : warnings) {
    warningList.append(warning);
  }
  json["warnings"] = warningList;

  json["total_embeddings"] = static_cast<Json::UInt64>(totalEmbeddings);
  json["unique_identities"] = static_cast<Json::UInt64>(uniqueIdentities);
  return json;
}

Json::Value GalleryStatistics::toJson() const {
  Json::Value json(Json::objectValue);
  Json::Value identities(Json::arrayValue);
  for (const auto &[label, count] : identityCounts) {
    Json::Value item(Json::objectValue);
    item["label"] = label;
    item["embeddings"] = static_cast<Json::UInt64>(count);
    identities.append(item);
  }
  json["identities"] = identities;
  json["registered_identities"] =
      static_cast<Json::UInt64>(identityCounts.size());
  json["total_embeddings"] = static_cast<Json::UInt64>(totalEmbeddings);
  json["dimension"] = static_cast<Json::UInt64>(dimension);
  return json;
}
