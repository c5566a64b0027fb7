#include "models/attendance_record.h"

std::string entryKindToString(EntryKind kind) {
  switch (kind) {
  case EntryKind::Automatic:
    return "automatic";
  case EntryKind::Manual:
    return "manual";
  default:
    return "automatic";
  }
}

std::optional<EntryKind> entryKindFromString(const std::string &text) {
  if (text == "automatic") {
    return EntryKind::Automatic;
  }
  if (text == "manual") {
    return EntryKind::Manual;
  }
  return std::nullopt;
}

AttendanceRecord AttendanceRecord::create(const std::string &label,
                                          const LocalDateTime &timestamp,
                                          const std::string &status,
                                          EntryKind kind) {
  AttendanceRecord record;
  record.label = label;
  record.date = timestamp.date;
  record.time = timestamp.time;
  record.timestamp = timestamp;
  record.weekday = timestamp.date.weekdayName();
  record.status = status;
  record.entryKind = kind;
  return record;
}

bool AttendanceRecord::validate(std::string &error) const {
  if (label.empty()) {
    error = "Label cannot be empty";
    return false;
  }
  if (label.find('\n') != std::string::npos ||
      label.find('|') != std::string::npos) {
    error = "Label cannot contain newlines or '|'";
    return false;
  }
  if (!date.isValid()) {
    error = "Invalid date";
    return false;
  }
  if (!time.isValid()) {
    error = "Invalid time";
    return false;
  }
  if (status.empty()) {
    error = "Status cannot be empty";
    return false;
  }
  return true;
}

Json::Value AttendanceRecord::toJson() const {
  Json::Value json(Json::objectValue);
  json["name"] = label;
  json["date"] = date.toString();
  json["time"] = time.toString();
  json["timestamp"] = timestamp.toIsoString();
  json["day_of_week"] = weekday;
  json["status"] = status;
  json["entry_type"] = entryKindToString(entryKind);
  return json;
}

std::optional<AttendanceRecord>
AttendanceRecord::fromJson(const Json::Value &json, std::string *error) {
  auto fail = [error](const std::string &message) {
    if (error) {
      *error = message;
    }
    return std::optional<AttendanceRecord>();
  };

  if (!json.isObject()) {
    return fail("Record must be a JSON object");
  }
  for (const char *key : {"name", "date", "time", "status"}) {
    if (!json.isMember(key) || !json[key].isString()) {
      return fail(std::string("Missing or invalid field: ") + key);
    }
  }

  AttendanceRecord record;
  record.label = json["name"].asString();
  record.status = json["status"].asString();

  auto date = CalendarDate::parse(json["date"].asString());
  if (!date) {
    return fail("Invalid date: " + json["date"].asString());
  }
  auto time = TimeOfDay::parse(json["time"].asString());
  if (!time) {
    return fail("Invalid time: " + json["time"].asString());
  }
  record.date = *date;
  record.time = *time;

  // Older lines may lack timestamp or weekday; derive them from date/time
  record.timestamp = LocalDateTime{*date, *time};
  if (json.isMember("timestamp") && json["timestamp"].isString()) {
    auto ts = LocalDateTime::parse(json["timestamp"].asString());
    if (ts) {
      record.timestamp = *ts;
    }
  }
  record.weekday = json.get("day_of_week", date->weekdayName()).asString();

  // Records without entry_type predate manual entries and are automatic
  record.entryKind = EntryKind::Automatic;
  if (json.isMember("entry_type")) {
    auto kind = entryKindFromString(json["entry_type"].asString());
    if (!kind) {
      return fail("Invalid entry_type: " + json["entry_type"].asString());
    }
    record.entryKind = *kind;
  }

  std::string validation_error;
  if (!record.validate(validation_error)) {
    return fail(validation_error);
  }
  return record;
}
