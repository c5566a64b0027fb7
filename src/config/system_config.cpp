#include "config/system_config.h"
#include "core/attendance_errors.h"
#include "core/env_config.h"
#include "core/logger.h"
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>

namespace {

const Json::Value& member(const Json::Value& parent, const char* key) {
    static const Json::Value kNull;
    if (!parent.isObject() || !parent.isMember(key)) {
        return kNull;
    }
    return parent[key];
}

void readDouble(const Json::Value& section, const char* key, double& out) {
    const auto& value = member(section, key);
    if (value.isNull()) return;
    if (!value.isNumeric()) {
        throw ValidationError(std::string(key) + " must be a number");
    }
    out = value.asDouble();
}

void readInt(const Json::Value& section, const char* key, int& out) {
    const auto& value = member(section, key);
    if (value.isNull()) return;
    if (!value.isInt()) {
        throw ValidationError(std::string(key) + " must be an integer");
    }
    out = value.asInt();
}

void readSize(const Json::Value& section, const char* key, size_t& out) {
    const auto& value = member(section, key);
    if (value.isNull()) return;
    if (!value.isInt64() || value.asInt64() < 0) {
        throw ValidationError(std::string(key) +
                              " must be a non-negative integer");
    }
    out = static_cast<size_t>(value.asUInt64());
}

void readString(const Json::Value& section, const char* key, std::string& out) {
    const auto& value = member(section, key);
    if (value.isNull()) return;
    if (!value.isString()) {
        throw ValidationError(std::string(key) + " must be a string");
    }
    out = value.asString();
}

void readBool(const Json::Value& section, const char* key, bool& out) {
    const auto& value = member(section, key);
    if (value.isNull()) return;
    if (!value.isBool()) {
        throw ValidationError(std::string(key) + " must be a boolean");
    }
    out = value.asBool();
}

} // namespace

SystemConfig::SystemConfig(const Json::Value& json) {
    Sections sections = parseSections(json);
    std::string error;
    if (!validateSections(sections, error)) {
        throw ValidationError(error);
    }
    sections_ = sections;
}

SystemConfig::Sections SystemConfig::parseSections(const Json::Value& json) {
    if (!json.isObject()) {
        throw ValidationError("Configuration root must be a JSON object");
    }

    Sections sections;

    const auto& recognition = member(json, "recognition");
    readDouble(recognition, "tolerance", sections.recognition.tolerance);
    readSize(recognition, "embedding_dimension",
             sections.recognition.embeddingDimension);
    readSize(recognition, "max_embeddings_per_identity",
             sections.recognition.maxEmbeddingsPerIdentity);

    const auto& attendance = member(json, "attendance");
    readInt(attendance, "history_days", sections.attendance.historyDays);
    readSize(attendance, "top_n", sections.attendance.topN);

    const auto& storage = member(json, "storage");
    readString(storage, "data_dir", sections.storage.dataDir);
    readString(storage, "gallery_file", sections.storage.galleryFile);
    readString(storage, "attendance_dir", sections.storage.attendanceDir);

    const auto& system = member(json, "system");
    const auto& ws = member(system, "web_server");
    readString(ws, "ip_address", sections.webServer.ipAddress);
    int port = sections.webServer.port;
    readInt(ws, "port", port);
    if (port < 0 || port > 65535) {
        throw ValidationError("port must be between 1 and 65535");
    }
    sections.webServer.port = static_cast<uint16_t>(port);
    readSize(ws, "threads", sections.webServer.threads);
    readBool(member(ws, "cors"), "enabled", sections.webServer.corsEnabled);

    const auto& logging = member(system, "logging");
    readString(logging, "log_dir", sections.logging.logDir);
    readString(logging, "log_level", sections.logging.logLevel);
    readInt(logging, "max_log_files", sections.logging.maxLogFiles);

    return sections;
}

bool SystemConfig::validateSections(const Sections& sections,
                                    std::string& error) {
    const auto& rec = sections.recognition;
    if (std::isnan(rec.tolerance) || rec.tolerance < 0.0) {
        error = "tolerance must be a non-negative number";
        return false;
    }
    if (rec.embeddingDimension == 0) {
        error = "embedding_dimension must be positive";
        return false;
    }
    if (rec.maxEmbeddingsPerIdentity == 0) {
        error = "max_embeddings_per_identity must be at least 1";
        return false;
    }
    if (sections.attendance.historyDays < 0) {
        error = "history_days must be non-negative";
        return false;
    }
    if (sections.attendance.topN == 0) {
        error = "top_n must be at least 1";
        return false;
    }
    if (sections.storage.dataDir.empty() ||
        sections.storage.galleryFile.empty() ||
        sections.storage.attendanceDir.empty()) {
        error = "storage paths cannot be empty";
        return false;
    }
    if (sections.webServer.port == 0) {
        error = "port must be between 1 and 65535";
        return false;
    }
    if (sections.webServer.threads == 0) {
        error = "threads must be at least 1";
        return false;
    }
    plog::Severity severity;
    if (!Logger::parseSeverity(sections.logging.logLevel, severity)) {
        error = "unknown log_level: " + sections.logging.logLevel;
        return false;
    }
    if (sections.logging.maxLogFiles < 0) {
        error = "max_log_files must be non-negative";
        return false;
    }
    return true;
}

Json::Value SystemConfig::toJson(const Sections& sections) {
    Json::Value json(Json::objectValue);

    Json::Value recognition(Json::objectValue);
    recognition["tolerance"] = sections.recognition.tolerance;
    recognition["embedding_dimension"] =
        static_cast<Json::UInt64>(sections.recognition.embeddingDimension);
    recognition["max_embeddings_per_identity"] =
        static_cast<Json::UInt64>(sections.recognition.maxEmbeddingsPerIdentity);
    json["recognition"] = recognition;

    Json::Value attendance(Json::objectValue);
    attendance["history_days"] = sections.attendance.historyDays;
    attendance["top_n"] = static_cast<Json::UInt64>(sections.attendance.topN);
    json["attendance"] = attendance;

    Json::Value storage(Json::objectValue);
    storage["data_dir"] = sections.storage.dataDir;
    storage["gallery_file"] = sections.storage.galleryFile;
    storage["attendance_dir"] = sections.storage.attendanceDir;
    json["storage"] = storage;

    Json::Value webServer(Json::objectValue);
    webServer["ip_address"] = sections.webServer.ipAddress;
    webServer["port"] = sections.webServer.port;
    webServer["threads"] = static_cast<Json::UInt64>(sections.webServer.threads);
    Json::Value cors(Json::objectValue);
    cors["enabled"] = sections.webServer.corsEnabled;
    webServer["cors"] = cors;

    Json::Value logging(Json::objectValue);
    logging["log_dir"] = sections.logging.logDir;
    logging["log_level"] = sections.logging.logLevel;
    logging["max_log_files"] = sections.logging.maxLogFiles;

    Json::Value system(Json::objectValue);
    system["web_server"] = webServer;
    system["logging"] = logging;
    json["system"] = system;

    return json;
}

bool SystemConfig::loadConfig(const std::string& configPath) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        config_path_ = configPath;
        last_error_.clear();
    }

    if (!std::filesystem::exists(configPath)) {
        std::cerr << "[SystemConfig] Config file not found: " << configPath << std::endl;
        std::cerr << "[SystemConfig] Writing default configuration" << std::endl;
        return saveConfig(configPath);
    }

    std::ifstream file(configPath);
    if (!file.is_open()) {
        std::lock_guard<std::mutex> lock(mutex_);
        last_error_ = "Failed to open config file: " + configPath;
        std::cerr << "[SystemConfig] Error: " << last_error_ << std::endl;
        return false;
    }

    Json::Value json;
    Json::CharReaderBuilder builder;
    std::string errors;
    if (!Json::parseFromStream(builder, file, &json, &errors)) {
        std::lock_guard<std::mutex> lock(mutex_);
        last_error_ = "Failed to parse config file: " + errors;
        std::cerr << "[SystemConfig] " << last_error_ << std::endl;
        return false;
    }

    try {
        Sections sections = parseSections(json);
        std::string error;
        if (!validateSections(sections, error)) {
            throw ValidationError(error);
        }
        std::lock_guard<std::mutex> lock(mutex_);
        sections_ = sections;
    } catch (const ValidationError& e) {
        std::lock_guard<std::mutex> lock(mutex_);
        last_error_ = std::string("Invalid configuration: ") + e.what();
        std::cerr << "[SystemConfig] " << last_error_ << std::endl;
        return false;
    }

    std::cerr << "[SystemConfig] Successfully loaded config from: " << configPath << std::endl;
    return true;
}

bool SystemConfig::saveConfig(const std::string& configPath) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string path = configPath.empty() ? config_path_ : configPath;
    if (path.empty()) {
        last_error_ = "No config path specified";
        std::cerr << "[SystemConfig] Error: " << last_error_ << std::endl;
        return false;
    }

    try {
        std::filesystem::path filePath(path);
        if (filePath.has_parent_path()) {
            std::filesystem::create_directories(filePath.parent_path());
        }
    } catch (const std::filesystem::filesystem_error& e) {
        last_error_ = std::string("Cannot create config directory: ") + e.what();
        std::cerr << "[SystemConfig] " << last_error_ << std::endl;
        return false;
    }

    std::ofstream file(path);
    if (!file.is_open()) {
        last_error_ = "Failed to open file for writing: " + path;
        std::cerr << "[SystemConfig] Error: " << last_error_ << std::endl;
        return false;
    }

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());
    writer->write(toJson(sections_), &file);
    file << "\n";
    file.flush();
    if (!file.good()) {
        last_error_ = "Failed to write config file: " + path;
        std::cerr << "[SystemConfig] Error: " << last_error_ << std::endl;
        return false;
    }

    if (configPath.empty()) {
        config_path_ = path;
    }
    std::cerr << "[SystemConfig] Successfully saved config to: " << path << std::endl;
    return true;
}

bool SystemConfig::applyEnvironmentOverrides() {
    std::lock_guard<std::mutex> lock(mutex_);
    Sections next = sections_;

    next.recognition.tolerance =
        EnvConfig::getDouble("FACE_TOLERANCE", next.recognition.tolerance, 0.0);
    next.recognition.embeddingDimension = static_cast<size_t>(EnvConfig::getInt(
        "EMBEDDING_DIM", static_cast<int>(next.recognition.embeddingDimension), 1,
        65536));
    next.storage.dataDir = EnvConfig::getString("DATA_DIR", next.storage.dataDir);
    next.webServer.ipAddress =
        EnvConfig::getString("API_HOST", next.webServer.ipAddress);
    next.webServer.port = static_cast<uint16_t>(
        EnvConfig::getInt("API_PORT", next.webServer.port, 1, 65535));

    std::string error;
    if (!validateSections(next, error)) {
        last_error_ = "Invalid environment override: " + error;
        std::cerr << "[SystemConfig] " << last_error_ << std::endl;
        return false;
    }
    sections_ = next;
    return true;
}

bool SystemConfig::validate(std::string& error) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return validateSections(sections_, error);
}

SystemConfig::RecognitionConfig SystemConfig::getRecognitionConfig() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sections_.recognition;
}

void SystemConfig::setRecognitionConfig(const RecognitionConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    sections_.recognition = config;
}

SystemConfig::AttendanceConfig SystemConfig::getAttendanceConfig() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sections_.attendance;
}

void SystemConfig::setAttendanceConfig(const AttendanceConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    sections_.attendance = config;
}

SystemConfig::StorageConfig SystemConfig::getStorageConfig() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sections_.storage;
}

void SystemConfig::setStorageConfig(const StorageConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    sections_.storage = config;
}

SystemConfig::WebServerConfig SystemConfig::getWebServerConfig() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sections_.webServer;
}

void SystemConfig::setWebServerConfig(const WebServerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    sections_.webServer = config;
}

SystemConfig::LoggingConfig SystemConfig::getLoggingConfig() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sections_.logging;
}

void SystemConfig::setLoggingConfig(const LoggingConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    sections_.logging = config;
}

Json::Value SystemConfig::getConfigJson() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return toJson(sections_);
}

std::string SystemConfig::getConfigPath() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_path_;
}

std::string SystemConfig::lastError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_error_;
}
