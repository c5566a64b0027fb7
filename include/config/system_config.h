#pragma once

#include <cstdint>
#include <json/json.h>
#include <mutex>
#include <string>

/**
 * @brief Service configuration loaded from config.json
 *
 * Holds typed, validated sections. Not a singleton: main() builds one and
 * hands the sections to the components that need them.
 *
 * Layout:
 * {
 *   "recognition": { "tolerance", "embedding_dimension",
 *                    "max_embeddings_per_identity" },
 *   "attendance":  { "history_days", "top_n" },
 *   "storage":     { "data_dir", "gallery_file", "attendance_dir" },
 *   "system": {
 *     "web_server": { "ip_address", "port", "threads", "cors": {"enabled"} },
 *     "logging":    { "log_dir", "log_level", "max_log_files" }
 *   }
 * }
 */
class SystemConfig {
public:
    struct RecognitionConfig {
        double tolerance = 0.4;
        size_t embeddingDimension = 128;
        size_t maxEmbeddingsPerIdentity = 15;
    };

    struct AttendanceConfig {
        int historyDays = 30;
        size_t topN = 10;
    };

    struct StorageConfig {
        std::string dataDir = "./data";
        std::string galleryFile = "face_gallery.txt";
        std::string attendanceDir = "attendance";
    };

    struct WebServerConfig {
        std::string ipAddress = "0.0.0.0";
        uint16_t port = 8080;
        size_t threads = 4;
        bool corsEnabled = true;
    };

    struct LoggingConfig {
        std::string logDir = "./logs";
        std::string logLevel = "info";
        int maxLogFiles = 7;
    };

    /**
     * @brief Defaults for every section
     */
    SystemConfig() = default;

    /**
     * @brief Build from a parsed config document
     * @throws ValidationError if a value has the wrong type or is out of range
     */
    explicit SystemConfig(const Json::Value& json);

    SystemConfig(const SystemConfig&) = delete;
    SystemConfig& operator=(const SystemConfig&) = delete;

    /**
     * @brief Load configuration from file
     *
     * A missing file is created with the current values.
     * @param configPath Path to config.json file
     * @return true if loaded successfully; on false, lastError() explains
     * and the previous values are kept
     */
    bool loadConfig(const std::string& configPath);

    /**
     * @brief Save configuration to file
     * @param configPath Path to config.json file (optional, uses current path if empty)
     * @return true if saved successfully
     */
    bool saveConfig(const std::string& configPath = "");

    /**
     * @brief Apply FACE_TOLERANCE, EMBEDDING_DIM, DATA_DIR, API_HOST and
     * API_PORT on top of the loaded values
     * @return false if the result no longer validates (values unchanged)
     */
    bool applyEnvironmentOverrides();

    /**
     * @brief Check every section
     * @param error Set to the first problem found
     */
    bool validate(std::string& error) const;

    RecognitionConfig getRecognitionConfig() const;
    void setRecognitionConfig(const RecognitionConfig& config);

    AttendanceConfig getAttendanceConfig() const;
    void setAttendanceConfig(const AttendanceConfig& config);

    StorageConfig getStorageConfig() const;
    void setStorageConfig(const StorageConfig& config);

    WebServerConfig getWebServerConfig() const;
    void setWebServerConfig(const WebServerConfig& config);

    LoggingConfig getLoggingConfig() const;
    void setLoggingConfig(const LoggingConfig& config);

    /**
     * @brief Full configuration as JSON
     */
    Json::Value getConfigJson() const;

    std::string getConfigPath() const;
    std::string lastError() const;

private:
    struct Sections {
        RecognitionConfig recognition;
        AttendanceConfig attendance;
        StorageConfig storage;
        WebServerConfig webServer;
        LoggingConfig logging;
    };

    mutable std::mutex mutex_;
    Sections sections_;
    std::string config_path_;
    std::string last_error_;

    static Sections parseSections(const Json::Value& json);
    static bool validateSections(const Sections& sections, std::string& error);
    static Json::Value toJson(const Sections& sections);
};
