#pragma once

#include "constants.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace threat_guard {
namespace common {

enum class LogLevel {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3
};

enum class LogFormat {
    TEXT,
    JSON
};

std::optional<LogLevel> parseLogLevel(const std::string& text);

struct LoggingConfig {
    size_t rotation_size_mb = constants::limits::DEFAULT_LOG_ROTATION_SIZE_MB;
    size_t max_files = constants::limits::DEFAULT_LOG_MAX_FILES;
    LogFormat format = LogFormat::TEXT;
};

struct UploadConfig {
    size_t max_file_size_bytes = constants::limits::DEFAULT_MAX_UPLOAD_BYTES;
    int max_image_dimension = constants::limits::DEFAULT_MAX_IMAGE_DIMENSION;
    double max_compression_ratio = constants::limits::DEFAULT_MAX_COMPRESSION_RATIO;
    size_t max_metadata_fields = constants::limits::DEFAULT_MAX_METADATA_FIELDS;
    int decode_timeout_ms = constants::limits::DEFAULT_DECODE_TIMEOUT_MS;
    size_t max_concurrent_decodes = constants::limits::DEFAULT_MAX_CONCURRENT_DECODES;
    int output_max_dimension = constants::limits::DEFAULT_OUTPUT_MAX_DIMENSION;
    int output_jpeg_quality = constants::limits::DEFAULT_OUTPUT_JPEG_QUALITY;
    std::vector<std::string> allowed_types{
        constants::config_defaults::ALLOWED_IMAGE_TYPES.begin(),
        constants::config_defaults::ALLOWED_IMAGE_TYPES.end()};
};

struct ScannerConfig {
    size_t max_analysis_bytes = constants::limits::DEFAULT_MAX_ANALYSIS_BYTES;
    size_t entropy_window_bytes = constants::limits::DEFAULT_ENTROPY_WINDOW;
    double entropy_threshold = constants::limits::DEFAULT_ENTROPY_THRESHOLD;
    size_t null_byte_threshold = constants::limits::DEFAULT_NULL_BYTE_THRESHOLD;
    double critical_confidence = constants::config_defaults::CRITICAL_CONFIDENCE;
    double high_confidence = constants::config_defaults::HIGH_CONFIDENCE;
    double medium_confidence = constants::config_defaults::MEDIUM_CONFIDENCE;
    size_t high_evidence_count = constants::config_defaults::HIGH_EVIDENCE_COUNT;
    size_t medium_evidence_count = constants::config_defaults::MEDIUM_EVIDENCE_COUNT;
};

struct RateLimitConfig {
    int64_t default_limit = constants::config_defaults::RATE_DEFAULT_LIMIT;
    int64_t window_ms = constants::config_defaults::RATE_WINDOW_MS;
    int64_t authenticated_limit = constants::config_defaults::RATE_AUTHENTICATED_LIMIT;
    int64_t anonymous_limit = constants::config_defaults::RATE_ANONYMOUS_LIMIT;
    int64_t auth_limit = constants::config_defaults::RATE_AUTH_LIMIT;
    int64_t auth_window_ms = constants::config_defaults::RATE_AUTH_WINDOW_MS;
    int64_t upload_limit = constants::config_defaults::RATE_UPLOAD_LIMIT;
    int64_t upload_window_ms = constants::config_defaults::RATE_UPLOAD_WINDOW_MS;
    int64_t public_limit = constants::config_defaults::RATE_PUBLIC_LIMIT;
    int sweep_interval_seconds = constants::config_defaults::RATE_SWEEP_INTERVAL_SECONDS;
    size_t shards = constants::config_defaults::STORE_SHARDS;
};

struct LockoutConfig {
    int max_attempts = constants::config_defaults::LOCKOUT_MAX_ATTEMPTS;
    int64_t base_lockout_minutes = constants::config_defaults::LOCKOUT_BASE_MINUTES;
    int64_t max_lockout_minutes = constants::config_defaults::LOCKOUT_MAX_MINUTES;
    int64_t attempt_window_minutes = constants::config_defaults::LOCKOUT_ATTEMPT_WINDOW_MINUTES;
    int64_t progressive_multiplier = constants::config_defaults::LOCKOUT_MULTIPLIER;
    int sweep_interval_seconds = constants::config_defaults::LOCKOUT_SWEEP_INTERVAL_SECONDS;
};

struct EventsConfig {
    int failure_threshold = constants::config_defaults::EVENTS_FAILURE_THRESHOLD;
    int64_t reset_timeout_ms = constants::config_defaults::EVENTS_RESET_TIMEOUT_MS;
    int half_open_successes = constants::config_defaults::EVENTS_HALF_OPEN_SUCCESSES;
    size_t max_queue_size = constants::config_defaults::EVENTS_MAX_QUEUE_SIZE;
};

struct GlobalConfig {
    LogLevel log_level = LogLevel::INFO;
    std::string log_file;
    LoggingConfig logging;
    UploadConfig upload;
    ScannerConfig scanner;
    RateLimitConfig rate_limit;
    LockoutConfig lockout;
    EventsConfig events;
};

class Config {
public:
    static Config& instance();

    // Missing file keeps the defaults. Returns false only when a file was
    // found and could not be parsed.
    bool load(const std::string& config_file = "");
    bool loadFromString(const std::string& toml_text);

    const GlobalConfig& global() const { return global_; }
    GlobalConfig& global() { return global_; }

    std::string getConfigPath() const { return current_config_path_; }
    std::vector<std::string> getConfigSearchPaths() const;

    void resetToDefaults();

private:
    Config() = default;
    GlobalConfig global_;
    std::string current_config_path_;

    std::optional<std::string> findBestConfig() const;
    bool tryLoadTomlFile(const std::string& path, const std::string& description);
};

}}
