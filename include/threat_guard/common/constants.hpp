#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace threat_guard {
namespace constants {

namespace version {
    constexpr const char* CLI_VERSION = "1.2.0";

    inline std::string getFullVersion() {
        return std::string("threat-guard v") + CLI_VERSION;
    }
}

namespace system {
    constexpr const char* APPLICATION_NAME = "threat-guard";
    constexpr const char* LOGGER_NAME = "threat-guard";
    constexpr const char* CONFIG_ENV = "THREAT_GUARD_CONFIG";
    constexpr const char* SYSTEM_CONFIG_FILE = "/etc/threat-guard/threat-guard.toml";
    constexpr const char* USER_CONFIG_SUBPATH = "threat-guard/threat-guard.toml";
}

namespace limits {
    constexpr size_t DEFAULT_MAX_UPLOAD_BYTES = 5 * 1024 * 1024;
    constexpr int DEFAULT_MAX_IMAGE_DIMENSION = 4096;
    constexpr double DEFAULT_MAX_COMPRESSION_RATIO = 100.0;
    constexpr size_t DEFAULT_MAX_METADATA_FIELDS = 50;
    constexpr int DEFAULT_DECODE_TIMEOUT_MS = 5000;
    constexpr size_t DEFAULT_MAX_CONCURRENT_DECODES = 8;
    constexpr int DEFAULT_OUTPUT_MAX_DIMENSION = 1024;
    constexpr int DEFAULT_OUTPUT_JPEG_QUALITY = 85;
    constexpr size_t SSRF_FALLBACK_WINDOW = 4096;

    constexpr size_t DEFAULT_MAX_ANALYSIS_BYTES = 1024 * 1024;
    constexpr size_t DEFAULT_ENTROPY_WINDOW = 4096;
    constexpr double DEFAULT_ENTROPY_THRESHOLD = 7.5;
    constexpr size_t DEFAULT_NULL_BYTE_THRESHOLD = 10;
    constexpr size_t FALLBACK_ANALYSIS_BYTES = 4096;
    constexpr size_t MAX_MATCHES_PER_PATTERN = 16;

    constexpr size_t DEFAULT_LOG_ROTATION_SIZE_MB = 100;
    constexpr size_t DEFAULT_LOG_MAX_FILES = 5;
}

namespace config_defaults {
    constexpr double CRITICAL_CONFIDENCE = 0.9;
    constexpr double HIGH_CONFIDENCE = 0.8;
    constexpr double MEDIUM_CONFIDENCE = 0.6;
    constexpr size_t HIGH_EVIDENCE_COUNT = 3;
    constexpr size_t MEDIUM_EVIDENCE_COUNT = 2;

    constexpr int64_t RATE_DEFAULT_LIMIT = 100;
    constexpr int64_t RATE_WINDOW_MS = 60 * 1000;
    constexpr int64_t RATE_AUTHENTICATED_LIMIT = 200;
    constexpr int64_t RATE_ANONYMOUS_LIMIT = 50;
    constexpr int64_t RATE_AUTH_LIMIT = 20;
    constexpr int64_t RATE_AUTH_WINDOW_MS = 15 * 60 * 1000;
    constexpr int64_t RATE_UPLOAD_LIMIT = 10;
    constexpr int64_t RATE_UPLOAD_WINDOW_MS = 60 * 60 * 1000;
    constexpr int64_t RATE_PUBLIC_LIMIT = 30;
    constexpr int RATE_SWEEP_INTERVAL_SECONDS = 300;
    constexpr size_t STORE_SHARDS = 16;

    constexpr int LOCKOUT_MAX_ATTEMPTS = 5;
    constexpr int64_t LOCKOUT_BASE_MINUTES = 15;
    constexpr int64_t LOCKOUT_MAX_MINUTES = 24 * 60;
    constexpr int64_t LOCKOUT_ATTEMPT_WINDOW_MINUTES = 60;
    constexpr int64_t LOCKOUT_MULTIPLIER = 2;
    constexpr int LOCKOUT_SWEEP_INTERVAL_SECONDS = 300;

    constexpr int EVENTS_FAILURE_THRESHOLD = 5;
    constexpr int64_t EVENTS_RESET_TIMEOUT_MS = 60 * 1000;
    constexpr int EVENTS_HALF_OPEN_SUCCESSES = 3;
    constexpr size_t EVENTS_MAX_QUEUE_SIZE = 10000;

    constexpr std::array<const char*, 4> ALLOWED_IMAGE_TYPES = {"jpeg", "png", "webp", "gif"};
}

namespace storage {
    constexpr const char* AVATAR_PREFIX = "uploads/avatars/";
    constexpr const char* SANITIZED_EXTENSION = ".jpg";
}

}
}
