#include "threat_guard/common/config.hpp"
#include "threat_guard/common/logger.hpp"
#include <toml.hpp>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <unistd.h>

namespace threat_guard {
namespace common {

namespace {

void applyTomlData(const toml::value& data, GlobalConfig& global) {
    if (data.contains("global")) {
        const auto& section = data.at("global");

        if (section.contains("log_level")) {
            auto level = parseLogLevel(toml::find<std::string>(section, "log_level"));
            if (level) global.log_level = *level;
        }
        if (section.contains("log_file")) {
            global.log_file = toml::find<std::string>(section, "log_file");
        }
    }

    if (data.contains("logging")) {
        const auto& section = data.at("logging");

        if (section.contains("rotation_size_mb")) {
            global.logging.rotation_size_mb = toml::find<size_t>(section, "rotation_size_mb");
        }
        if (section.contains("max_files")) {
            global.logging.max_files = toml::find<size_t>(section, "max_files");
        }
        if (section.contains("format")) {
            std::string format = toml::find<std::string>(section, "format");
            global.logging.format = (format == "json") ? LogFormat::JSON : LogFormat::TEXT;
        }
    }

    if (data.contains("upload")) {
        const auto& section = data.at("upload");
        auto& upload = global.upload;

        if (section.contains("max_file_size_bytes")) {
            upload.max_file_size_bytes = toml::find<size_t>(section, "max_file_size_bytes");
        }
        if (section.contains("max_image_dimension")) {
            upload.max_image_dimension = toml::find<int>(section, "max_image_dimension");
        }
        if (section.contains("max_compression_ratio")) {
            upload.max_compression_ratio = toml::find<double>(section, "max_compression_ratio");
        }
        if (section.contains("max_metadata_fields")) {
            upload.max_metadata_fields = toml::find<size_t>(section, "max_metadata_fields");
        }
        if (section.contains("decode_timeout_ms")) {
            upload.decode_timeout_ms = toml::find<int>(section, "decode_timeout_ms");
        }
        if (section.contains("max_concurrent_decodes")) {
            upload.max_concurrent_decodes = std::max<size_t>(1, toml::find<size_t>(section, "max_concurrent_decodes"));
        }
        if (section.contains("output_max_dimension")) {
            upload.output_max_dimension = toml::find<int>(section, "output_max_dimension");
        }
        if (section.contains("output_jpeg_quality")) {
            upload.output_jpeg_quality = std::clamp(toml::find<int>(section, "output_jpeg_quality"), 1, 100);
        }
        if (section.contains("allowed_types")) {
            upload.allowed_types = toml::find<std::vector<std::string>>(section, "allowed_types");
        }
    }

    if (data.contains("scanner")) {
        const auto& section = data.at("scanner");
        auto& scanner = global.scanner;

        if (section.contains("max_analysis_bytes")) {
            scanner.max_analysis_bytes = toml::find<size_t>(section, "max_analysis_bytes");
        }
        if (section.contains("entropy_window_bytes")) {
            scanner.entropy_window_bytes = toml::find<size_t>(section, "entropy_window_bytes");
        }
        if (section.contains("entropy_threshold")) {
            scanner.entropy_threshold = toml::find<double>(section, "entropy_threshold");
        }
        if (section.contains("null_byte_threshold")) {
            scanner.null_byte_threshold = toml::find<size_t>(section, "null_byte_threshold");
        }
        if (section.contains("critical_confidence")) {
            scanner.critical_confidence = toml::find<double>(section, "critical_confidence");
        }
        if (section.contains("high_confidence")) {
            scanner.high_confidence = toml::find<double>(section, "high_confidence");
        }
        if (section.contains("medium_confidence")) {
            scanner.medium_confidence = toml::find<double>(section, "medium_confidence");
        }
        if (section.contains("high_evidence_count")) {
            scanner.high_evidence_count = toml::find<size_t>(section, "high_evidence_count");
        }
        if (section.contains("medium_evidence_count")) {
            scanner.medium_evidence_count = toml::find<size_t>(section, "medium_evidence_count");
        }
    }

    if (data.contains("rate_limit")) {
        const auto& section = data.at("rate_limit");
        auto& rate = global.rate_limit;

        if (section.contains("default_limit")) {
            rate.default_limit = toml::find<int64_t>(section, "default_limit");
        }
        if (section.contains("window_ms")) {
            rate.window_ms = toml::find<int64_t>(section, "window_ms");
        }
        if (section.contains("authenticated_limit")) {
            rate.authenticated_limit = toml::find<int64_t>(section, "authenticated_limit");
        }
        if (section.contains("anonymous_limit")) {
            rate.anonymous_limit = toml::find<int64_t>(section, "anonymous_limit");
        }
        if (section.contains("auth_limit")) {
            rate.auth_limit = toml::find<int64_t>(section, "auth_limit");
        }
        if (section.contains("auth_window_ms")) {
            rate.auth_window_ms = toml::find<int64_t>(section, "auth_window_ms");
        }
        if (section.contains("upload_limit")) {
            rate.upload_limit = toml::find<int64_t>(section, "upload_limit");
        }
        if (section.contains("upload_window_ms")) {
            rate.upload_window_ms = toml::find<int64_t>(section, "upload_window_ms");
        }
        if (section.contains("public_limit")) {
            rate.public_limit = toml::find<int64_t>(section, "public_limit");
        }
        if (section.contains("sweep_interval_seconds")) {
            rate.sweep_interval_seconds = toml::find<int>(section, "sweep_interval_seconds");
        }
        if (section.contains("shards")) {
            rate.shards = std::max<size_t>(1, toml::find<size_t>(section, "shards"));
        }
    }

    if (data.contains("lockout")) {
        const auto& section = data.at("lockout");
        auto& lockout = global.lockout;

        if (section.contains("max_attempts")) {
            lockout.max_attempts = toml::find<int>(section, "max_attempts");
        }
        if (section.contains("base_lockout_minutes")) {
            lockout.base_lockout_minutes = toml::find<int64_t>(section, "base_lockout_minutes");
        }
        if (section.contains("max_lockout_minutes")) {
            lockout.max_lockout_minutes = toml::find<int64_t>(section, "max_lockout_minutes");
        }
        if (section.contains("attempt_window_minutes")) {
            lockout.attempt_window_minutes = toml::find<int64_t>(section, "attempt_window_minutes");
        }
        if (section.contains("progressive_multiplier")) {
            lockout.progressive_multiplier = toml::find<int64_t>(section, "progressive_multiplier");
        }
        if (section.contains("sweep_interval_seconds")) {
            lockout.sweep_interval_seconds = toml::find<int>(section, "sweep_interval_seconds");
        }
    }

    if (data.contains("events")) {
        const auto& section = data.at("events");
        auto& events = global.events;

        if (section.contains("failure_threshold")) {
            events.failure_threshold = toml::find<int>(section, "failure_threshold");
        }
        if (section.contains("reset_timeout_ms")) {
            events.reset_timeout_ms = toml::find<int64_t>(section, "reset_timeout_ms");
        }
        if (section.contains("half_open_successes")) {
            events.half_open_successes = toml::find<int>(section, "half_open_successes");
        }
        if (section.contains("max_queue_size")) {
            events.max_queue_size = toml::find<size_t>(section, "max_queue_size");
        }
    }
}

}

std::optional<LogLevel> parseLogLevel(const std::string& text) {
    std::string upper = text;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "INFO") return LogLevel::INFO;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
    if (upper == "ERROR") return LogLevel::ERROR;
    return std::nullopt;
}

Config& Config::instance() {
    static Config instance;
    return instance;
}

void Config::resetToDefaults() {
    global_ = GlobalConfig{};
    current_config_path_.clear();
}

std::vector<std::string> Config::getConfigSearchPaths() const {
    std::vector<std::string> paths;

    if (const char* env_path = std::getenv(constants::system::CONFIG_ENV)) {
        if (*env_path) paths.emplace_back(env_path);
    }

    if (const char* xdg = std::getenv("XDG_CONFIG_HOME")) {
        if (*xdg) paths.push_back(std::string(xdg) + "/" + constants::system::USER_CONFIG_SUBPATH);
    } else if (const char* home = std::getenv("HOME")) {
        if (*home) paths.push_back(std::string(home) + "/.config/" + constants::system::USER_CONFIG_SUBPATH);
    }

    paths.emplace_back(constants::system::SYSTEM_CONFIG_FILE);
    return paths;
}

std::optional<std::string> Config::findBestConfig() const {
    for (const auto& path : getConfigSearchPaths()) {
        if (std::filesystem::exists(path) && access(path.c_str(), R_OK) == 0) {
            return path;
        }
    }
    return std::nullopt;
}

bool Config::load(const std::string& config_file) {
    global_ = GlobalConfig{};

    std::string effective_config_file = config_file;
    if (effective_config_file.empty()) {
        auto best = findBestConfig();
        if (!best) {
            Logger::instance().debug("[Config] No configuration file found, using defaults");
            current_config_path_.clear();
            return true;
        }
        effective_config_file = *best;
    }

    current_config_path_ = effective_config_file;

    if (!std::filesystem::exists(effective_config_file)) {
        Logger::instance().warn("[Config] File not found, using defaults | path={}", effective_config_file);
        return true;
    }

    return tryLoadTomlFile(effective_config_file, "main config");
}

bool Config::loadFromString(const std::string& toml_text) {
    GlobalConfig candidate;
    try {
        std::istringstream stream(toml_text);
        auto data = toml::parse(stream, "inline");
        applyTomlData(data, candidate);
    } catch (const std::exception& e) {
        Logger::instance().error("[Config] Parse failed | source=inline | error={}", e.what());
        return false;
    }

    global_ = candidate;
    current_config_path_.clear();
    return true;
}

bool Config::tryLoadTomlFile(const std::string& path, const std::string& description) {
    if (access(path.c_str(), R_OK) != 0) {
        Logger::instance().warn("[Config] {} not readable | path={}", description, path);
        return false;
    }

    GlobalConfig candidate;
    try {
        auto data = toml::parse(path);
        applyTomlData(data, candidate);
    } catch (const std::exception& e) {
        Logger::instance().error("[Config] Parse failed | path={} | error={}", path, e.what());
        return false;
    }

    global_ = candidate;
    Logger::instance().info("[Config] Loaded | source={} | path={}", description, path);
    return true;
}

}}
