#include "threat_guard/upload/artifact_paths.hpp"
#include "threat_guard/common/constants.hpp"
#include "threat_guard/common/logger.hpp"
#include <cctype>
#include <filesystem>
#include <fstream>
#include <random>

namespace threat_guard {
namespace upload {

namespace {

constexpr size_t RANDOM_SUFFIX_BYTES = 16;

std::string randomHex(size_t bytes) {
    static const char* hex_chars = "0123456789abcdef";
    std::random_device rd;
    std::uniform_int_distribution<int> dis(0, 255);

    std::string out;
    out.reserve(bytes * 2);
    for (size_t i = 0; i < bytes; ++i) {
        int value = dis(rd);
        out += hex_chars[(value >> 4) & 0x0F];
        out += hex_chars[value & 0x0F];
    }
    return out;
}

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool hasDotDotSegment(const std::string& path) {
    return path.find("..") != std::string::npos;
}

}

std::string ArtifactPaths::makeStorageName(const std::string& caller_id, common::Instant now) {
    return caller_id + "_" + std::to_string(common::toEpochMillis(now)) + "_" +
           randomHex(RANDOM_SUFFIX_BYTES) + constants::storage::SANITIZED_EXTENSION;
}

std::string ArtifactPaths::makeStoragePath(const std::string& caller_id, common::Instant now) {
    return std::string(constants::storage::AVATAR_PREFIX) + makeStorageName(caller_id, now);
}

std::string ArtifactPaths::percentDecode(const std::string& text, bool& ok) {
    ok = true;
    std::string out;
    out.reserve(text.size());

    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] != '%') {
            out += text[i];
            continue;
        }
        if (i + 2 >= text.size()) {
            ok = false;
            return out;
        }
        int hi = hexValue(text[i + 1]);
        int lo = hexValue(text[i + 2]);
        if (hi < 0 || lo < 0) {
            ok = false;
            return out;
        }
        out += static_cast<char>((hi << 4) | lo);
        i += 2;
    }
    return out;
}

bool ArtifactPaths::isSafeArtifactPath(const std::string& path) {
    if (path.empty()) return false;
    if (path.find('\0') != std::string::npos) return false;
    if (path[0] == '/' || path[0] == '\\') return false;
    if (path.find('\\') != std::string::npos) return false;
    if (hasDotDotSegment(path)) return false;
    if (path.find_first_of("<>:\"|?*") != std::string::npos) return false;

    bool decoded_ok = true;
    std::string decoded = percentDecode(path, decoded_ok);
    if (!decoded_ok) return false;
    if (decoded != path && (hasDotDotSegment(decoded) || decoded.find('\0') != std::string::npos ||
                            decoded.find('\\') != std::string::npos)) {
        return false;
    }

    const std::string prefix = constants::storage::AVATAR_PREFIX;
    if (path.compare(0, prefix.size(), prefix) != 0 || path.size() == prefix.size()) return false;

    return path.find("//") == std::string::npos;
}

std::string to_string(RemovalResult result) {
    switch (result) {
        case RemovalResult::REMOVED: return "removed";
        case RemovalResult::SKIPPED: return "skipped";
        case RemovalResult::UNSAFE_PATH: return "unsafe_path";
        case RemovalResult::FAILED: return "failed";
        default: return "unknown";
    }
}

DirectoryArtifactStorage::DirectoryArtifactStorage(std::string root) : root_(std::move(root)) {}

bool DirectoryArtifactStorage::store(const std::string& relative_path, const common::Bytes& bytes) {
    if (!ArtifactPaths::isSafeArtifactPath(relative_path)) {
        common::Logger::instance().warn("[Artifacts] Refusing to store at unsafe path | path={}", relative_path);
        return false;
    }

    std::filesystem::path target = std::filesystem::path(root_) / relative_path;
    std::error_code ec;
    std::filesystem::create_directories(target.parent_path(), ec);
    if (ec) {
        common::Logger::instance().error("[Artifacts] Cannot create directory | path={} | error={}",
                                         target.parent_path().string(), ec.message());
        return false;
    }

    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out) {
        common::Logger::instance().error("[Artifacts] Cannot open artifact | path={}", target.string());
        return false;
    }
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    return static_cast<bool>(out);
}

bool DirectoryArtifactStorage::remove(const std::string& relative_path) {
    std::error_code ec;
    bool removed = std::filesystem::remove(std::filesystem::path(root_) / relative_path, ec);
    if (ec) {
        common::Logger::instance().warn("[Artifacts] Remove failed | path={} | error={}", relative_path, ec.message());
        return false;
    }
    return removed;
}

RemovalResult removePreviousArtifact(ArtifactStorage& storage,
                                     const std::string& previous_path,
                                     const std::string& caller_id,
                                     events::SecurityEventSink* sink) {
    if (previous_path.empty()) {
        return RemovalResult::SKIPPED;
    }

    if (!ArtifactPaths::isSafeArtifactPath(previous_path)) {
        common::Logger::instance().warn("[Artifacts] Refusing unsafe artifact path | caller={} | path={}",
                                        caller_id, previous_path);
        if (sink) {
            events::SecurityEvent event;
            event.kind = "path_traversal_attempt";
            event.caller_id = caller_id;
            event.severity = common::Severity::HIGH;
            event.details["path"] = previous_path;
            event.details["operation"] = "remove_previous_artifact";
            if (!sink->submit(std::move(event))) {
                common::Logger::instance().debug("[Artifacts] Security event not retained");
            }
        }
        return RemovalResult::UNSAFE_PATH;
    }

    try {
        if (!storage.remove(previous_path)) {
            common::Logger::instance().warn("[Artifacts] Previous artifact not removed | caller={} | path={}",
                                            caller_id, previous_path);
            return RemovalResult::FAILED;
        }
    } catch (const std::exception& e) {
        common::Logger::instance().error("[Artifacts] Removal failed | caller={} | path={} | error={}",
                                         caller_id, previous_path, e.what());
        return RemovalResult::FAILED;
    }

    common::Logger::instance().debug("[Artifacts] Previous artifact removed | path={}", previous_path);
    return RemovalResult::REMOVED;
}

}}
