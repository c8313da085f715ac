#pragma once

#include "../common/error_framework.hpp"
#include "../common/types.hpp"
#include <unordered_map>

namespace threat_guard {
namespace core {

enum class RejectionKind {
    INVALID_INPUT = 100,

    SIZE_EXCEEDED = 200,
    UNSUPPORTED_OR_SPOOFED_TYPE = 201,
    DIMENSION_EXCEEDED = 202,
    DECOMPRESSION_BOMB_SUSPECTED = 203,

    CONTENT_THREAT_DETECTED = 300,
    SSRF_VECTOR_DETECTED = 301,
    SUSPICIOUS_METADATA = 302,

    RATE_LIMITED = 400,
    ACCOUNT_LOCKED = 401,

    INTERNAL_ERROR = 500
};

using RejectionKindHelper = common::ErrorRegistry<RejectionKind>;

}
}

namespace threat_guard {
namespace common {

template<>
inline const std::unordered_map<core::RejectionKind, ErrorInfo<core::RejectionKind>>&
ErrorRegistry<core::RejectionKind>::getInfoMap() {
    using core::RejectionKind;
    static const std::unordered_map<RejectionKind, ErrorInfo<RejectionKind>> map = {
        {RejectionKind::INVALID_INPUT, {
            RejectionKind::INVALID_INPUT,
            "INVALID_INPUT",
            "invalid_input",
            RiskLevel::MEDIUM,
            "The request contained malformed input"
        }},
        {RejectionKind::SIZE_EXCEEDED, {
            RejectionKind::SIZE_EXCEEDED,
            "SIZE_EXCEEDED",
            "file_size_exceeded",
            RiskLevel::MEDIUM,
            "File size exceeds the upload limit"
        }},
        {RejectionKind::UNSUPPORTED_OR_SPOOFED_TYPE, {
            RejectionKind::UNSUPPORTED_OR_SPOOFED_TYPE,
            "UNSUPPORTED_OR_SPOOFED_TYPE",
            "invalid_file_type",
            RiskLevel::HIGH,
            "Invalid file type. Only JPEG, PNG, WebP, and GIF are allowed"
        }},
        {RejectionKind::DIMENSION_EXCEEDED, {
            RejectionKind::DIMENSION_EXCEEDED,
            "DIMENSION_EXCEEDED",
            "dimension_exceeded",
            RiskLevel::MEDIUM,
            "Image dimensions exceed maximum allowed size"
        }},
        {RejectionKind::DECOMPRESSION_BOMB_SUSPECTED, {
            RejectionKind::DECOMPRESSION_BOMB_SUSPECTED,
            "DECOMPRESSION_BOMB_SUSPECTED",
            "decompression_bomb",
            RiskLevel::HIGH,
            "Suspicious image compression detected"
        }},
        {RejectionKind::CONTENT_THREAT_DETECTED, {
            RejectionKind::CONTENT_THREAT_DETECTED,
            "CONTENT_THREAT_DETECTED",
            "polyglot_file_detected",
            RiskLevel::CRITICAL,
            "File contains content that is not allowed"
        }},
        {RejectionKind::SSRF_VECTOR_DETECTED, {
            RejectionKind::SSRF_VECTOR_DETECTED,
            "SSRF_VECTOR_DETECTED",
            "ssrf_attempt",
            RiskLevel::CRITICAL,
            "File references a disallowed network address"
        }},
        {RejectionKind::SUSPICIOUS_METADATA, {
            RejectionKind::SUSPICIOUS_METADATA,
            "SUSPICIOUS_METADATA",
            "malicious_metadata",
            RiskLevel::HIGH,
            "Image metadata contains suspicious content"
        }},
        {RejectionKind::RATE_LIMITED, {
            RejectionKind::RATE_LIMITED,
            "RATE_LIMITED",
            "rate_limit_exceeded",
            RiskLevel::MEDIUM,
            "Too many requests, please try again later"
        }},
        {RejectionKind::ACCOUNT_LOCKED, {
            RejectionKind::ACCOUNT_LOCKED,
            "ACCOUNT_LOCKED",
            "account_locked",
            RiskLevel::HIGH,
            "Account temporarily locked due to repeated failed attempts"
        }},
        {RejectionKind::INTERNAL_ERROR, {
            RejectionKind::INTERNAL_ERROR,
            "INTERNAL_ERROR",
            "content_analysis_failed",
            RiskLevel::MEDIUM,
            "Failed to process file"
        }}
    };
    return map;
}

template<>
inline const ErrorInfo<core::RejectionKind>& ErrorRegistry<core::RejectionKind>::getFallback() {
    static const ErrorInfo<core::RejectionKind> fallback{
        core::RejectionKind::INTERNAL_ERROR,
        "INTERNAL_ERROR",
        "content_analysis_failed",
        RiskLevel::MEDIUM,
        "Failed to process file"
    };
    return fallback;
}

}
}
