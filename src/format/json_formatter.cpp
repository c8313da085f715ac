#include "threat_guard/format/json_formatter.hpp"

namespace threat_guard {
namespace format {

nlohmann::json JsonFormatter::format(const std::string& address, const network::IPClassification& result) {
    nlohmann::json json;
    json["address"] = address;
    json["is_valid"] = result.is_valid;
    json["address_family"] = network::to_string(result.address_family);

    nlohmann::json flags;
    flags["private"] = result.is_private;
    flags["reserved"] = result.is_reserved;
    flags["loopback"] = result.is_loopback;
    flags["multicast"] = result.is_multicast;
    flags["link_local"] = result.is_link_local;
    flags["cloud_metadata"] = result.is_cloud_metadata;
    json["flags"] = flags;

    json["risk_level"] = common::to_string(result.risk_level);
    json["allowed_for_outbound"] = result.allowed_for_outbound;
    json["reason"] = result.reason;
    return json;
}

nlohmann::json JsonFormatter::format(const std::string& file_path, const scan::ContentAnalysisResult& result) {
    nlohmann::json json;
    json["file"] = file_path;
    json["is_threat"] = result.is_threat;
    json["risk_level"] = common::to_string(result.risk_level);
    json["recommendation"] = scan::to_string(result.recommendation);
    json["analyzed_bytes"] = result.analyzed_bytes;

    if (result.degraded) {
        json["degraded"] = true;
    }

    json["evidence"] = nlohmann::json::array();
    for (const auto& item : result.evidence) {
        json["evidence"].push_back(formatEvidence(item));
    }
    return json;
}

nlohmann::json JsonFormatter::format(const upload::UploadVerdict& verdict) {
    nlohmann::json json;
    json["accepted"] = verdict.accepted;

    if (verdict.rejection_reason) {
        json["rejection_reason"] = core::RejectionKindHelper::toString(*verdict.rejection_reason);
    } else {
        json["rejection_reason"] = nullptr;
    }

    json["message"] = verdict.message;
    json["severity"] = common::to_string(verdict.severity);
    json["detected_type"] = scan::to_string(verdict.detected_type);

    if (verdict.width > 0 && verdict.height > 0) {
        json["dimensions"] = {{"width", verdict.width}, {"height", verdict.height}};
    }

    if (verdict.sanitized_bytes) {
        json["sanitized_size"] = verdict.sanitized_bytes->size();
    }

    if (!verdict.details.empty()) {
        json["details"] = verdict.details;
    }
    return json;
}

nlohmann::json JsonFormatter::format(const throttle::RateLimitDecision& decision) {
    nlohmann::json json;
    json["allowed"] = decision.allowed;
    json["remaining"] = decision.remaining;
    json["limit"] = decision.limit;
    json["reset_at_ms"] = common::toEpochMillis(decision.reset_at);
    return json;
}

nlohmann::json JsonFormatter::format(const throttle::LockoutStatus& status) {
    nlohmann::json json;
    json["locked"] = status.locked;
    json["remaining_minutes"] = status.remaining_minutes ? nlohmann::json(*status.remaining_minutes)
                                                         : nlohmann::json(nullptr);
    json["attempts"] = status.attempts ? nlohmann::json(*status.attempts) : nlohmann::json(nullptr);
    return json;
}

nlohmann::json JsonFormatter::format(const events::SinkMetrics& metrics) {
    nlohmann::json json;
    json["state"] = events::to_string(metrics.state);
    json["total_events"] = metrics.total_events;
    json["successful_writes"] = metrics.successful_writes;
    json["failed_writes"] = metrics.failed_writes;
    json["circuit_trips"] = metrics.circuit_trips;
    json["dropped_events"] = metrics.dropped_events;
    json["queue_size"] = metrics.queue_size;
    return json;
}

nlohmann::json JsonFormatter::formatEvidence(const scan::ThreatEvidence& evidence) {
    nlohmann::json json;
    json["kind"] = evidence.kind;
    json["confidence"] = evidence.confidence;
    json["byte_offset"] = evidence.byte_offset;
    json["description"] = evidence.description;
    return json;
}

}}
