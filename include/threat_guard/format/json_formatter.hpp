#pragma once

#include "../events/security_event_sink.hpp"
#include "../network/ip_classifier.hpp"
#include "../scan/content_scanner.hpp"
#include "../throttle/lockout_tracker.hpp"
#include "../throttle/rate_limiter.hpp"
#include "../upload/validation_pipeline.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace threat_guard {
namespace format {

class JsonFormatter {
public:
    static nlohmann::json format(const std::string& address, const network::IPClassification& result);
    static nlohmann::json format(const std::string& file_path, const scan::ContentAnalysisResult& result);
    static nlohmann::json format(const upload::UploadVerdict& verdict);
    static nlohmann::json format(const throttle::RateLimitDecision& decision);
    static nlohmann::json format(const throttle::LockoutStatus& status);
    static nlohmann::json format(const events::SinkMetrics& metrics);

private:
    static nlohmann::json formatEvidence(const scan::ThreatEvidence& evidence);
};

}}
