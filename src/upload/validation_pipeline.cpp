#include "threat_guard/upload/validation_pipeline.hpp"
#include "threat_guard/common/constants.hpp"
#include "threat_guard/common/logger.hpp"
#include <algorithm>
#include <cctype>
#include <set>

namespace threat_guard {
namespace upload {

namespace {

constexpr size_t MAX_URL_LENGTH = 2048;

const std::vector<std::string> URL_SCHEMES = {
    "http://", "https://", "ftp://", "file://", "gopher://", "ldap://"
};

const std::vector<std::string> LOCAL_HOST_MARKERS = {
    "localhost", "127.0.0.1", "0.0.0.0", "169.254.", "::1", "metadata.google.internal"
};

const std::vector<std::string> SUSPICIOUS_METADATA_PATTERNS = {
    "<script", "javascript:", "vbscript:", "data:text/html", "<iframe", "onerror=", "onload=", "<?php"
};

std::string toLower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool isUrlTerminator(unsigned char c) {
    return c <= 0x20 || c >= 0x7F || c == '"' || c == '\'' || c == '<' || c == '>' || c == '`';
}

bool looksLikeObfuscatedNumericHost(const std::string& host) {
    if (host.empty() || !std::isdigit(static_cast<unsigned char>(host[0]))) return false;
    bool numeric_charset = std::all_of(host.begin(), host.end(), [](unsigned char c) {
        return std::isdigit(c) || c == '.' || c == 'x' || (c >= 'a' && c <= 'f');
    });
    return numeric_charset && !network::parseIPv4(host);
}

std::string joinUnique(const std::vector<scan::ThreatEvidence>& evidence) {
    std::set<std::string> seen;
    std::string joined;
    for (const auto& item : evidence) {
        if (!seen.insert(item.kind).second) continue;
        if (!joined.empty()) joined += ",";
        joined += item.kind;
    }
    return joined;
}

}

UploadValidationPipeline::UploadValidationPipeline(const common::UploadConfig& upload_config,
                                                   const common::ScannerConfig& scanner_config,
                                                   std::shared_ptr<const image::ImageCodec> codec,
                                                   std::shared_ptr<events::SecurityEventSink> sink)
    : config_(upload_config),
      scanner_(scanner_config),
      codec_(std::move(codec)),
      sink_(std::move(sink)) {}

UploadVerdict UploadValidationPipeline::validate(const UploadFile& file, const CallerContext& context) const {
    UploadVerdict verdict;
    const std::string_view data = common::asView(file.bytes);
    const size_t effective_size = std::max(file.size, file.bytes.size());

    if (file.bytes.empty()) {
        verdict.details["reason"] = "empty upload";
        return reject(std::move(verdict), core::RejectionKind::INVALID_INPUT, file, context);
    }

    if (effective_size > config_.max_file_size_bytes) {
        verdict.details["size"] = std::to_string(effective_size);
        verdict.details["limit"] = std::to_string(config_.max_file_size_bytes);
        return reject(std::move(verdict), core::RejectionKind::SIZE_EXCEEDED, file, context);
    }

    auto analysis = scanner_.analyze(data);
    if (analysis.risk_level == common::RiskLevel::HIGH || analysis.risk_level == common::RiskLevel::CRITICAL) {
        verdict.details["risk"] = common::to_string(analysis.risk_level);
        verdict.details["evidence"] = joinUnique(analysis.evidence);
        verdict.details["recommendation"] = scan::to_string(analysis.recommendation);
        return reject(std::move(verdict), core::RejectionKind::CONTENT_THREAT_DETECTED, file, context,
                      analysis.risk_level);
    }

    if (auto finding = findSsrfVector(data)) {
        verdict.details["url"] = finding->url.substr(0, 200);
        verdict.details["host"] = finding->host;
        verdict.details["reason"] = finding->reason;
        verdict.details["offset"] = std::to_string(finding->offset);
        return reject(std::move(verdict), core::RejectionKind::SSRF_VECTOR_DETECTED, file, context);
    }

    auto detected = scan::detectImageType(data);
    verdict.detected_type = detected.type;
    if (!isAllowedType(detected.type)) {
        verdict.details["detected_type"] = scan::to_string(detected.type);
        verdict.details["declared_mime"] = file.declared_mime_type;
        return reject(std::move(verdict), core::RejectionKind::UNSUPPORTED_OR_SPOOFED_TYPE, file, context);
    }

    auto declared = scan::imageTypeFromString(file.declared_mime_type);
    if (!file.declared_mime_type.empty() && (!declared || *declared != detected.type)) {
        verdict.details["declared_mime_mismatch"] = file.declared_mime_type;
        common::Logger::instance().info("[Upload] Declared type differs from content | declared={} | detected={}",
                                        file.declared_mime_type, scan::to_string(detected.type));
    }

    if (detected.dimensions && detected.dimensions->width > 0 && detected.dimensions->height > 0) {
        if (auto kind = checkDimensions(detected.dimensions->width, detected.dimensions->height,
                                        file.bytes.size(), verdict)) {
            verdict.details["stage"] = "header";
            return reject(std::move(verdict), *kind, file, context);
        }
    }

    if (!codec_) {
        verdict.details["error"] = "no image codec configured";
        return reject(std::move(verdict), core::RejectionKind::INTERNAL_ERROR, file, context);
    }

    auto shared_bytes = std::make_shared<const common::Bytes>(file.bytes);
    auto decoded = image::decodeWithTimeout(codec_, shared_bytes,
                                            std::chrono::milliseconds(config_.decode_timeout_ms),
                                            config_.max_concurrent_decodes);
    if (decoded.status != image::DecodeStatus::OK) {
        verdict.details["error"] = decoded.error;
        verdict.details["timed_out"] = decoded.status == image::DecodeStatus::TIMED_OUT ? "true" : "false";
        if (decoded.status == image::DecodeStatus::BUSY) {
            verdict.details["busy"] = "true";
        }
        return reject(std::move(verdict), core::RejectionKind::INTERNAL_ERROR, file, context);
    }

    verdict.width = decoded.image->width();
    verdict.height = decoded.image->height();
    if (auto kind = checkDimensions(verdict.width, verdict.height, file.bytes.size(), verdict)) {
        verdict.details["stage"] = "decode";
        return reject(std::move(verdict), *kind, file, context);
    }

    auto metadata = image::MetadataReader::readMetadata(data);
    if (auto issue = inspectMetadata(metadata)) {
        verdict.details["reason"] = *issue;
        verdict.details["field_count"] = std::to_string(metadata.field_count);
        return reject(std::move(verdict), core::RejectionKind::SUSPICIOUS_METADATA, file, context);
    }

    image::SanitizeOptions options;
    options.max_dimension = config_.output_max_dimension;
    options.jpeg_quality = config_.output_jpeg_quality;
    options.orientation = metadata.orientation;

    try {
        auto sanitized = codec_->encodeSanitized(*decoded.image, options);
        if (sanitized.empty()) {
            verdict.details["error"] = "encoder produced no output";
            return reject(std::move(verdict), core::RejectionKind::INTERNAL_ERROR, file, context);
        }
        verdict.sanitized_bytes = std::move(sanitized);
    } catch (const std::exception& e) {
        verdict.details["error"] = e.what();
        return reject(std::move(verdict), core::RejectionKind::INTERNAL_ERROR, file, context);
    }

    verdict.accepted = true;
    verdict.message = "Upload accepted";
    verdict.severity = common::Severity::LOW;
    verdict.details["detected_type"] = scan::to_string(detected.type);
    verdict.details["width"] = std::to_string(verdict.width);
    verdict.details["height"] = std::to_string(verdict.height);
    verdict.details["scan_risk"] = common::to_string(analysis.risk_level);
    verdict.details["sanitized_size"] = std::to_string(verdict.sanitized_bytes->size());

    common::Logger::instance().info("[Upload] Accepted | caller={} | file={} | type={} | size={} | sanitized_size={}",
                                    context.caller_id, file.name, scan::to_string(detected.type),
                                    common::formatBytes(file.bytes.size()),
                                    common::formatBytes(verdict.sanitized_bytes->size()));

    emit("file_upload_accepted", common::Severity::LOW, file, context, verdict.details);
    return verdict;
}

std::vector<std::pair<size_t, std::string>> UploadValidationPipeline::extractUrls(std::string_view text) {
    std::vector<std::pair<size_t, std::string>> urls;
    std::string lowered = toLower(text);

    for (const auto& scheme : URL_SCHEMES) {
        size_t pos = 0;
        while ((pos = lowered.find(scheme, pos)) != std::string::npos) {
            size_t end = pos + scheme.size();
            while (end < text.size() && end - pos < MAX_URL_LENGTH &&
                   !isUrlTerminator(static_cast<unsigned char>(text[end]))) {
                ++end;
            }
            urls.emplace_back(pos, std::string(text.substr(pos, end - pos)));
            pos = end;
        }
    }

    std::sort(urls.begin(), urls.end());
    return urls;
}

std::optional<std::string> UploadValidationPipeline::checkUrl(const std::string& url) const {
    std::string lowered = toLower(url);

    if (lowered.rfind("file://", 0) == 0) {
        std::string rest = lowered.substr(7);
        if (rest.empty() || rest[0] == '/') {
            return std::string("Local file reference");
        }
    }

    auto authority = network::parseUrlAuthority(url);
    if (!authority) {
        return std::nullopt;
    }

    if (auto classification = classifier_.classifyUrlHost(url)) {
        if (!classification->allowed_for_outbound) {
            return classification->reason;
        }
        return std::nullopt;
    }

    const std::string& host = authority->host;
    for (const auto& marker : LOCAL_HOST_MARKERS) {
        if (host.find(marker) != std::string::npos) {
            return "Hostname references local or link-local target (" + marker + ")";
        }
    }

    if (looksLikeObfuscatedNumericHost(host)) {
        return std::string("Obfuscated numeric host");
    }

    return std::nullopt;
}

std::optional<SsrfFinding> UploadValidationPipeline::findSsrfVector(std::string_view data) const {
    std::vector<std::pair<size_t, std::string_view>> windows;

    for (const auto& region : image::MetadataReader::findRegions(data)) {
        windows.emplace_back(region.offset, data.substr(region.offset, region.size));
    }
    if (windows.empty()) {
        windows.emplace_back(0, data.substr(0, std::min(data.size(), constants::limits::SSRF_FALLBACK_WINDOW)));
    }

    for (const auto& [base, window] : windows) {
        for (const auto& [offset, url] : extractUrls(window)) {
            auto reason = checkUrl(url);
            if (!reason) continue;

            SsrfFinding finding;
            finding.url = url;
            auto authority = network::parseUrlAuthority(url);
            finding.host = authority ? authority->host : "";
            finding.reason = *reason;
            finding.offset = base + offset;

            common::Logger::instance().warn("[Upload] SSRF vector in metadata | host={} | reason={} | offset={}",
                                            finding.host, finding.reason, finding.offset);
            return finding;
        }
    }
    return std::nullopt;
}

std::optional<std::string> UploadValidationPipeline::inspectMetadata(const image::ImageMetadata& metadata) const {
    if (metadata.field_count > config_.max_metadata_fields) {
        return "Too many metadata fields (" + std::to_string(metadata.field_count) + " > " +
               std::to_string(config_.max_metadata_fields) + ")";
    }

    for (const auto& field : metadata.text_fields) {
        std::string lowered = toLower(field.name + "=" + field.value);
        for (const auto& pattern : SUSPICIOUS_METADATA_PATTERNS) {
            if (lowered.find(pattern) != std::string::npos) {
                return "Suspicious content in metadata field " + field.name + " (" + pattern + ")";
            }
        }
    }
    return std::nullopt;
}

bool UploadValidationPipeline::isAllowedType(scan::ImageType type) const {
    if (type == scan::ImageType::UNKNOWN) return false;
    const std::string name = scan::to_string(type);
    return std::find(config_.allowed_types.begin(), config_.allowed_types.end(), name) != config_.allowed_types.end();
}

std::optional<core::RejectionKind> UploadValidationPipeline::checkDimensions(uint32_t width, uint32_t height,
                                                                            size_t encoded_size,
                                                                            UploadVerdict& verdict) const {
    verdict.details["width"] = std::to_string(width);
    verdict.details["height"] = std::to_string(height);

    const auto max_dimension = static_cast<uint32_t>(std::max(config_.max_image_dimension, 0));
    if (width > max_dimension || height > max_dimension) {
        verdict.details["max_dimension"] = std::to_string(max_dimension);
        return core::RejectionKind::DIMENSION_EXCEEDED;
    }

    if (encoded_size == 0) {
        return core::RejectionKind::INVALID_INPUT;
    }

    double ratio = static_cast<double>(width) * static_cast<double>(height) * 3.0 /
                   static_cast<double>(encoded_size);
    if (ratio > config_.max_compression_ratio) {
        verdict.details["compression_ratio"] = fmt::format("{:.1f}", ratio);
        return core::RejectionKind::DECOMPRESSION_BOMB_SUSPECTED;
    }
    return std::nullopt;
}

UploadVerdict UploadValidationPipeline::reject(UploadVerdict verdict, core::RejectionKind kind,
                                               const UploadFile& file, const CallerContext& context,
                                               std::optional<common::Severity> severity) const {
    verdict.accepted = false;
    verdict.rejection_reason = kind;
    verdict.sanitized_bytes.reset();
    verdict.message = core::RejectionKindHelper::getMessage(kind);
    verdict.severity = severity.value_or(core::RejectionKindHelper::getSeverity(kind));
    verdict.details["code"] = core::RejectionKindHelper::toString(kind);

    common::ErrorContext ctx;
    ctx.component = "Upload";
    ctx.details = verdict.details;
    common::Logger::instance().warn("[Upload] Rejected | caller={} | file={} | {}",
                                    context.caller_id, file.name, common::formatContext(ctx));

    emit(core::RejectionKindHelper::getEventKind(kind), verdict.severity, file, context, verdict.details);
    return verdict;
}

void UploadValidationPipeline::emit(const std::string& kind, common::Severity severity, const UploadFile& file,
                                    const CallerContext& context,
                                    const std::map<std::string, std::string>& details) const {
    if (!sink_) return;

    events::SecurityEvent event;
    event.kind = kind;
    event.caller_id = context.caller_id;
    event.severity = severity;
    event.details = details;
    event.details["file_name"] = file.name;
    event.details["declared_mime"] = file.declared_mime_type;
    event.details["size"] = file.bytes.size();
    event.details["ip"] = context.ip;
    event.details["user_agent"] = context.user_agent;

    if (!sink_->submit(std::move(event))) {
        common::Logger::instance().debug("[Upload] Security event not retained | kind={}", kind);
    }
}

}}
