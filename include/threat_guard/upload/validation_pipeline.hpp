#pragma once

#include "../common/config.hpp"
#include "../common/types.hpp"
#include "../core/error_codes.hpp"
#include "../events/security_event_sink.hpp"
#include "../image/image_codec.hpp"
#include "../image/metadata_reader.hpp"
#include "../network/ip_classifier.hpp"
#include "../scan/content_scanner.hpp"
#include "../scan/signatures.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace threat_guard {
namespace upload {

struct UploadFile {
    std::string name;
    std::string declared_mime_type;
    size_t size = 0;
    common::Bytes bytes;
};

struct CallerContext {
    std::string caller_id;
    std::string ip;
    std::string user_agent;
};

struct UploadVerdict {
    bool accepted = false;
    std::optional<core::RejectionKind> rejection_reason;
    std::optional<common::Bytes> sanitized_bytes;
    std::string message;
    common::Severity severity = common::Severity::LOW;
    scan::ImageType detected_type = scan::ImageType::UNKNOWN;
    uint32_t width = 0;
    uint32_t height = 0;
    std::map<std::string, std::string> details;
};

struct SsrfFinding {
    std::string url;
    std::string host;
    std::string reason;
    size_t offset = 0;
};

// Fail-fast upload validation: size, content threats, SSRF references in
// metadata, true type, decode limits, metadata content, then re-encoding.
class UploadValidationPipeline {
public:
    UploadValidationPipeline(const common::UploadConfig& upload_config,
                             const common::ScannerConfig& scanner_config,
                             std::shared_ptr<const image::ImageCodec> codec,
                             std::shared_ptr<events::SecurityEventSink> sink = nullptr);

    UploadVerdict validate(const UploadFile& file, const CallerContext& context) const;

    std::optional<SsrfFinding> findSsrfVector(std::string_view data) const;
    std::optional<std::string> inspectMetadata(const image::ImageMetadata& metadata) const;

    static std::vector<std::pair<size_t, std::string>> extractUrls(std::string_view text);

private:
    common::UploadConfig config_;
    scan::ContentThreatScanner scanner_;
    network::IPClassifier classifier_;
    std::shared_ptr<const image::ImageCodec> codec_;
    std::shared_ptr<events::SecurityEventSink> sink_;

    bool isAllowedType(scan::ImageType type) const;
    std::optional<std::string> checkUrl(const std::string& url) const;
    std::optional<core::RejectionKind> checkDimensions(uint32_t width, uint32_t height, size_t encoded_size,
                                                       UploadVerdict& verdict) const;

    UploadVerdict reject(UploadVerdict verdict, core::RejectionKind kind, const UploadFile& file,
                         const CallerContext& context, std::optional<common::Severity> severity = std::nullopt) const;
    void emit(const std::string& kind, common::Severity severity, const UploadFile& file,
              const CallerContext& context, const std::map<std::string, std::string>& details) const;
};

}}
