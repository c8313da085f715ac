#include <gtest/gtest.h>
#include "threat_guard/upload/validation_pipeline.hpp"
#include "test_support.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <thread>

using namespace threat_guard;
using core::RejectionKind;
using test_util::CapturingWriter;

namespace {

class FakeDecodedImage : public image::DecodedImage {
public:
    FakeDecodedImage(uint32_t width, uint32_t height) : width_(width), height_(height) {}
    uint32_t width() const override { return width_; }
    uint32_t height() const override { return height_; }

private:
    uint32_t width_;
    uint32_t height_;
};

class FakeCodec : public image::ImageCodec {
public:
    enum class Behavior { DECODE, THROW, EMPTY, STALL, ENCODE_THROWS };

    FakeCodec(uint32_t width, uint32_t height, Behavior behavior = Behavior::DECODE)
        : width_(width), height_(height), behavior_(behavior) {}

    std::unique_ptr<image::DecodedImage> decode(std::string_view) const override {
        switch (behavior_) {
            case Behavior::THROW:
                throw std::runtime_error("corrupt image data");
            case Behavior::EMPTY:
                return nullptr;
            case Behavior::STALL:
                std::this_thread::sleep_for(std::chrono::milliseconds(300));
                break;
            default:
                break;
        }
        return std::make_unique<FakeDecodedImage>(width_, height_);
    }

    common::Bytes encodeSanitized(const image::DecodedImage&, const image::SanitizeOptions& options) const override {
        if (behavior_ == Behavior::ENCODE_THROWS) {
            throw std::runtime_error("encoder failure");
        }
        std::lock_guard<std::mutex> lock(mutex_);
        last_options_ = options;
        return test_util::bytesOf("SANITIZED-JPEG");
    }

    std::string name() const override { return "fake"; }

    std::optional<image::SanitizeOptions> lastOptions() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_options_;
    }

private:
    uint32_t width_;
    uint32_t height_;
    Behavior behavior_;
    mutable std::mutex mutex_;
    mutable std::optional<image::SanitizeOptions> last_options_;
};

upload::UploadFile makeFile(const common::Bytes& bytes, const std::string& mime = "image/png") {
    upload::UploadFile file;
    file.name = "avatar.png";
    file.declared_mime_type = mime;
    file.size = bytes.size();
    file.bytes = bytes;
    return file;
}

// 800x600 flat image with a noisy block so the encoded size keeps the
// pixel-to-byte ratio within bounds.
common::Bytes encodeNoisyPng(uint64_t seed) {
    cv::Mat pixels(600, 800, CV_8UC3, cv::Scalar(40, 120, 200));
    cv::RNG rng(seed);
    cv::Mat block = pixels(cv::Rect(0, 0, 128, 128));
    rng.fill(block, cv::RNG::UNIFORM, 0, 256);

    std::vector<uchar> encoded;
    if (!cv::imencode(".png", pixels, encoded)) return {};
    return common::Bytes(encoded.begin(), encoded.end());
}

void insertAfterIhdr(common::Bytes& png, const std::string& type, const common::Bytes& payload) {
    common::Bytes chunk;
    test_util::appendPngChunk(chunk, type, payload);
    png.insert(png.begin() + 33, chunk.begin(), chunk.end());
}

}

class ValidationPipelineTest : public ::testing::Test {
protected:
    test_util::ManualClock clock;
    std::shared_ptr<CapturingWriter> writer = std::make_shared<CapturingWriter>();
    std::shared_ptr<events::SecurityEventSink> sink =
        std::make_shared<events::SecurityEventSink>(writer, common::EventsConfig{}, clock.source());
    common::UploadConfig upload_config;
    common::ScannerConfig scanner_config;
    upload::CallerContext caller{"user-42", "203.0.113.9", "test-agent"};

    upload::UploadVerdict run(const common::Bytes& bytes, std::shared_ptr<const image::ImageCodec> codec,
                              const std::string& mime = "image/png") {
        upload::UploadValidationPipeline pipeline(upload_config, scanner_config, std::move(codec), sink);
        return pipeline.validate(makeFile(bytes, mime), caller);
    }

    upload::UploadVerdict runWithFake(const common::Bytes& bytes, uint32_t width = 16, uint32_t height = 16) {
        return run(bytes, std::make_shared<FakeCodec>(width, height));
    }

    std::string lastEventKind() const {
        auto delivered = writer->events();
        return delivered.empty() ? std::string() : delivered.back().kind;
    }
};

TEST_F(ValidationPipelineTest, AcceptsCleanImage) {
    auto codec = std::make_shared<FakeCodec>(16, 16);
    auto verdict = run(test_util::makePngContainer(16, 16), codec);

    ASSERT_TRUE(verdict.accepted) << verdict.message;
    EXPECT_FALSE(verdict.rejection_reason.has_value());
    ASSERT_TRUE(verdict.sanitized_bytes.has_value());
    EXPECT_EQ(*verdict.sanitized_bytes, test_util::bytesOf("SANITIZED-JPEG"));
    EXPECT_EQ(verdict.detected_type, scan::ImageType::PNG);
    EXPECT_EQ(verdict.width, 16u);
    EXPECT_EQ(verdict.height, 16u);
    EXPECT_EQ(verdict.severity, common::Severity::LOW);

    auto options = codec->lastOptions();
    ASSERT_TRUE(options.has_value());
    EXPECT_EQ(options->max_dimension, upload_config.output_max_dimension);
    EXPECT_EQ(options->jpeg_quality, upload_config.output_jpeg_quality);

    auto delivered = writer->events();
    ASSERT_EQ(delivered.size(), 1u);
    EXPECT_EQ(delivered[0].kind, "file_upload_accepted");
    EXPECT_EQ(delivered[0].caller_id, "user-42");
    EXPECT_EQ(delivered[0].details["ip"], "203.0.113.9");
    EXPECT_EQ(delivered[0].details["file_name"], "avatar.png");
}

TEST_F(ValidationPipelineTest, PassesExifOrientationToEncoder) {
    auto exif = test_util::makeExifPayload({{0x010F, "Canon"}}, 6);
    auto jpeg = test_util::makeJpegContainer(16, 16, {{0xE1, exif}});
    auto codec = std::make_shared<FakeCodec>(16, 16);

    auto verdict = run(jpeg, codec, "image/jpeg");
    ASSERT_TRUE(verdict.accepted) << verdict.message;
    EXPECT_EQ(verdict.detected_type, scan::ImageType::JPEG);

    auto options = codec->lastOptions();
    ASSERT_TRUE(options.has_value());
    ASSERT_TRUE(options->orientation.has_value());
    EXPECT_EQ(*options->orientation, 6);
}

TEST_F(ValidationPipelineTest, DeclaredTypeMismatchIsRecordedOnly) {
    auto verdict = run(test_util::makePngContainer(16, 16), std::make_shared<FakeCodec>(16, 16), "image/jpeg");

    ASSERT_TRUE(verdict.accepted);
    EXPECT_EQ(verdict.details["declared_mime_mismatch"], "image/jpeg");
}

TEST_F(ValidationPipelineTest, RejectsEmptyUpload) {
    auto verdict = runWithFake({});

    EXPECT_FALSE(verdict.accepted);
    EXPECT_EQ(verdict.rejection_reason, RejectionKind::INVALID_INPUT);
    EXPECT_EQ(verdict.details["code"], "INVALID_INPUT");
    EXPECT_FALSE(verdict.sanitized_bytes.has_value());
}

TEST_F(ValidationPipelineTest, RejectsOversizedUpload) {
    upload_config.max_file_size_bytes = 32;
    auto verdict = runWithFake(test_util::makePngContainer(16, 16));

    EXPECT_EQ(verdict.rejection_reason, RejectionKind::SIZE_EXCEEDED);
    EXPECT_EQ(verdict.details["limit"], "32");
    EXPECT_EQ(lastEventKind(), "file_size_exceeded");
}

TEST_F(ValidationPipelineTest, DeclaredSizeCountsTowardLimit) {
    upload_config.max_file_size_bytes = 1024;
    upload::UploadValidationPipeline pipeline(upload_config, scanner_config,
                                              std::make_shared<FakeCodec>(16, 16), sink);
    auto file = makeFile(test_util::makePngContainer(16, 16));
    file.size = 4096;

    auto verdict = pipeline.validate(file, caller);
    EXPECT_EQ(verdict.rejection_reason, RejectionKind::SIZE_EXCEEDED);
}

TEST_F(ValidationPipelineTest, RejectsScriptContent) {
    auto verdict = runWithFake(test_util::bytesOf("<script>alert(1)</script>"));

    EXPECT_EQ(verdict.rejection_reason, RejectionKind::CONTENT_THREAT_DETECTED);
    EXPECT_EQ(verdict.severity, common::Severity::CRITICAL);
    EXPECT_EQ(verdict.details["risk"], common::to_string(common::RiskLevel::CRITICAL));
    EXPECT_NE(verdict.details["evidence"].find("script_tag"), std::string::npos);
    EXPECT_EQ(lastEventKind(), "polyglot_file_detected");
}

TEST_F(ValidationPipelineTest, RejectsCloudMetadataUrlInTextChunk) {
    auto png = test_util::makePngContainer(16, 16, {
        {"tEXt", test_util::pngText("Comment", "see http://169.254.169.254/latest/meta-data")}
    });
    auto verdict = runWithFake(png);

    EXPECT_EQ(verdict.rejection_reason, RejectionKind::SSRF_VECTOR_DETECTED);
    EXPECT_EQ(verdict.severity, common::Severity::CRITICAL);
    EXPECT_EQ(verdict.details["host"], "169.254.169.254");
    EXPECT_EQ(lastEventKind(), "ssrf_attempt");
}

TEST_F(ValidationPipelineTest, RejectsLocalHostReferences) {
    for (const char* text : {"file:///etc/passwd", "http://localhost:8080/admin", "http://2130706433/",
                             "https://[::1]/internal"}) {
        auto png = test_util::makePngContainer(16, 16, {{"tEXt", test_util::pngText("Source", text)}});
        auto verdict = runWithFake(png);
        EXPECT_EQ(verdict.rejection_reason, RejectionKind::SSRF_VECTOR_DETECTED) << text;
    }
}

TEST_F(ValidationPipelineTest, AllowsPublicUrlsInMetadata) {
    auto png = test_util::makePngContainer(16, 16, {
        {"tEXt", test_util::pngText("Source", "https://example.com/about and http://8.8.8.8/")}
    });
    auto verdict = runWithFake(png);
    EXPECT_TRUE(verdict.accepted) << verdict.message;
}

TEST_F(ValidationPipelineTest, RejectsNonImage) {
    auto verdict = runWithFake(test_util::bytesOf("hello, this is definitely not an image"));

    EXPECT_EQ(verdict.rejection_reason, RejectionKind::UNSUPPORTED_OR_SPOOFED_TYPE);
    EXPECT_EQ(verdict.details["detected_type"], "unknown");
    EXPECT_EQ(lastEventKind(), "invalid_file_type");
}

TEST_F(ValidationPipelineTest, RejectsTypeOutsideAllowList) {
    upload_config.allowed_types = {"png"};
    auto verdict = run(test_util::makeJpegContainer(16, 16), std::make_shared<FakeCodec>(16, 16), "image/jpeg");

    EXPECT_EQ(verdict.rejection_reason, RejectionKind::UNSUPPORTED_OR_SPOOFED_TYPE);
    EXPECT_EQ(verdict.detected_type, scan::ImageType::JPEG);
}

TEST_F(ValidationPipelineTest, RejectsOversizedDimensionsFromHeader) {
    auto codec = std::make_shared<FakeCodec>(16, 16);
    auto verdict = run(test_util::makePngContainer(5000, 10), codec);

    EXPECT_EQ(verdict.rejection_reason, RejectionKind::DIMENSION_EXCEEDED);
    EXPECT_EQ(verdict.details["stage"], "header");
    EXPECT_EQ(verdict.details["max_dimension"], "4096");
    EXPECT_FALSE(codec->lastOptions().has_value());
}

TEST_F(ValidationPipelineTest, RejectsDecompressionBombFromHeader) {
    auto verdict = runWithFake(test_util::makePngContainer(1000, 1000));

    EXPECT_EQ(verdict.rejection_reason, RejectionKind::DECOMPRESSION_BOMB_SUSPECTED);
    EXPECT_EQ(verdict.details["stage"], "header");
    EXPECT_EQ(lastEventKind(), "decompression_bomb");
}

TEST_F(ValidationPipelineTest, RechecksDimensionsAfterDecode) {
    auto verdict = runWithFake(test_util::makePngContainer(16, 16), 4000, 4000);

    EXPECT_EQ(verdict.rejection_reason, RejectionKind::DECOMPRESSION_BOMB_SUSPECTED);
    EXPECT_EQ(verdict.details["stage"], "decode");
    EXPECT_EQ(verdict.width, 4000u);
}

TEST_F(ValidationPipelineTest, RejectsSuspiciousMetadataText) {
    auto png = test_util::makePngContainer(16, 16, {
        {"tEXt", test_util::pngText("Description", "x onerror=alert(1)")}
    });
    auto verdict = runWithFake(png);

    EXPECT_EQ(verdict.rejection_reason, RejectionKind::SUSPICIOUS_METADATA);
    EXPECT_NE(verdict.details["reason"].find("onerror="), std::string::npos);
    EXPECT_EQ(lastEventKind(), "malicious_metadata");
}

TEST_F(ValidationPipelineTest, RejectsTooManyMetadataFields) {
    upload_config.max_metadata_fields = 2;
    auto png = test_util::makePngContainer(16, 16, {
        {"tEXt", test_util::pngText("A", "1")},
        {"tEXt", test_util::pngText("B", "2")},
        {"tEXt", test_util::pngText("C", "3")}
    });
    auto verdict = runWithFake(png);

    EXPECT_EQ(verdict.rejection_reason, RejectionKind::SUSPICIOUS_METADATA);
    EXPECT_EQ(verdict.details["field_count"], "3");
}

TEST_F(ValidationPipelineTest, DecodeFailureIsInternalError) {
    auto verdict = run(test_util::makePngContainer(16, 16),
                       std::make_shared<FakeCodec>(16, 16, FakeCodec::Behavior::THROW));

    EXPECT_EQ(verdict.rejection_reason, RejectionKind::INTERNAL_ERROR);
    EXPECT_EQ(verdict.details["error"], "corrupt image data");
    EXPECT_EQ(verdict.details["timed_out"], "false");
    EXPECT_EQ(lastEventKind(), "content_analysis_failed");

    auto empty = run(test_util::makePngContainer(16, 16),
                     std::make_shared<FakeCodec>(16, 16, FakeCodec::Behavior::EMPTY));
    EXPECT_EQ(empty.rejection_reason, RejectionKind::INTERNAL_ERROR);
}

TEST_F(ValidationPipelineTest, DecodeTimeoutIsInternalError) {
    upload_config.decode_timeout_ms = 20;
    auto verdict = run(test_util::makePngContainer(16, 16),
                       std::make_shared<FakeCodec>(16, 16, FakeCodec::Behavior::STALL));

    EXPECT_EQ(verdict.rejection_reason, RejectionKind::INTERNAL_ERROR);
    EXPECT_EQ(verdict.details["timed_out"], "true");
}

bool waitForIdleDecoders() {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (image::decodesInFlight() > 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return image::decodesInFlight() == 0;
}

TEST(DecodeWithTimeoutTest, AbandonedWorkersCountTowardLimit) {
    ASSERT_TRUE(waitForIdleDecoders());
    auto bytes = std::make_shared<const common::Bytes>(test_util::makePngContainer(16, 16));
    auto stalling = std::make_shared<FakeCodec>(16, 16, FakeCodec::Behavior::STALL);
    auto working = std::make_shared<FakeCodec>(16, 16);

    auto first = image::decodeWithTimeout(stalling, bytes, std::chrono::milliseconds(20), 1);
    EXPECT_EQ(first.status, image::DecodeStatus::TIMED_OUT);

    auto refused = image::decodeWithTimeout(working, bytes, std::chrono::milliseconds(1000), 1);
    EXPECT_EQ(refused.status, image::DecodeStatus::BUSY);
    EXPECT_FALSE(refused.image);

    ASSERT_TRUE(waitForIdleDecoders());
    auto recovered = image::decodeWithTimeout(working, bytes, std::chrono::milliseconds(1000), 1);
    EXPECT_EQ(recovered.status, image::DecodeStatus::OK);
    ASSERT_TRUE(recovered.image);
    EXPECT_EQ(recovered.image->width(), 16u);
}

TEST_F(ValidationPipelineTest, DecodeRefusedWhileWorkersBusy) {
    ASSERT_TRUE(waitForIdleDecoders());
    upload_config.decode_timeout_ms = 20;
    upload_config.max_concurrent_decodes = 1;

    auto stalled = run(test_util::makePngContainer(16, 16),
                       std::make_shared<FakeCodec>(16, 16, FakeCodec::Behavior::STALL));
    EXPECT_EQ(stalled.details["timed_out"], "true");

    auto verdict = run(test_util::makePngContainer(16, 16), std::make_shared<FakeCodec>(16, 16));
    EXPECT_EQ(verdict.rejection_reason, RejectionKind::INTERNAL_ERROR);
    EXPECT_EQ(verdict.details["busy"], "true");
    EXPECT_EQ(verdict.details["timed_out"], "false");

    EXPECT_TRUE(waitForIdleDecoders());
}

TEST_F(ValidationPipelineTest, EncodeFailureIsInternalError) {
    auto verdict = run(test_util::makePngContainer(16, 16),
                       std::make_shared<FakeCodec>(16, 16, FakeCodec::Behavior::ENCODE_THROWS));

    EXPECT_EQ(verdict.rejection_reason, RejectionKind::INTERNAL_ERROR);
    EXPECT_FALSE(verdict.sanitized_bytes.has_value());
}

TEST_F(ValidationPipelineTest, MissingCodecIsInternalError) {
    auto verdict = run(test_util::makePngContainer(16, 16), nullptr);

    EXPECT_EQ(verdict.rejection_reason, RejectionKind::INTERNAL_ERROR);
    EXPECT_EQ(verdict.details["error"], "no image codec configured");
}

TEST_F(ValidationPipelineTest, WorksWithoutEventSink) {
    upload::UploadValidationPipeline pipeline(upload_config, scanner_config,
                                              std::make_shared<FakeCodec>(16, 16));
    auto verdict = pipeline.validate(makeFile(test_util::bytesOf("<script>x</script>")), caller);

    EXPECT_EQ(verdict.rejection_reason, RejectionKind::CONTENT_THREAT_DETECTED);
    EXPECT_TRUE(writer->events().empty());
}

TEST(UrlExtractionTest, FindsSchemesInOrder) {
    auto urls = upload::UploadValidationPipeline::extractUrls(
        "a FTP://files.example/x then \"http://10.0.0.1/y\" and gopher://h");

    ASSERT_EQ(urls.size(), 3u);
    EXPECT_EQ(urls[0].second, "FTP://files.example/x");
    EXPECT_EQ(urls[1].second, "http://10.0.0.1/y");
    EXPECT_EQ(urls[2].second, "gopher://h");
    EXPECT_LT(urls[0].first, urls[1].first);
}

TEST_F(ValidationPipelineTest, OpenCvRoundTripStripsMetadata) {
    auto codec = std::make_shared<image::OpenCvImageCodec>();
    scan::ContentThreatScanner scanner(scanner_config);

    common::Bytes png;
    for (uint64_t seed = 1; seed <= 32 && png.empty(); ++seed) {
        auto candidate = encodeNoisyPng(seed);
        insertAfterIhdr(candidate, "tEXt", test_util::pngText("Author", "UniqueAuthorMarker"));
        auto analysis = scanner.analyze(common::asView(candidate));
        if (analysis.risk_level != common::RiskLevel::HIGH && analysis.risk_level != common::RiskLevel::CRITICAL) {
            png = std::move(candidate);
        }
    }
    ASSERT_FALSE(png.empty());

    auto verdict = run(png, codec);
    ASSERT_TRUE(verdict.accepted) << verdict.message << " " << verdict.details["code"];
    EXPECT_EQ(verdict.width, 800u);
    EXPECT_EQ(verdict.height, 600u);

    ASSERT_TRUE(verdict.sanitized_bytes.has_value());
    const auto& output = *verdict.sanitized_bytes;
    ASSERT_GE(output.size(), 3u);
    EXPECT_EQ(output[0], 0xFF);
    EXPECT_EQ(output[1], 0xD8);
    EXPECT_EQ(output[2], 0xFF);
    EXPECT_EQ(common::asView(output).find("UniqueAuthorMarker"), std::string_view::npos);

    cv::Mat reread = cv::imdecode(cv::Mat(1, static_cast<int>(output.size()), CV_8UC1,
                                          const_cast<uint8_t*>(output.data())), cv::IMREAD_COLOR);
    ASSERT_FALSE(reread.empty());
    EXPECT_EQ(reread.cols, 800);
    EXPECT_EQ(reread.rows, 600);
}

TEST_F(ValidationPipelineTest, OpenCvPipelineRejectsGifScriptPolyglot) {
    auto verdict = run(test_util::bytesOf("GIF89a<script>alert(1)</script>"),
                       std::make_shared<image::OpenCvImageCodec>(), "image/gif");

    EXPECT_EQ(verdict.rejection_reason, RejectionKind::CONTENT_THREAT_DETECTED);
    EXPECT_EQ(verdict.severity, common::Severity::CRITICAL);
}
