#pragma once

#include "../common/constants.hpp"
#include "../common/types.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace threat_guard {
namespace image {

class DecodedImage {
public:
    virtual ~DecodedImage() = default;
    virtual uint32_t width() const = 0;
    virtual uint32_t height() const = 0;
};

struct SanitizeOptions {
    int max_dimension = 1024;
    int jpeg_quality = 85;
    std::optional<int> orientation;
};

// Image decoding capability used by the upload pipeline. Implementations
// signal failure by throwing or by returning null from decode.
class ImageCodec {
public:
    virtual ~ImageCodec() = default;

    virtual std::unique_ptr<DecodedImage> decode(std::string_view bytes) const = 0;

    // Re-encodes pixels only: orientation applied, longest side bounded,
    // no metadata carried over.
    virtual common::Bytes encodeSanitized(const DecodedImage& image, const SanitizeOptions& options) const = 0;

    virtual std::string name() const = 0;
};

class OpenCvImageCodec : public ImageCodec {
public:
    std::unique_ptr<DecodedImage> decode(std::string_view bytes) const override;
    common::Bytes encodeSanitized(const DecodedImage& image, const SanitizeOptions& options) const override;
    std::string name() const override { return "opencv"; }
};

enum class DecodeStatus {
    OK,
    FAILED,
    TIMED_OUT,
    BUSY
};

struct DecodeOutcome {
    DecodeStatus status = DecodeStatus::FAILED;
    std::unique_ptr<DecodedImage> image;
    std::string error;
};

// Runs codec->decode on a detached worker so a stalled decoder cannot hold
// the caller past the timeout. The worker keeps its own references to the
// codec and the bytes. At most max_in_flight workers exist process-wide,
// counting ones abandoned by a timeout; beyond that the call returns BUSY.
DecodeOutcome decodeWithTimeout(std::shared_ptr<const ImageCodec> codec,
                                std::shared_ptr<const common::Bytes> bytes,
                                std::chrono::milliseconds timeout,
                                size_t max_in_flight = constants::limits::DEFAULT_MAX_CONCURRENT_DECODES);

size_t decodesInFlight();

}}
