#include "threat_guard/image/image_codec.hpp"
#include "threat_guard/common/logger.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <atomic>
#include <future>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <vector>

namespace threat_guard {
namespace image {

namespace {

class OpenCvDecodedImage : public DecodedImage {
public:
    explicit OpenCvDecodedImage(cv::Mat pixels) : pixels_(std::move(pixels)) {}

    uint32_t width() const override { return static_cast<uint32_t>(pixels_.cols); }
    uint32_t height() const override { return static_cast<uint32_t>(pixels_.rows); }

    const cv::Mat& pixels() const { return pixels_; }

private:
    cv::Mat pixels_;
};

cv::Mat applyOrientation(const cv::Mat& input, int orientation) {
    cv::Mat output;
    switch (orientation) {
        case 2:
            cv::flip(input, output, 1);
            break;
        case 3:
            cv::rotate(input, output, cv::ROTATE_180);
            break;
        case 4:
            cv::flip(input, output, 0);
            break;
        case 5:
            cv::transpose(input, output);
            break;
        case 6:
            cv::rotate(input, output, cv::ROTATE_90_CLOCKWISE);
            break;
        case 7: {
            cv::Mat transposed;
            cv::transpose(input, transposed);
            cv::flip(transposed, output, -1);
            break;
        }
        case 8:
            cv::rotate(input, output, cv::ROTATE_90_COUNTERCLOCKWISE);
            break;
        default:
            output = input;
            break;
    }
    return output;
}

// Live decode workers, including ones a caller stopped waiting for.
std::atomic<size_t> in_flight_decodes{0};

bool reserveDecodeSlot(size_t limit) {
    size_t current = in_flight_decodes.load();
    while (current < limit) {
        if (in_flight_decodes.compare_exchange_weak(current, current + 1)) {
            return true;
        }
    }
    return false;
}

}

std::unique_ptr<DecodedImage> OpenCvImageCodec::decode(std::string_view bytes) const {
    if (bytes.empty()) {
        throw std::invalid_argument("empty image buffer");
    }

    cv::Mat buffer(1, static_cast<int>(bytes.size()), CV_8UC1, const_cast<char*>(bytes.data()));
    cv::Mat pixels = cv::imdecode(buffer, cv::IMREAD_COLOR | cv::IMREAD_IGNORE_ORIENTATION);
    if (pixels.empty()) {
        throw std::runtime_error("image decoder rejected buffer");
    }

    return std::make_unique<OpenCvDecodedImage>(std::move(pixels));
}

common::Bytes OpenCvImageCodec::encodeSanitized(const DecodedImage& image, const SanitizeOptions& options) const {
    const auto* decoded = dynamic_cast<const OpenCvDecodedImage*>(&image);
    if (decoded == nullptr) {
        throw std::invalid_argument("image was not decoded by the OpenCV codec");
    }

    cv::Mat oriented = applyOrientation(decoded->pixels(), options.orientation.value_or(1));

    int longest = std::max(oriented.cols, oriented.rows);
    cv::Mat bounded = oriented;
    if (options.max_dimension > 0 && longest > options.max_dimension) {
        double scale = static_cast<double>(options.max_dimension) / longest;
        int width = std::max(1, static_cast<int>(oriented.cols * scale));
        int height = std::max(1, static_cast<int>(oriented.rows * scale));
        cv::resize(oriented, bounded, cv::Size(width, height), 0, 0, cv::INTER_AREA);
    }

    std::vector<int> params = {
        cv::IMWRITE_JPEG_QUALITY, std::clamp(options.jpeg_quality, 1, 100),
        cv::IMWRITE_JPEG_PROGRESSIVE, 1
    };

    std::vector<uchar> encoded;
    if (!cv::imencode(".jpg", bounded, encoded, params)) {
        throw std::runtime_error("JPEG encoding failed");
    }

    return common::Bytes(encoded.begin(), encoded.end());
}

size_t decodesInFlight() {
    return in_flight_decodes.load();
}

DecodeOutcome decodeWithTimeout(std::shared_ptr<const ImageCodec> codec,
                                std::shared_ptr<const common::Bytes> bytes,
                                std::chrono::milliseconds timeout,
                                size_t max_in_flight) {
    DecodeOutcome outcome;

    if (!reserveDecodeSlot(std::max<size_t>(max_in_flight, 1))) {
        common::Logger::instance().warn("[Codec] Decode refused, too many decodes in flight | codec={} | limit={}",
                                        codec->name(), max_in_flight);
        outcome.status = DecodeStatus::BUSY;
        outcome.error = "too many decodes in flight";
        return outcome;
    }

    using DecodeTask = std::packaged_task<std::unique_ptr<DecodedImage>()>;
    auto task = std::make_shared<DecodeTask>([codec, bytes]() {
        return codec->decode(common::asView(*bytes));
    });
    auto decode_future = task->get_future();

    try {
        std::thread([task]() {
            (*task)();
            in_flight_decodes--;
        }).detach();
    } catch (const std::system_error& e) {
        in_flight_decodes--;
        outcome.status = DecodeStatus::FAILED;
        outcome.error = std::string("decoder thread unavailable: ") + e.what();
        return outcome;
    }

    if (decode_future.wait_for(timeout) == std::future_status::timeout) {
        common::Logger::instance().warn("[Codec] Decode timeout | codec={} | timeout_ms={} | bytes={}",
                                        codec->name(), timeout.count(), bytes->size());
        outcome.status = DecodeStatus::TIMED_OUT;
        outcome.error = "decode timed out";
        return outcome;
    }

    try {
        outcome.image = decode_future.get();
    } catch (const cv::Exception& e) {
        outcome.error = e.what();
    } catch (const std::exception& e) {
        outcome.error = e.what();
    }

    if (!outcome.image) {
        if (outcome.error.empty()) outcome.error = "decoder returned no image";
        outcome.status = DecodeStatus::FAILED;
        common::Logger::instance().debug("[Codec] Decode failed | codec={} | error={}", codec->name(), outcome.error);
        return outcome;
    }

    outcome.status = DecodeStatus::OK;
    return outcome;
}

}}
