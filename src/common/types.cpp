#include "threat_guard/common/types.hpp"
#include <limits>

namespace threat_guard {
namespace common {

Instant systemNow() {
    return std::chrono::time_point_cast<std::chrono::milliseconds>(std::chrono::system_clock::now());
}

int64_t toEpochMillis(Instant instant) {
    return instant.time_since_epoch().count();
}

Instant fromEpochMillis(int64_t millis) {
    return Instant(std::chrono::milliseconds(millis));
}

int64_t saturatingAdd(int64_t a, int64_t b) {
    constexpr int64_t max = std::numeric_limits<int64_t>::max();
    constexpr int64_t min = std::numeric_limits<int64_t>::min();
    if (b > 0 && a > max - b) return max;
    if (b < 0 && a < min - b) return min;
    return a + b;
}

int64_t saturatingMul(int64_t a, int64_t b) {
    constexpr int64_t max = std::numeric_limits<int64_t>::max();
    if (a == 0 || b == 0) return 0;
    if (a < 0 || b < 0) return 0;
    if (a > max / b) return max;
    return a * b;
}

std::string to_string(RiskLevel level) {
    switch (level) {
        case RiskLevel::LOW: return "low";
        case RiskLevel::MEDIUM: return "medium";
        case RiskLevel::HIGH: return "high";
        case RiskLevel::CRITICAL: return "critical";
        default: return "unknown";
    }
}

int rank(RiskLevel level) {
    return static_cast<int>(level);
}

}}
