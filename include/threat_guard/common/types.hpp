#pragma once

#include "error_framework.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace threat_guard {
namespace common {

enum class RiskLevel {
    LOW,
    MEDIUM,
    HIGH,
    CRITICAL
};

using Severity = RiskLevel;

using Instant = std::chrono::time_point<std::chrono::system_clock, std::chrono::milliseconds>;
using TimeSource = std::function<Instant()>;

Instant systemNow();

int64_t toEpochMillis(Instant instant);
Instant fromEpochMillis(int64_t millis);

// Saturate at the int64 range instead of wrapping. saturatingMul clamps
// negative operands to zero.
int64_t saturatingAdd(int64_t a, int64_t b);
int64_t saturatingMul(int64_t a, int64_t b);

using Bytes = std::vector<uint8_t>;

inline std::string_view asView(const Bytes& bytes) {
    return std::string_view(reinterpret_cast<const char*>(bytes.data()), bytes.size());
}

std::string to_string(RiskLevel level);
int rank(RiskLevel level);

}}
