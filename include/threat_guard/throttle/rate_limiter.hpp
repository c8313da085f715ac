#pragma once

#include "keyed_store.hpp"
#include "../common/config.hpp"
#include "../common/types.hpp"
#include <cstdint>
#include <deque>
#include <memory>
#include <string>

namespace threat_guard {
namespace throttle {

struct RateLimitWindow {
    std::deque<int64_t> timestamps;  // epoch ms, ascending
    int64_t window_ms = 0;
};

struct RateLimitDecision {
    bool allowed = false;
    int64_t remaining = 0;
    common::Instant reset_at{};
    int64_t limit = 0;
};

struct RateLimiterStats {
    size_t total_keys = 0;
    size_t authenticated_keys = 0;
    size_t anonymous_keys = 0;
    double average_requests = 0.0;
};

using RateLimitStore = KeyedStore<RateLimitWindow>;

class SlidingWindowRateLimiter {
public:
    explicit SlidingWindowRateLimiter(std::shared_ptr<RateLimitStore> store = nullptr,
                                      common::TimeSource now = common::systemNow);

    RateLimitDecision check(const std::string& key, int64_t limit, int64_t window_ms);

    // Drops windows with no timestamp left inside their window.
    size_t cleanupExpired();

    RateLimiterStats stats() const;
    void reset();

private:
    std::shared_ptr<RateLimitStore> store_;
    common::TimeSource now_;
};

struct RouteLimit {
    int64_t limit = 0;
    int64_t window_ms = 0;
};

// Maps a route to its request budget.
class RateLimitPolicy {
public:
    explicit RateLimitPolicy(const common::RateLimitConfig& config = common::RateLimitConfig{});

    RouteLimit resolve(const std::string& route, bool authenticated) const;

    static std::string makeKey(const std::string& scope, const std::string& subject,
                               const std::string& route);

private:
    common::RateLimitConfig config_;
};

}}
