#include "threat_guard/throttle/rate_limiter.hpp"
#include "threat_guard/common/logger.hpp"
#include <algorithm>

namespace threat_guard {
namespace throttle {

namespace {

void prune(RateLimitWindow& window, int64_t now_ms) {
    int64_t window_start = common::saturatingAdd(now_ms, -window.window_ms);
    while (!window.timestamps.empty() && window.timestamps.front() <= window_start) {
        window.timestamps.pop_front();
    }
}

// End of the fixed window containing now_ms. Used when there is no
// stored timestamp to anchor the reset instant on.
int64_t alignedWindowEnd(int64_t now_ms, int64_t window_ms) {
    int64_t offset = now_ms % window_ms;
    if (offset < 0) offset += window_ms;
    return common::saturatingAdd(now_ms - offset, window_ms);
}

bool startsWith(const std::string& text, const char* prefix) {
    return text.rfind(prefix, 0) == 0;
}

}

SlidingWindowRateLimiter::SlidingWindowRateLimiter(std::shared_ptr<RateLimitStore> store,
                                                   common::TimeSource now)
    : store_(std::move(store)), now_(std::move(now)) {
    if (!store_) {
        store_ = std::make_shared<ShardedKeyedStore<RateLimitWindow>>();
    }
}

RateLimitDecision SlidingWindowRateLimiter::check(const std::string& key, int64_t limit,
                                                  int64_t window_ms) {
    const int64_t now_ms = common::toEpochMillis(now_());
    window_ms = std::max<int64_t>(window_ms, 1);

    RateLimitDecision decision;
    decision.limit = std::max<int64_t>(limit, 0);

    store_->update(key, [&](RateLimitWindow& window, bool existed) {
        window.window_ms = window_ms;
        prune(window, now_ms);

        int64_t count = static_cast<int64_t>(window.timestamps.size());
        if (limit <= 0 || count >= limit) {
            decision.allowed = false;
            decision.remaining = 0;
            decision.reset_at = common::fromEpochMillis(
                window.timestamps.empty() ? alignedWindowEnd(now_ms, window_ms)
                                          : common::saturatingAdd(window.timestamps.front(), window_ms));
            return existed && !window.timestamps.empty();
        }

        // Keep the list ascending even if the clock steps backwards.
        int64_t stamp = window.timestamps.empty() ? now_ms : std::max(now_ms, window.timestamps.back());
        window.timestamps.push_back(stamp);

        decision.allowed = true;
        decision.remaining = limit - (count + 1);
        decision.reset_at = common::fromEpochMillis(
            common::saturatingAdd(window.timestamps.front(), window_ms));
        return true;
    });

    if (!decision.allowed) {
        common::Logger::instance().debug("[RateLimiter] Request rejected | key={} | limit={} | reset_ms={}",
                                         key, limit, common::toEpochMillis(decision.reset_at));
    }
    return decision;
}

size_t SlidingWindowRateLimiter::cleanupExpired() {
    const int64_t now_ms = common::toEpochMillis(now_());
    size_t removed = store_->eraseIf([now_ms](const std::string&, const RateLimitWindow& window) {
        if (window.timestamps.empty()) {
            return true;
        }
        return window.timestamps.back() <= common::saturatingAdd(now_ms, -window.window_ms);
    });

    if (removed > 0) {
        common::Logger::instance().debug("[RateLimiter] Cleanup completed | removed={}", removed);
    }
    return removed;
}

RateLimiterStats SlidingWindowRateLimiter::stats() const {
    RateLimiterStats stats;
    size_t total_requests = 0;

    store_->forEach([&](const std::string& key, const RateLimitWindow& window) {
        stats.total_keys++;
        if (startsWith(key, "auth:") || startsWith(key, "user:")) {
            stats.authenticated_keys++;
        } else {
            stats.anonymous_keys++;
        }
        total_requests += window.timestamps.size();
    });

    if (stats.total_keys > 0) {
        stats.average_requests = static_cast<double>(total_requests) / static_cast<double>(stats.total_keys);
    }
    return stats;
}

void SlidingWindowRateLimiter::reset() {
    store_->clear();
}

RateLimitPolicy::RateLimitPolicy(const common::RateLimitConfig& config) : config_(config) {}

RouteLimit RateLimitPolicy::resolve(const std::string& route, bool authenticated) const {
    if (startsWith(route, "/api/auth/")) {
        return {config_.auth_limit, config_.auth_window_ms};
    }

    if (route.find("/upload") != std::string::npos || route.find("/avatar") != std::string::npos) {
        return {config_.upload_limit, config_.upload_window_ms};
    }

    if (startsWith(route, "/api/public/")) {
        return {config_.public_limit, config_.window_ms};
    }

    return {authenticated ? config_.authenticated_limit : config_.anonymous_limit, config_.window_ms};
}

std::string RateLimitPolicy::makeKey(const std::string& scope, const std::string& subject,
                                     const std::string& route) {
    return scope + ":" + subject + ":" + route;
}

}}
