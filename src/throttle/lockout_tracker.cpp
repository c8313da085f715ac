#include "threat_guard/throttle/lockout_tracker.hpp"
#include "threat_guard/common/logger.hpp"
#include <algorithm>
#include <array>

namespace threat_guard {
namespace throttle {

namespace {

constexpr int64_t MS_PER_MINUTE = 60 * 1000;
constexpr std::array<int64_t, 5> PROGRESSIVE_DELAYS_MS = {0, 1000, 5000, 15000, 60000};

int64_t ceilMinutes(int64_t millis) {
    if (millis <= 0) {
        return 0;
    }
    return millis / MS_PER_MINUTE + (millis % MS_PER_MINUTE != 0 ? 1 : 0);
}

int64_t lockoutMinutes(const common::LockoutConfig& config, int level) {
    const int64_t cap = std::max<int64_t>(config.max_lockout_minutes, 0);
    int64_t minutes = std::max<int64_t>(config.base_lockout_minutes, 0);

    for (int i = 0; i < level && minutes < cap; ++i) {
        minutes = common::saturatingMul(minutes, config.progressive_multiplier);
    }
    return std::min(minutes, cap);
}

bool isLocked(const LockoutRecord& record, int64_t now_ms) {
    return record.locked_until_ms && now_ms <= *record.locked_until_ms;
}

}

AccountLockoutTracker::AccountLockoutTracker(const common::LockoutConfig& config,
                                             std::shared_ptr<LockoutStore> store,
                                             common::TimeSource now)
    : config_(config), store_(std::move(store)), now_(std::move(now)) {
    if (!store_) {
        store_ = std::make_shared<ShardedKeyedStore<LockoutRecord>>();
    }
}

FailureOutcome AccountLockoutTracker::recordFailure(const std::string& identifier) {
    return recordFailure(identifier, config_);
}

FailureOutcome AccountLockoutTracker::recordFailure(const std::string& identifier,
                                                    const common::LockoutConfig& config) {
    const int64_t now_ms = common::toEpochMillis(now_());
    const int64_t window_ms = common::saturatingMul(config.attempt_window_minutes, MS_PER_MINUTE);
    FailureOutcome outcome;

    store_->update(identifier, [&](LockoutRecord& record, bool) {
        if (isLocked(record, now_ms)) {
            outcome.should_lock = true;
            outcome.lockout_duration_minutes = ceilMinutes(*record.locked_until_ms - now_ms);
            outcome.attempts = record.attempts;
            return true;
        }

        if (record.locked_until_ms || record.pending_reset) {
            record.locked_until_ms.reset();
            record.pending_reset = false;
            record.attempts = 0;
        }

        if (record.last_attempt_ms < common::saturatingAdd(now_ms, -window_ms)) {
            record.attempts = 0;
        }

        record.attempts++;
        record.last_attempt_ms = now_ms;

        if (record.attempts >= config.max_attempts) {
            int64_t minutes = lockoutMinutes(config, record.lockout_level);
            record.locked_until_ms = common::saturatingAdd(now_ms, common::saturatingMul(minutes, MS_PER_MINUTE));
            record.lockout_level++;

            outcome.should_lock = true;
            outcome.lockout_duration_minutes = minutes;
        }

        outcome.attempts = record.attempts;
        return true;
    });

    if (outcome.should_lock && outcome.lockout_duration_minutes) {
        common::Logger::instance().warn("[Lockout] Identifier locked | identifier={} | attempts={} | minutes={}",
                                        identifier, outcome.attempts, *outcome.lockout_duration_minutes);
    }
    return outcome;
}

LockoutStatus AccountLockoutTracker::isLockedOut(const std::string& identifier) {
    const int64_t now_ms = common::toEpochMillis(now_());
    LockoutStatus status;

    store_->update(identifier, [&](LockoutRecord& record, bool existed) {
        if (!existed) {
            return false;
        }

        if (record.locked_until_ms && now_ms > *record.locked_until_ms) {
            record.locked_until_ms.reset();
            record.pending_reset = true;
        }

        status.attempts = record.attempts;
        if (isLocked(record, now_ms)) {
            status.locked = true;
            status.remaining_minutes = ceilMinutes(*record.locked_until_ms - now_ms);
        }
        return true;
    });

    return status;
}

void AccountLockoutTracker::recordSuccess(const std::string& identifier) {
    if (store_->erase(identifier)) {
        common::Logger::instance().debug("[Lockout] Attempts cleared | identifier={}", identifier);
    }
}

int64_t AccountLockoutTracker::progressiveDelay(int attempt_number) {
    if (attempt_number <= 0) {
        return 0;
    }
    size_t index = std::min<size_t>(static_cast<size_t>(attempt_number - 1), PROGRESSIVE_DELAYS_MS.size() - 1);
    return PROGRESSIVE_DELAYS_MS[index];
}

size_t AccountLockoutTracker::cleanupExpired() {
    const int64_t now_ms = common::toEpochMillis(now_());
    const int64_t window_start = common::saturatingAdd(
        now_ms, -common::saturatingMul(config_.attempt_window_minutes, MS_PER_MINUTE));

    size_t removed = store_->eraseIf([&](const std::string&, const LockoutRecord& record) {
        if (record.locked_until_ms) {
            return now_ms > *record.locked_until_ms;
        }
        return record.last_attempt_ms < window_start;
    });

    if (removed > 0) {
        common::Logger::instance().debug("[Lockout] Cleanup completed | removed={}", removed);
    }
    return removed;
}

LockoutStats AccountLockoutTracker::stats() const {
    const int64_t now_ms = common::toEpochMillis(now_());
    LockoutStats stats;
    int64_t total_attempts = 0;

    store_->forEach([&](const std::string&, const LockoutRecord& record) {
        if (isLocked(record, now_ms)) {
            stats.total_locked++;
        }
        if (record.attempts > 0) {
            stats.total_with_attempts++;
            total_attempts += record.attempts;
        }
    });

    if (stats.total_with_attempts > 0) {
        stats.average_attempts = static_cast<double>(total_attempts) / static_cast<double>(stats.total_with_attempts);
    }
    return stats;
}

void AccountLockoutTracker::clear() {
    store_->clear();
}

}}
