#pragma once

#include "keyed_store.hpp"
#include "../common/config.hpp"
#include "../common/types.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace threat_guard {
namespace throttle {

struct LockoutRecord {
    int attempts = 0;
    int64_t last_attempt_ms = 0;
    std::optional<int64_t> locked_until_ms;
    int lockout_level = 0;
    // Set when an expired lock was cleared lazily; the next failure starts a
    // fresh attempt count.
    bool pending_reset = false;
};

struct FailureOutcome {
    bool should_lock = false;
    std::optional<int64_t> lockout_duration_minutes;
    int attempts = 0;
};

struct LockoutStatus {
    bool locked = false;
    std::optional<int64_t> remaining_minutes;
    std::optional<int> attempts;
};

struct LockoutStats {
    size_t total_locked = 0;
    size_t total_with_attempts = 0;
    double average_attempts = 0.0;
};

using LockoutStore = KeyedStore<LockoutRecord>;

class AccountLockoutTracker {
public:
    explicit AccountLockoutTracker(const common::LockoutConfig& config = common::LockoutConfig{},
                                   std::shared_ptr<LockoutStore> store = nullptr,
                                   common::TimeSource now = common::systemNow);

    FailureOutcome recordFailure(const std::string& identifier);
    FailureOutcome recordFailure(const std::string& identifier, const common::LockoutConfig& config);

    LockoutStatus isLockedOut(const std::string& identifier);

    void recordSuccess(const std::string& identifier);

    // Milliseconds of response delay for the given failed attempt number.
    static int64_t progressiveDelay(int attempt_number);

    size_t cleanupExpired();
    LockoutStats stats() const;
    void clear();

private:
    common::LockoutConfig config_;
    std::shared_ptr<LockoutStore> store_;
    common::TimeSource now_;
};

}}
