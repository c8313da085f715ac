#include "threat_guard/events/security_event_sink.hpp"
#include "threat_guard/common/logger.hpp"

namespace threat_guard {
namespace events {

nlohmann::json toJson(const SecurityEvent& event) {
    nlohmann::json j;
    j["kind"] = event.kind;
    j["caller_id"] = event.caller_id;
    j["severity"] = common::to_string(event.severity);
    j["timestamp_ms"] = common::toEpochMillis(event.timestamp);
    j["details"] = event.details;
    return j;
}

bool LoggerEventWriter::write(const SecurityEvent& event) {
    auto& logger = common::Logger::instance();
    if (!logger.isInitialized()) {
        return false;
    }

    std::string line = "[SecurityEvent] " + toJson(event).dump(-1, ' ', false,
                                                               nlohmann::json::error_handler_t::replace);
    bool elevated = event.severity == common::Severity::HIGH || event.severity == common::Severity::CRITICAL;
    logger.raw(elevated ? common::LogLevel::WARN : common::LogLevel::INFO, line);
    return true;
}

std::string to_string(CircuitState state) {
    switch (state) {
        case CircuitState::CLOSED: return "closed";
        case CircuitState::OPEN: return "open";
        case CircuitState::HALF_OPEN: return "half_open";
        default: return "unknown";
    }
}

SecurityEventSink::SecurityEventSink(std::shared_ptr<EventWriter> writer,
                                     const common::EventsConfig& config,
                                     common::TimeSource now)
    : writer_(std::move(writer)), config_(config), now_(std::move(now)) {}

bool SecurityEventSink::submit(SecurityEvent event) noexcept {
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        metrics_.total_events++;

        if (event.timestamp == common::Instant{}) {
            event.timestamp = now_();
        }

        maybeHalfOpen();

        if (state_ == CircuitState::OPEN) {
            return enqueue(std::move(event));
        }

        if (tryWrite(event)) {
            onSuccess();
            return true;
        }

        onFailure();
        return enqueue(std::move(event));
    } catch (const std::exception& e) {
        common::Logger::instance().error("[EventSink] Submit failed | error={}", e.what());
        return false;
    }
}

size_t SecurityEventSink::flushQueue() {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t delivered = 0;

    maybeHalfOpen();
    while (!queue_.empty() && state_ != CircuitState::OPEN) {
        if (!tryWrite(queue_.front())) {
            onFailure();
            break;
        }
        queue_.pop_front();
        onSuccess();
        ++delivered;
    }

    metrics_.queue_size = queue_.size();
    if (delivered > 0) {
        common::Logger::instance().debug("[EventSink] Queue flushed | delivered={} | remaining={}",
                                         delivered, queue_.size());
    }
    return delivered;
}

SinkMetrics SecurityEventSink::metrics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    SinkMetrics snapshot = metrics_;
    snapshot.queue_size = queue_.size();
    snapshot.state = state_;
    return snapshot;
}

CircuitState SecurityEventSink::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

void SecurityEventSink::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = CircuitState::CLOSED;
    failure_count_ = 0;
    half_open_successes_ = 0;
    common::Logger::instance().info("[EventSink] Circuit reset | queued={}", queue_.size());
}

bool SecurityEventSink::tryWrite(const SecurityEvent& event) {
    if (!writer_) {
        return false;
    }

    try {
        return writer_->write(event);
    } catch (const std::exception& e) {
        common::Logger::instance().debug("[EventSink] Writer threw | kind={} | error={}", event.kind, e.what());
        return false;
    }
}

void SecurityEventSink::maybeHalfOpen() {
    if (state_ != CircuitState::OPEN) return;

    int64_t elapsed = common::toEpochMillis(now_()) - common::toEpochMillis(last_failure_);
    if (elapsed >= config_.reset_timeout_ms) {
        state_ = CircuitState::HALF_OPEN;
        half_open_successes_ = 0;
        common::Logger::instance().info("[EventSink] Circuit half-open | elapsed_ms={}", elapsed);
    }
}

void SecurityEventSink::onSuccess() {
    metrics_.successful_writes++;

    if (state_ == CircuitState::HALF_OPEN) {
        if (++half_open_successes_ >= config_.half_open_successes) {
            state_ = CircuitState::CLOSED;
            failure_count_ = 0;
            common::Logger::instance().info("[EventSink] Circuit closed");
        }
        return;
    }

    if (failure_count_ > 0) {
        --failure_count_;
    }
}

void SecurityEventSink::onFailure() {
    metrics_.failed_writes++;
    last_failure_ = now_();

    if (state_ == CircuitState::HALF_OPEN) {
        state_ = CircuitState::OPEN;
        metrics_.circuit_trips++;
        common::Logger::instance().warn("[EventSink] Circuit reopened after half-open failure");
        return;
    }

    if (++failure_count_ >= config_.failure_threshold) {
        state_ = CircuitState::OPEN;
        metrics_.circuit_trips++;
        common::Logger::instance().warn("[EventSink] Circuit opened | failures={}", failure_count_);
    }
}

bool SecurityEventSink::enqueue(SecurityEvent event) {
    if (config_.max_queue_size == 0) {
        metrics_.dropped_events++;
        return false;
    }

    if (queue_.size() >= config_.max_queue_size) {
        queue_.pop_front();
        metrics_.dropped_events++;
    }
    queue_.push_back(std::move(event));
    metrics_.queue_size = queue_.size();
    return true;
}

}}
