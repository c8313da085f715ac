#pragma once

#include "../common/config.hpp"
#include "../common/types.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>

namespace threat_guard {
namespace events {

struct SecurityEvent {
    std::string kind;
    std::string caller_id;
    common::Severity severity = common::Severity::LOW;
    nlohmann::json details = nlohmann::json::object();
    common::Instant timestamp{};
};

nlohmann::json toJson(const SecurityEvent& event);

// Delivery target for security events. write() may fail by returning false
// or by throwing.
class EventWriter {
public:
    virtual ~EventWriter() = default;
    virtual bool write(const SecurityEvent& event) = 0;
};

// One JSON line per event through the process logger.
class LoggerEventWriter : public EventWriter {
public:
    bool write(const SecurityEvent& event) override;
};

enum class CircuitState {
    CLOSED,
    OPEN,
    HALF_OPEN
};

std::string to_string(CircuitState state);

struct SinkMetrics {
    uint64_t total_events = 0;
    uint64_t successful_writes = 0;
    uint64_t failed_writes = 0;
    uint64_t circuit_trips = 0;
    uint64_t dropped_events = 0;
    size_t queue_size = 0;
    CircuitState state = CircuitState::CLOSED;
};

class SecurityEventSink {
public:
    SecurityEventSink(std::shared_ptr<EventWriter> writer,
                      const common::EventsConfig& config = common::EventsConfig{},
                      common::TimeSource now = common::systemNow);

    // Accepts the event for delivery or buffering. Never throws; false means
    // the event could not be retained.
    bool submit(SecurityEvent event) noexcept;

    // Drains buffered events in FIFO order until the queue is empty, the
    // circuit opens or a write fails. Returns the number delivered.
    size_t flushQueue();

    SinkMetrics metrics() const;
    CircuitState state() const;
    void reset();

private:
    std::shared_ptr<EventWriter> writer_;
    common::EventsConfig config_;
    common::TimeSource now_;

    mutable std::mutex mutex_;
    CircuitState state_ = CircuitState::CLOSED;
    int failure_count_ = 0;
    int half_open_successes_ = 0;
    common::Instant last_failure_{};
    std::deque<SecurityEvent> queue_;
    SinkMetrics metrics_;

    bool tryWrite(const SecurityEvent& event);
    void maybeHalfOpen();
    void onSuccess();
    void onFailure();
    bool enqueue(SecurityEvent event);
};

}}
