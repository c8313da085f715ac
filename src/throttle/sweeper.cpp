#include "threat_guard/throttle/sweeper.hpp"
#include "threat_guard/common/logger.hpp"
#include <algorithm>

namespace threat_guard {
namespace throttle {

Sweeper::~Sweeper() {
    stop();
}

bool Sweeper::addTask(const std::string& name, std::chrono::milliseconds interval, Task task) {
    if (running_) {
        common::Logger::instance().warn("[Sweeper] Task rejected while running | task={}", name);
        return false;
    }
    if (!task || interval.count() <= 0) {
        common::Logger::instance().warn("[Sweeper] Invalid task | task={} | interval_ms={}",
                                        name, interval.count());
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    entries_.push_back({name, interval, std::move(task), std::chrono::steady_clock::time_point{}});
    return true;
}

bool Sweeper::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        return true;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = std::chrono::steady_clock::now();
        for (auto& entry : entries_) {
            entry.next_run = now + entry.interval;
        }
    }

    thread_ = std::thread(&Sweeper::threadMain, this);
    common::Logger::instance().info("[Sweeper] Started | tasks={}", entries_.size());
    return true;
}

void Sweeper::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        bool expected = true;
        if (!running_.compare_exchange_strong(expected, false)) {
            return;
        }
    }
    cv_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
    }
    common::Logger::instance().debug("[Sweeper] Stopped");
}

size_t Sweeper::runAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t total = 0;
    for (auto& entry : entries_) {
        total += runTask(entry);
    }
    return total;
}

void Sweeper::threadMain() {
    std::unique_lock<std::mutex> lock(mutex_);

    while (running_) {
        if (entries_.empty()) {
            cv_.wait(lock, [this] { return !running_; });
            break;
        }

        auto next = std::min_element(entries_.begin(), entries_.end(),
                                     [](const Entry& a, const Entry& b) { return a.next_run < b.next_run; });
        auto deadline = next->next_run;

        if (cv_.wait_until(lock, deadline, [this] { return !running_; })) {
            break;
        }

        auto now = std::chrono::steady_clock::now();
        for (auto& entry : entries_) {
            if (entry.next_run <= now) {
                runTask(entry);
                entry.next_run = now + entry.interval;
            }
        }
    }
}

size_t Sweeper::runTask(Entry& entry) {
    try {
        size_t removed = entry.task();
        if (removed > 0) {
            common::Logger::instance().debug("[Sweeper] Task completed | task={} | removed={}",
                                             entry.name, removed);
        }
        return removed;
    } catch (const std::exception& e) {
        common::Logger::instance().error("[Sweeper] Task failed | task={} | error={}", entry.name, e.what());
        return 0;
    }
}

}}
