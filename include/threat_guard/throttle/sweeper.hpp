#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace threat_guard {
namespace throttle {

// Runs registered cleanup tasks on their own intervals from one background
// thread. Tasks are registered before start().
class Sweeper {
public:
    using Task = std::function<size_t()>;

    Sweeper() = default;
    ~Sweeper();

    Sweeper(const Sweeper&) = delete;
    Sweeper& operator=(const Sweeper&) = delete;

    bool addTask(const std::string& name, std::chrono::milliseconds interval, Task task);

    bool start();
    void stop();
    bool isRunning() const { return running_; }

    // Runs every task once on the calling thread; returns the total removed.
    size_t runAll();

private:
    struct Entry {
        std::string name;
        std::chrono::milliseconds interval;
        Task task;
        std::chrono::steady_clock::time_point next_run;
    };

    std::vector<Entry> entries_;
    std::atomic<bool> running_{false};
    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable cv_;

    void threadMain();
    size_t runTask(Entry& entry);
};

}}
