#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace threat_guard {
namespace throttle {

// Per-key state store. update() runs the mutator while the key is held
// exclusively; a mutator returning false removes the entry (or skips the
// insert when the key did not exist).
template <typename Record>
class KeyedStore {
public:
    using Mutator = std::function<bool(Record& record, bool existed)>;
    using Predicate = std::function<bool(const std::string& key, const Record& record)>;
    using Visitor = std::function<void(const std::string& key, const Record& record)>;

    virtual ~KeyedStore() = default;

    virtual void update(const std::string& key, const Mutator& mutator) = 0;
    virtual std::optional<Record> get(const std::string& key) const = 0;
    virtual bool erase(const std::string& key) = 0;
    virtual size_t eraseIf(const Predicate& predicate) = 0;
    virtual size_t size() const = 0;
    virtual void forEach(const Visitor& visitor) const = 0;
    virtual void clear() = 0;
};

// In-process store split into mutex-guarded shards. Iteration and sweeps
// hold one shard lock at a time.
template <typename Record>
class ShardedKeyedStore : public KeyedStore<Record> {
public:
    using typename KeyedStore<Record>::Mutator;
    using typename KeyedStore<Record>::Predicate;
    using typename KeyedStore<Record>::Visitor;

    explicit ShardedKeyedStore(size_t shard_count = 16) {
        if (shard_count == 0) {
            shard_count = 1;
        }
        shards_.reserve(shard_count);
        for (size_t i = 0; i < shard_count; ++i) {
            shards_.push_back(std::make_unique<Shard>());
        }
    }

    void update(const std::string& key, const Mutator& mutator) override {
        Shard& shard = shardFor(key);
        std::lock_guard<std::mutex> lock(shard.mutex);

        auto it = shard.records.find(key);
        if (it == shard.records.end()) {
            Record fresh{};
            if (mutator(fresh, false)) {
                shard.records.emplace(key, std::move(fresh));
            }
            return;
        }

        if (!mutator(it->second, true)) {
            shard.records.erase(it);
        }
    }

    std::optional<Record> get(const std::string& key) const override {
        const Shard& shard = shardFor(key);
        std::lock_guard<std::mutex> lock(shard.mutex);
        auto it = shard.records.find(key);
        if (it == shard.records.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    bool erase(const std::string& key) override {
        Shard& shard = shardFor(key);
        std::lock_guard<std::mutex> lock(shard.mutex);
        return shard.records.erase(key) > 0;
    }

    size_t eraseIf(const Predicate& predicate) override {
        size_t removed = 0;
        for (auto& shard : shards_) {
            std::lock_guard<std::mutex> lock(shard->mutex);
            for (auto it = shard->records.begin(); it != shard->records.end();) {
                if (predicate(it->first, it->second)) {
                    it = shard->records.erase(it);
                    ++removed;
                } else {
                    ++it;
                }
            }
        }
        return removed;
    }

    size_t size() const override {
        size_t total = 0;
        for (const auto& shard : shards_) {
            std::lock_guard<std::mutex> lock(shard->mutex);
            total += shard->records.size();
        }
        return total;
    }

    void forEach(const Visitor& visitor) const override {
        for (const auto& shard : shards_) {
            std::lock_guard<std::mutex> lock(shard->mutex);
            for (const auto& entry : shard->records) {
                visitor(entry.first, entry.second);
            }
        }
    }

    void clear() override {
        for (auto& shard : shards_) {
            std::lock_guard<std::mutex> lock(shard->mutex);
            shard->records.clear();
        }
    }

    size_t shardCount() const { return shards_.size(); }

private:
    struct Shard {
        mutable std::mutex mutex;
        std::unordered_map<std::string, Record> records;
    };

    std::vector<std::unique_ptr<Shard>> shards_;
    std::hash<std::string> hasher_;

    Shard& shardFor(const std::string& key) {
        return *shards_[hasher_(key) % shards_.size()];
    }

    const Shard& shardFor(const std::string& key) const {
        return *shards_[hasher_(key) % shards_.size()];
    }
};

}}
