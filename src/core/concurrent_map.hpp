#pragma once
#include <array>
#include <functional>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace agentpool::core {

// Hash map split into independently locked shards, so operations on
// different keys rarely contend. Values are returned by copy; store
// shared_ptr values for shared ownership.
template <typename Key, typename Value, size_t ShardCount = 16,
          typename Hash = std::hash<Key>>
class ConcurrentMap {
public:
    ConcurrentMap() = default;

    ConcurrentMap(const ConcurrentMap&) = delete;
    ConcurrentMap& operator=(const ConcurrentMap&) = delete;

    // Insert if absent. Returns {stored value, inserted}.
    std::pair<Value, bool> try_emplace(const Key& key, Value value) {
        auto& shard = shard_for(key);
        std::lock_guard<std::mutex> lock(shard.mutex);
        auto [it, inserted] = shard.map.try_emplace(key, std::move(value));
        return {it->second, inserted};
    }

    void insert_or_assign(const Key& key, Value value) {
        auto& shard = shard_for(key);
        std::lock_guard<std::mutex> lock(shard.mutex);
        shard.map.insert_or_assign(key, std::move(value));
    }

    std::optional<Value> find(const Key& key) const {
        const auto& shard = shard_for(key);
        std::lock_guard<std::mutex> lock(shard.mutex);
        auto it = shard.map.find(key);
        if (it == shard.map.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    bool contains(const Key& key) const {
        const auto& shard = shard_for(key);
        std::lock_guard<std::mutex> lock(shard.mutex);
        return shard.map.count(key) > 0;
    }

    // Remove and hand the value to the caller
    std::optional<Value> erase(const Key& key) {
        auto& shard = shard_for(key);
        std::lock_guard<std::mutex> lock(shard.mutex);
        auto it = shard.map.find(key);
        if (it == shard.map.end()) {
            return std::nullopt;
        }
        Value value = std::move(it->second);
        shard.map.erase(it);
        return value;
    }

    // Remove only if the predicate accepts the current value
    template <typename Pred>
    std::optional<Value> erase_if(const Key& key, Pred pred) {
        auto& shard = shard_for(key);
        std::lock_guard<std::mutex> lock(shard.mutex);
        auto it = shard.map.find(key);
        if (it == shard.map.end() || !pred(it->second)) {
            return std::nullopt;
        }
        Value value = std::move(it->second);
        shard.map.erase(it);
        return value;
    }

    std::vector<Value> values() const {
        std::vector<Value> out;
        for (const auto& shard : shards_) {
            std::lock_guard<std::mutex> lock(shard.mutex);
            for (const auto& [key, value] : shard.map) {
                out.push_back(value);
            }
        }
        return out;
    }

    std::vector<std::pair<Key, Value>> entries() const {
        std::vector<std::pair<Key, Value>> out;
        for (const auto& shard : shards_) {
            std::lock_guard<std::mutex> lock(shard.mutex);
            for (const auto& [key, value] : shard.map) {
                out.emplace_back(key, value);
            }
        }
        return out;
    }

    // Drain every entry (used on shutdown)
    std::vector<Value> take_all() {
        std::vector<Value> out;
        for (auto& shard : shards_) {
            std::lock_guard<std::mutex> lock(shard.mutex);
            for (auto& [key, value] : shard.map) {
                out.push_back(std::move(value));
            }
            shard.map.clear();
        }
        return out;
    }

    size_t size() const {
        size_t n = 0;
        for (const auto& shard : shards_) {
            std::lock_guard<std::mutex> lock(shard.mutex);
            n += shard.map.size();
        }
        return n;
    }

private:
    struct Shard {
        mutable std::mutex mutex;
        std::unordered_map<Key, Value, Hash> map;
    };

    Shard& shard_for(const Key& key) {
        return shards_[Hash{}(key) % ShardCount];
    }
    const Shard& shard_for(const Key& key) const {
        return shards_[Hash{}(key) % ShardCount];
    }

    std::array<Shard, ShardCount> shards_;
};

} // namespace agentpool::core
