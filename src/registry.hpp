// src/registry.hpp
// Sharded transaction registry — outstanding id → pending entry with deadline.

#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace ran {

template <typename Entry>
class TransactionRegistry {
public:
    using Clock = std::chrono::steady_clock;
    static constexpr size_t SHARD_COUNT = 16;

    TransactionRegistry() = default;
    TransactionRegistry(const TransactionRegistry&) = delete;
    TransactionRegistry& operator=(const TransactionRegistry&) = delete;

    // Returns false if the id is already registered.
    bool register_entry(uint64_t id, Entry entry, Clock::time_point deadline = Clock::time_point::max()) {
        Shard& shard = shard_for(id);
        std::lock_guard<std::mutex> lock(shard.mutex);
        return shard.records.emplace(id, Record{std::move(entry), deadline}).second;
    }

    // Apply `fn(Entry&)` to the entry under its shard lock. When `fn` returns
    // true the entry is final and removed. Returns false on unknown id.
    // If `fn` throws, the entry is left in place.
    template <typename Fn>
    bool resolve(uint64_t id, Fn&& fn) {
        Shard& shard = shard_for(id);
        std::lock_guard<std::mutex> lock(shard.mutex);
        auto it = shard.records.find(id);
        if (it == shard.records.end()) return false;
        if (fn(it->second.entry)) {
            shard.records.erase(it);
        }
        return true;
    }

    // Remove and return the entry.
    std::optional<Entry> take(uint64_t id) {
        Shard& shard = shard_for(id);
        std::lock_guard<std::mutex> lock(shard.mutex);
        auto it = shard.records.find(id);
        if (it == shard.records.end()) return std::nullopt;
        Entry entry = std::move(it->second.entry);
        shard.records.erase(it);
        return entry;
    }

    // Remove the entry ahead of its deadline. Same as take(); the caller
    // resolves the waiter with a timeout.
    std::optional<Entry> expire(uint64_t id) {
        return take(id);
    }

    // Remove every entry whose deadline has passed and hand each one to
    // `on_expired(id, Entry&)` outside the shard locks. Returns the count.
    template <typename Fn>
    size_t expire_due(Clock::time_point now, Fn&& on_expired) {
        std::vector<std::pair<uint64_t, Entry>> expired;
        for (auto& shard : shards_) {
            std::lock_guard<std::mutex> lock(shard.mutex);
            for (auto it = shard.records.begin(); it != shard.records.end();) {
                if (it->second.deadline <= now) {
                    expired.emplace_back(it->first, std::move(it->second.entry));
                    it = shard.records.erase(it);
                } else {
                    ++it;
                }
            }
        }
        for (auto& item : expired) {
            on_expired(item.first, item.second);
        }
        return expired.size();
    }

    // Remove everything; returns the removed entries.
    std::vector<std::pair<uint64_t, Entry>> drain() {
        std::vector<std::pair<uint64_t, Entry>> out;
        for (auto& shard : shards_) {
            std::lock_guard<std::mutex> lock(shard.mutex);
            for (auto& kv : shard.records) {
                out.emplace_back(kv.first, std::move(kv.second.entry));
            }
            shard.records.clear();
        }
        return out;
    }

    void clear() {
        for (auto& shard : shards_) {
            std::lock_guard<std::mutex> lock(shard.mutex);
            shard.records.clear();
        }
    }

    bool contains(uint64_t id) const {
        const Shard& shard = shard_for(id);
        std::lock_guard<std::mutex> lock(shard.mutex);
        return shard.records.count(id) != 0;
    }

    size_t size() const {
        size_t total = 0;
        for (const auto& shard : shards_) {
            std::lock_guard<std::mutex> lock(shard.mutex);
            total += shard.records.size();
        }
        return total;
    }

private:
    struct Record {
        Entry entry;
        Clock::time_point deadline;
    };

    struct Shard {
        mutable std::mutex mutex;
        std::unordered_map<uint64_t, Record> records;
    };

    // Transaction ids are often sequential; mix before picking a shard.
    static size_t shard_index(uint64_t id) noexcept {
        id ^= id >> 33;
        id *= 0xff51afd7ed558ccdULL;
        id ^= id >> 33;
        return static_cast<size_t>(id % SHARD_COUNT);
    }

    Shard& shard_for(uint64_t id) { return shards_[shard_index(id)]; }
    const Shard& shard_for(uint64_t id) const { return shards_[shard_index(id)]; }

    std::array<Shard, SHARD_COUNT> shards_;
};

} // namespace ran
