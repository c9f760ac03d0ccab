#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>

namespace mcp_orch {

/**
 * @brief Bounded key/value cache with a fixed time-to-live
 *
 * Stale entries are dropped lazily when read. Inserting into a full cache
 * first sweeps stale entries and, if still full, evicts the oldest one.
 * All access goes through a single mutex.
 */
template <typename Key, typename Value>
class TtlCache {
public:
    using Clock = std::chrono::steady_clock;
    using NowFn = std::function<Clock::time_point()>;

    /**
     * @brief Construct cache
     * @param ttl Lifetime of each entry
     * @param max_entries Capacity (at least 1)
     * @param now Clock source, injectable for tests
     */
    TtlCache(std::chrono::milliseconds ttl, std::size_t max_entries, NowFn now = [] { return Clock::now(); })
        : ttl_(ttl), max_entries_(max_entries == 0 ? 1 : max_entries), now_(std::move(now)) {}

    std::optional<Value> get(const Key& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        return get_locked(key);
    }

    void put(const Key& key, Value value) {
        std::lock_guard<std::mutex> lock(mutex_);
        put_locked(key, std::move(value));
    }

    /**
     * @brief Return the cached value or compute and store it
     *
     * The check and the insert happen under one lock, so concurrent callers
     * for the same key compute once.
     */
    template <typename Compute>
    Value get_or_compute(const Key& key, Compute&& compute) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (auto cached = get_locked(key)) {
            return *cached;
        }
        Value value = compute();
        put_locked(key, value);
        return value;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
    }

private:
    struct Entry {
        Value value;
        Clock::time_point stored_at;
    };

    bool is_stale(const Entry& entry, Clock::time_point now) const {
        return now - entry.stored_at >= ttl_;
    }

    std::optional<Value> get_locked(const Key& key) {
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            return std::nullopt;
        }
        if (is_stale(it->second, now_())) {
            entries_.erase(it);
            return std::nullopt;
        }
        return it->second.value;
    }

    void put_locked(const Key& key, Value value) {
        const auto now = now_();
        auto existing = entries_.find(key);
        if (existing == entries_.end() && entries_.size() >= max_entries_) {
            evict_locked(now);
        }
        entries_[key] = Entry{std::move(value), now};
    }

    void evict_locked(Clock::time_point now) {
        for (auto it = entries_.begin(); it != entries_.end();) {
            if (is_stale(it->second, now)) {
                it = entries_.erase(it);
            } else {
                ++it;
            }
        }

        while (entries_.size() >= max_entries_) {
            auto oldest = entries_.begin();
            for (auto it = entries_.begin(); it != entries_.end(); ++it) {
                if (it->second.stored_at < oldest->second.stored_at) {
                    oldest = it;
                }
            }
            entries_.erase(oldest);
        }
    }

    std::chrono::milliseconds ttl_;
    std::size_t max_entries_;
    NowFn now_;
    mutable std::mutex mutex_;
    std::unordered_map<Key, Entry> entries_;
};

} // namespace mcp_orch
