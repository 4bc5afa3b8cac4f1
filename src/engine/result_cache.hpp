/**
 * @file result_cache.hpp
 * @brief LRU-bounded store of cached item outputs.
 */

#pragma once

#include "core/types.hpp"

#include <chrono>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace tool_chain {

struct CacheEntry {
    std::string key;
    ItemName item;
    Payload output;
    Timestamp created_at;
    Duration observed_duration{0};          ///< Executor duration when the entry was created
    uint64_t hit_count{0};
};

struct CacheStats {
    size_t size{0};
    double hit_rate{0.0};                   ///< hits / lookups, in [0, 1]
    size_t total_entries{0};                ///< Entries stored since the last clear
    uint64_t total_hits{0};
    uint64_t misses{0};
    uint64_t evictions{0};
};

/**
 * @brief Thread-safe result cache with least-recently-used eviction.
 *
 * lookup() counts the hit on the entry under the same lock that finds it,
 * and store() replaces an existing key in place, so concurrent steps never
 * observe a half-updated entry.
 */
class ResultCache {
public:
    /// @param max_entries LRU bound, 0 = unbounded
    /// @param ttl         entry lifetime, 0 = no expiry
    explicit ResultCache(size_t max_entries = 1024,
                         std::chrono::milliseconds ttl = std::chrono::milliseconds{0});

    /**
     * @brief Deterministic key for an item invocation.
     *
     * The payload is serialized with object keys in sorted order, so
     * {a:1,b:2} and {b:2,a:1} map to the same key.
     */
    [[nodiscard]] static std::string make_key(const ItemName& item, const Payload& input);

    /// Find an entry, record a hit on it and mark it most recently used.
    std::optional<CacheEntry> lookup(const std::string& key);

    /// Read an entry without touching statistics or recency.
    [[nodiscard]] std::optional<CacheEntry> peek(const std::string& key) const;

    /// Insert or replace an entry, evicting the least recently used if full.
    void store(CacheEntry entry);

    void clear();

    [[nodiscard]] size_t size() const;
    [[nodiscard]] CacheStats stats() const;
    [[nodiscard]] size_t max_entries() const noexcept { return max_entries_; }

private:
    struct Slot {
        CacheEntry entry;
        SteadyTime stored_at;
    };
    using LruList = std::list<Slot>;

    [[nodiscard]] bool expired(const Slot& slot, SteadyTime now) const noexcept;

    mutable std::mutex mutex_;
    LruList lru_;                                                    // front = most recent
    std::unordered_map<std::string, LruList::iterator> index_;
    size_t max_entries_;
    std::chrono::milliseconds ttl_;

    uint64_t hits_{0};
    uint64_t misses_{0};
    uint64_t evictions_{0};
    size_t inserted_{0};
};

}  // namespace tool_chain
