/**
 * @file result_cache.cpp
 * @brief ResultCache implementation.
 */

#include "engine/result_cache.hpp"

namespace tool_chain {

ResultCache::ResultCache(size_t max_entries, std::chrono::milliseconds ttl)
    : max_entries_(max_entries), ttl_(ttl) {}

std::string ResultCache::make_key(const ItemName& item, const Payload& input) {
    // Invalid UTF-8 in string values is replaced rather than thrown on.
    return item + ":" + input.dump(-1, ' ', false, Payload::error_handler_t::replace);
}

bool ResultCache::expired(const Slot& slot, SteadyTime now) const noexcept {
    return ttl_.count() > 0 && now - slot.stored_at > ttl_;
}

std::optional<CacheEntry> ResultCache::lookup(const std::string& key) {
    std::lock_guard lock(mutex_);
    auto it = index_.find(key);
    if (it == index_.end()) {
        ++misses_;
        return std::nullopt;
    }

    if (expired(*it->second, std::chrono::steady_clock::now())) {
        lru_.erase(it->second);
        index_.erase(it);
        ++misses_;
        return std::nullopt;
    }

    lru_.splice(lru_.begin(), lru_, it->second);
    auto& entry = it->second->entry;
    ++entry.hit_count;
    ++hits_;
    return entry;
}

std::optional<CacheEntry> ResultCache::peek(const std::string& key) const {
    std::lock_guard lock(mutex_);
    auto it = index_.find(key);
    if (it == index_.end()) return std::nullopt;
    return it->second->entry;
}

void ResultCache::store(CacheEntry entry) {
    std::lock_guard lock(mutex_);
    auto now = std::chrono::steady_clock::now();

    if (auto it = index_.find(entry.key); it != index_.end()) {
        it->second->entry = std::move(entry);
        it->second->stored_at = now;
        lru_.splice(lru_.begin(), lru_, it->second);
        return;
    }

    if (max_entries_ > 0 && lru_.size() >= max_entries_) {
        auto& victim = lru_.back();
        index_.erase(victim.entry.key);
        lru_.pop_back();
        ++evictions_;
    }

    auto key = entry.key;
    lru_.push_front(Slot{std::move(entry), now});
    index_.emplace(std::move(key), lru_.begin());
    ++inserted_;
}

void ResultCache::clear() {
    std::lock_guard lock(mutex_);
    lru_.clear();
    index_.clear();
    hits_ = 0;
    misses_ = 0;
    evictions_ = 0;
    inserted_ = 0;
}

size_t ResultCache::size() const {
    std::lock_guard lock(mutex_);
    return lru_.size();
}

CacheStats ResultCache::stats() const {
    std::lock_guard lock(mutex_);
    CacheStats s;
    s.size = lru_.size();
    s.total_entries = inserted_;
    s.total_hits = hits_;
    s.misses = misses_;
    s.evictions = evictions_;
    const auto lookups = hits_ + misses_;
    s.hit_rate = lookups > 0 ? static_cast<double>(hits_) / static_cast<double>(lookups) : 0.0;
    return s;
}

}  // namespace tool_chain
