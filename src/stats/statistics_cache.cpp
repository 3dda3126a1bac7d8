/// @file src/stats/statistics_cache.cpp
/// @brief StatisticsCache implementation.

#include "rebal/stats_cache.hpp"
#include "rebal/errors.hpp"

#include <functional>
#include <string>

namespace rebal::stats {

std::size_t StatKeyHash::operator()(const StatKey& key) const noexcept {
    std::size_t h = std::hash<std::string>{}(key.asset);
    const auto mix = [&h](std::size_t v) {
        h ^= v + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
    };
    mix(static_cast<std::size_t>(key.kind));
    mix(key.window);
    mix(static_cast<std::size_t>(key.end_date.time_since_epoch().count()));
    return h;
}

StatisticsCache::StatisticsCache(std::size_t capacity) : capacity_(capacity) {
    if (capacity_ == 0) {
        throw ConfigurationError("cache_capacity", "must be >= 1");
    }
}

double StatisticsCache::get_or_compute(const StatKey& key, const ComputeFn& compute) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = index_.find(key);
        if (it != index_.end()) {
            lru_.splice(lru_.begin(), lru_, it->second);
            ++hits_;
            return it->second->second;
        }
        ++misses_;
    }

    // Compute outside the lock.
    const double value = compute();

    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = index_.find(key);
    if (it != index_.end()) {
        // Another thread inserted first; its value wins.
        lru_.splice(lru_.begin(), lru_, it->second);
        return it->second->second;
    }

    lru_.emplace_front(key, value);
    index_.emplace(key, lru_.begin());
    while (lru_.size() > capacity_) {
        index_.erase(lru_.back().first);
        lru_.pop_back();
        ++evictions_;
    }
    return value;
}

std::optional<double> StatisticsCache::peek(const StatKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = index_.find(key);
    if (it == index_.end()) return std::nullopt;
    return it->second->second;
}

void StatisticsCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    index_.clear();
    lru_.clear();
}

CacheCounters StatisticsCache::counters() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return CacheCounters{.hits = hits_, .misses = misses_, .evictions = evictions_,
                         .size = lru_.size(), .capacity = capacity_};
}

std::size_t StatisticsCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lru_.size();
}

}  // namespace rebal::stats
