#pragma once

/// @file include/rebal/stats_cache.hpp
/// @brief Bounded, thread-safe LRU memo of windowed factor statistics.
///
/// # Module: StatisticsCache
///
/// ## Key
/// `(asset, kind, window, end_date)`: `window` counts trading-calendar rows
/// and `end_date` is the date of the last row inside the window, so a key
/// determines exactly which returns were read. Values are immutable.
///
/// ## Concurrency
/// Compute-then-insert-if-absent: the compute function runs without the lock
/// held; when two threads miss on the same key the first insert wins and the
/// loser returns the stored value. Racing computations are redundant but
/// produce the same bits, since they read the same immutable data.
///
/// ## Invalidation
/// `clear()` must be called whenever the underlying price table is mutated;
/// Preselection does so when it sees a new table generation. The backtest
/// never mutates data during replay.

#include "rebal/constants.hpp"
#include "rebal/types.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <list>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>

namespace rebal::stats {

/// Which statistic a cached value holds.
enum class StatKind : std::uint8_t {
    Momentum,     ///< Compounded return over the window
    Volatility,   ///< Sample standard deviation of returns
    ValidCount,   ///< Number of finite returns in the window
};

struct StatKey {
    AssetId     asset;
    StatKind    kind;
    std::size_t window;
    Date        end_date;

    bool operator==(const StatKey&) const = default;
};

struct StatKeyHash {
    [[nodiscard]] std::size_t operator()(const StatKey& key) const noexcept;
};

/// Diagnostic counters.
struct CacheCounters {
    std::uint64_t hits      = 0;
    std::uint64_t misses    = 0;
    std::uint64_t evictions = 0;
    std::size_t   size      = 0;
    std::size_t   capacity  = 0;

    [[nodiscard]] double hit_rate() const noexcept {
        const auto total = hits + misses;
        return total == 0 ? 0.0 : static_cast<double>(hits) / static_cast<double>(total);
    }
};

class StatisticsCache {
public:
    using ComputeFn = std::function<double()>;

    /// # Throws
    /// `ConfigurationError` if `capacity == 0`.
    explicit StatisticsCache(std::size_t capacity = constants::DEFAULT_CACHE_CAPACITY);

    StatisticsCache(const StatisticsCache&)            = delete;
    StatisticsCache& operator=(const StatisticsCache&) = delete;

    /// Cached value for `key`, computing and storing it on a miss.
    [[nodiscard]] double get_or_compute(const StatKey& key, const ComputeFn& compute);

    [[nodiscard]] double get_or_compute(const AssetId& asset, StatKind kind,
                                        std::size_t window, Date end_date,
                                        const ComputeFn& compute) {
        return get_or_compute(StatKey{asset, kind, window, end_date}, compute);
    }

    /// Cached value without computing; does not count as a hit or miss.
    [[nodiscard]] std::optional<double> peek(const StatKey& key) const;

    /// Drop every entry. Counters other than `size` are preserved.
    void clear();

    [[nodiscard]] CacheCounters counters() const;
    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

private:
    using Entry = std::pair<StatKey, double>;
    using Lru   = std::list<Entry>;

    std::size_t                                              capacity_;
    mutable std::mutex                                       mutex_;
    Lru                                                      lru_;  ///< Front = most recent
    std::unordered_map<StatKey, Lru::iterator, StatKeyHash>  index_;
    std::uint64_t                                            hits_      = 0;
    std::uint64_t                                            misses_    = 0;
    std::uint64_t                                            evictions_ = 0;
};

}  // namespace rebal::stats
