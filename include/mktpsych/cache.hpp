#pragma once

/// @file include/mktpsych/cache.hpp
/// @brief AnalysisCache: TTL memoization of AnalysisResult with single-flight
///        computation per key.
///
/// # Module: Analysis Cache
///
/// ## Responsibility
/// Store completed results under (instrument, market kind, period) for a
/// configurable TTL and make sure that, for any key, at most one computation
/// runs at a time.
///
/// ## Single-flight
/// The first caller to miss a key registers a `std::shared_future` in the
/// in-flight table and runs the computation without holding any lock. Later
/// callers for the same key find that future and wait on it. Callers for other
/// keys are only serialized for the map lookups themselves.
///
/// When the computation throws, the in-flight entry is removed before the
/// exception is delivered, so the next call retries. Every waiter receives the
/// same exception.
///
/// A waiter may stop waiting after `CacheConfig::wait_timeout`; the
/// computation is not cancelled and still stores its result.
///
/// ## Guarantees
/// - Results returned within the TTL window are identical to the stored value
/// - No global singleton: construct one per process and inject it
/// - All public members are thread-safe

#include "mktpsych/config.hpp"
#include "mktpsych/types.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <future>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>

namespace mktpsych {

/// Point-in-time counters, mainly for diagnostics and tests.
struct CacheStats {
    std::size_t entries      = 0;  ///< Stored results, fresh or stale
    std::size_t active       = 0;  ///< Stored and within TTL
    std::size_t expired      = 0;  ///< Stored but past TTL (not yet purged)
    std::size_t in_flight    = 0;  ///< Computations currently running
    std::size_t hits         = 0;
    std::size_t misses       = 0;
    std::size_t computations = 0;  ///< compute functions started
    std::size_t evictions    = 0;  ///< LRU removals
};

class AnalysisCache {
public:
    using Clock      = std::chrono::steady_clock;
    using TimeSource = std::function<Clock::time_point()>;
    using ComputeFn  = std::function<AnalysisResult()>;

    /// # Arguments
    /// * `config`: TTL, optional LRU bound and waiter timeout
    /// * `now`: clock override for tests; defaults to `Clock::now`
    explicit AnalysisCache(CacheConfig config = CacheConfig{},
                           TimeSource now = {});

    AnalysisCache(const AnalysisCache&)            = delete;
    AnalysisCache& operator=(const AnalysisCache&) = delete;

    /// Stored result for `key`, or `nullopt` if absent or past its TTL.
    /// Expired entries are dropped on access.
    [[nodiscard]] std::optional<AnalysisResult> get(const AnalysisKey& key);

    /// Return the fresh stored result, or run `compute` exactly once across all
    /// concurrent callers for `key` and store its result.
    ///
    /// # Throws
    /// - whatever `compute` throws (to the owner and every waiter)
    /// - `AnalysisTimeoutError` if this caller's wait exceeds `wait_timeout`
    [[nodiscard]] AnalysisResult
    get_or_compute(const AnalysisKey& key, const ComputeFn& compute);

    /// Store a result, superseding any previous value for `key`.
    void put(const AnalysisKey& key, AnalysisResult result);

    /// Remove one key. Returns true if a value was stored.
    bool invalidate(const AnalysisKey& key);

    /// Remove every key matching the given instrument and/or market kind
    /// (an empty filter matches everything). Returns the number removed.
    std::size_t invalidate_matching(std::optional<std::string_view> instrument,
                                    std::optional<MarketKind> market);

    /// Drop all entries past their TTL. Returns the number removed.
    std::size_t purge_expired();

    /// Drop every stored entry. In-flight computations are unaffected.
    void clear();

    [[nodiscard]] CacheStats stats() const;

    [[nodiscard]] const CacheConfig& config() const noexcept { return config_; }

private:
    using ResultPtr = std::shared_ptr<const AnalysisResult>;
    using Pending   = std::shared_future<ResultPtr>;

    struct Entry {
        ResultPtr                        result;
        Clock::time_point                stored_at;
        std::list<AnalysisKey>::iterator lru_pos;
    };

    using EntryMap = std::map<AnalysisKey, Entry>;

    [[nodiscard]] bool is_expired(const Entry& e, Clock::time_point now) const noexcept;

    /// Fresh value for `key` or nullptr; refreshes LRU order. Caller holds mutex_.
    ResultPtr lookup_locked(const AnalysisKey& key, Clock::time_point now);

    /// Insert or replace, then enforce max_entries. Caller holds mutex_.
    void store_locked(const AnalysisKey& key, ResultPtr result, Clock::time_point now);

    /// Caller holds mutex_.
    EntryMap::iterator erase_locked(EntryMap::iterator it);

    /// Block on another caller's computation, honouring wait_timeout.
    ResultPtr wait_for(const Pending& pending, const AnalysisKey& key) const;

    CacheConfig config_;
    TimeSource  now_;

    mutable std::mutex             mutex_;
    EntryMap                       entries_;
    std::list<AnalysisKey>         lru_;        ///< Front = most recently used
    std::map<AnalysisKey, Pending> in_flight_;

    std::size_t hits_         = 0;
    std::size_t misses_       = 0;
    std::size_t computations_ = 0;
    std::size_t evictions_    = 0;
};

} // namespace mktpsych
