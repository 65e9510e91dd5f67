/// @file src/cache/analysis_cache.cpp
/// @brief AnalysisCache: TTL store plus shared-future single-flight table.
///
/// Locking: one mutex guards `entries_`, `lru_`, `in_flight_` and the
/// counters. It is never held while a compute function runs or while a waiter
/// blocks on a future.

#include "mktpsych/cache.hpp"
#include "mktpsych/errors.hpp"
#include "mktpsych/log.hpp"

#include <fmt/format.h>

#include <exception>
#include <utility>

namespace mktpsych {

// ─── Constructor ──────────────────────────────────────────────────────────────

AnalysisCache::AnalysisCache(CacheConfig config, TimeSource now)
    : config_(std::move(config))
    , now_(now ? std::move(now) : TimeSource{[] { return Clock::now(); }})
{}

// ─── Private helpers ──────────────────────────────────────────────────────────

bool AnalysisCache::is_expired(const Entry& e, Clock::time_point now) const noexcept {
    return now - e.stored_at >= config_.ttl;
}

AnalysisCache::EntryMap::iterator AnalysisCache::erase_locked(EntryMap::iterator it) {
    lru_.erase(it->second.lru_pos);
    return entries_.erase(it);
}

AnalysisCache::ResultPtr
AnalysisCache::lookup_locked(const AnalysisKey& key, Clock::time_point now) {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return nullptr;
    }
    if (is_expired(it->second, now)) {
        log::logger()->debug("cache expired: {}", key.to_string());
        erase_locked(it);
        return nullptr;
    }
    lru_.splice(lru_.begin(), lru_, it->second.lru_pos);
    return it->second.result;
}

void AnalysisCache::store_locked(const AnalysisKey& key,
                                 ResultPtr result,
                                 Clock::time_point now) {
    auto it = entries_.find(key);
    if (it != entries_.end()) {
        it->second.result    = std::move(result);
        it->second.stored_at = now;
        lru_.splice(lru_.begin(), lru_, it->second.lru_pos);
    } else {
        lru_.push_front(key);
        entries_.emplace(key, Entry{
            .result    = std::move(result),
            .stored_at = now,
            .lru_pos   = lru_.begin(),
        });
    }

    if (config_.max_entries == 0) {
        return;
    }
    while (entries_.size() > config_.max_entries) {
        const AnalysisKey& victim = lru_.back();
        log::logger()->debug("cache evict (lru): {}", victim.to_string());
        entries_.erase(victim);
        lru_.pop_back();
        ++evictions_;
    }
}

AnalysisCache::ResultPtr
AnalysisCache::wait_for(const Pending& pending, const AnalysisKey& key) const {
    if (config_.wait_timeout) {
        if (pending.wait_for(*config_.wait_timeout) != std::future_status::ready) {
            log::logger()->warn("gave up waiting {} ms for in-flight {}",
                                config_.wait_timeout->count(), key.to_string());
            throw AnalysisTimeoutError(
                fmt::format("timed out after {} ms waiting for {}",
                            config_.wait_timeout->count(), key.to_string()));
        }
    }
    return pending.get();
}

// ─── get ──────────────────────────────────────────────────────────────────────

std::optional<AnalysisResult> AnalysisCache::get(const AnalysisKey& key) {
    std::lock_guard lock(mutex_);
    if (auto hit = lookup_locked(key, now_())) {
        ++hits_;
        return *hit;
    }
    ++misses_;
    return std::nullopt;
}

// ─── get_or_compute ───────────────────────────────────────────────────────────

AnalysisResult
AnalysisCache::get_or_compute(const AnalysisKey& key, const ComputeFn& compute) {
    std::promise<ResultPtr> promise;
    Pending pending;
    bool owner = false;

    {
        std::lock_guard lock(mutex_);
        if (auto hit = lookup_locked(key, now_())) {
            ++hits_;
            log::logger()->debug("cache hit: {}", key.to_string());
            return *hit;
        }
        ++misses_;

        auto it = in_flight_.find(key);
        if (it != in_flight_.end()) {
            pending = it->second;
        } else {
            pending = promise.get_future().share();
            in_flight_.emplace(key, pending);
            owner = true;
            ++computations_;
        }
    }

    if (!owner) {
        log::logger()->debug("cache join in-flight: {}", key.to_string());
        return *wait_for(pending, key);
    }

    log::logger()->debug("cache miss, computing: {}", key.to_string());

    ResultPtr result;
    try {
        result = std::make_shared<const AnalysisResult>(compute());

        std::lock_guard lock(mutex_);
        store_locked(key, result, now_());
        in_flight_.erase(key);
    } catch (...) {
        // Failure while computing or storing. Clear the marker first so a
        // retry is possible, then hand the same exception to every waiter
        // and to this caller.
        {
            std::lock_guard lock(mutex_);
            in_flight_.erase(key);
        }
        promise.set_exception(std::current_exception());
        throw;
    }
    promise.set_value(result);
    return *result;
}

// ─── put / invalidate / purge / clear ─────────────────────────────────────────

void AnalysisCache::put(const AnalysisKey& key, AnalysisResult result) {
    auto ptr = std::make_shared<const AnalysisResult>(std::move(result));
    std::lock_guard lock(mutex_);
    store_locked(key, std::move(ptr), now_());
}

bool AnalysisCache::invalidate(const AnalysisKey& key) {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return false;
    }
    erase_locked(it);
    return true;
}

std::size_t
AnalysisCache::invalidate_matching(std::optional<std::string_view> instrument,
                                   std::optional<MarketKind> market) {
    std::lock_guard lock(mutex_);
    std::size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        const bool match = (!instrument || it->first.instrument == *instrument)
                        && (!market     || it->first.market == *market);
        if (match) {
            it = erase_locked(it);
            ++removed;
        } else {
            ++it;
        }
    }
    log::logger()->info("cache invalidated {} entries", removed);
    return removed;
}

std::size_t AnalysisCache::purge_expired() {
    std::lock_guard lock(mutex_);
    const auto now = now_();
    std::size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (is_expired(it->second, now)) {
            it = erase_locked(it);
            ++removed;
        } else {
            ++it;
        }
    }
    if (removed > 0) {
        log::logger()->debug("cache purged {} expired entries", removed);
    }
    return removed;
}

void AnalysisCache::clear() {
    std::lock_guard lock(mutex_);
    entries_.clear();
    lru_.clear();
}

// ─── stats ────────────────────────────────────────────────────────────────────

CacheStats AnalysisCache::stats() const {
    std::lock_guard lock(mutex_);
    const auto now = now_();

    CacheStats s;
    s.entries = entries_.size();
    for (const auto& [key, entry] : entries_) {
        if (is_expired(entry, now)) {
            ++s.expired;
        } else {
            ++s.active;
        }
    }
    s.in_flight    = in_flight_.size();
    s.hits         = hits_;
    s.misses       = misses_;
    s.computations = computations_;
    s.evictions    = evictions_;
    return s;
}

}  // namespace mktpsych
