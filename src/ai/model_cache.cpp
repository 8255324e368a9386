#include "vigil/ai/model_cache.h"
#include "vigil/errors.h"
#include <algorithm>
#include <iostream>
#include <limits>
#include <thread>

namespace vigil {
namespace ai {

namespace {

// Starts fn on a detached thread. fn must own everything it touches, since
// the caller may stop waiting before it finishes.
template <typename Fn>
auto launch_detached(Fn fn) -> std::shared_future<decltype(fn())> {
    using Result = decltype(fn());
    auto task = std::make_shared<std::packaged_task<Result()>>(std::move(fn));
    std::shared_future<Result> future = task->get_future().share();
    std::thread([task]() { (*task)(); }).detach();
    return future;
}

template <typename Result>
Result await_result(const std::shared_future<Result>& future, int64_t timeout_ms, const std::string& operation) {
    if (future.wait_for(std::chrono::milliseconds(timeout_ms)) != std::future_status::ready) {
        throw TimeoutError(operation, timeout_ms);
    }
    return future.get();
}

// A late result is dropped with the shared state
template <typename Fn>
auto run_with_timeout(Fn fn, int64_t timeout_ms, const std::string& operation) -> decltype(fn()) {
    return await_result(launch_detached(std::move(fn)), timeout_ms, operation);
}

bool settled(const std::shared_future<ArtifactBytes>& future) {
    return future.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

} // anonymous namespace

const char* to_string(ResolveStatus status) {
    switch (status) {
        case ResolveStatus::Fresh: return "fresh";
        case ResolveStatus::Degraded: return "degraded";
        case ResolveStatus::Unavailable: return "unavailable";
    }
    return "unknown";
}

nlohmann::json CacheStats::to_json() const {
    nlohmann::json j;
    j["entries"] = entries;
    j["hits"] = hits;
    j["loads"] = loads;
    j["builds"] = builds;
    j["load_failures"] = load_failures;
    j["build_failures"] = build_failures;
    j["persist_failures"] = persist_failures;
    j["degraded"] = degraded;
    j["unavailable"] = unavailable;
    j["coalesced"] = coalesced;
    j["evictions"] = evictions;
    j["timeouts"] = timeouts;
    return j;
}

ModelCache::ModelCache(CacheConfig config,
                       std::shared_ptr<IModelStore> store,
                       std::shared_ptr<IModelBuilder> builder,
                       std::shared_ptr<ITrendSource> trends,
                       ClockFn clock)
    : config_(std::move(config)),
      store_(std::move(store)),
      builder_(std::move(builder)),
      trends_(std::move(trends)),
      clock_(clock ? std::move(clock) : ClockFn([] { return Clock::now(); })),
      shards_(std::max<size_t>(1, config_.shards)) {
    if (!store_) {
        throw std::invalid_argument("ModelCache requires a model store");
    }
    std::cout << "[ModelCache] Initialized with capacity " << config_.capacity
              << ", " << shards_.size() << " shards, freshness "
              << config_.freshness_ms << "ms" << std::endl;
}

ModelCache::Shard& ModelCache::shard_for(const std::string& monitor_id) const {
    return shards_[std::hash<std::string>{}(monitor_id) % shards_.size()];
}

std::shared_ptr<ModelCache::CacheEntry> ModelCache::entry_for(const std::string& monitor_id) {
    Shard& shard = shard_for(monitor_id);
    std::lock_guard<std::mutex> lock(shard.mutex);

    auto it = shard.entries.find(monitor_id);
    if (it == shard.entries.end()) {
        it = shard.entries.emplace(monitor_id, std::make_shared<CacheEntry>()).first;
        entry_count_.fetch_add(1);
    }
    it->second->last_resolved.store(tick_.fetch_add(1) + 1);
    it->second->pins.fetch_add(1);
    return it->second;
}

bool ModelCache::contains(const std::string& monitor_id) const {
    Shard& shard = shard_for(monitor_id);
    std::lock_guard<std::mutex> lock(shard.mutex);
    return shard.entries.find(monitor_id) != shard.entries.end();
}

void ModelCache::shutdown() {
    shutting_down_.store(true);
    std::cout << "[ModelCache] Shutting down" << std::endl;
}

CacheStats ModelCache::stats() const {
    CacheStats stats;
    stats.entries = entry_count_.load();
    stats.hits = hits_.load();
    stats.loads = loads_.load();
    stats.builds = builds_.load();
    stats.load_failures = load_failures_.load();
    stats.build_failures = build_failures_.load();
    stats.persist_failures = persist_failures_.load();
    stats.degraded = degraded_.load();
    stats.unavailable = unavailable_.load();
    stats.coalesced = coalesced_.load();
    stats.evictions = evictions_.load();
    stats.timeouts = timeouts_.load();
    return stats;
}

// ============================================
// Resolution
// ============================================

Resolution ModelCache::resolve(const std::string& monitor_id) {
    if (shutting_down_.load()) {
        ++unavailable_;
        return Resolution{ResolveStatus::Unavailable, nullptr, "cache is shutting down"};
    }

    // entry_for() pins the entry under its shard lock; unpin on every exit
    auto entry = entry_for(monitor_id);
    Resolution result;
    try {
        result = resolve_pinned(monitor_id, *entry);
    } catch (const std::exception&) {
        entry->pins.fetch_sub(1);
        throw;
    }
    entry->pins.fetch_sub(1);

    enforce_capacity();
    return result;
}

Resolution ModelCache::resolve_pinned(const std::string& monitor_id, CacheEntry& entry) {
    std::promise<Resolution> promise;
    std::shared_future<ArtifactBytes> finished_build;

    {
        std::unique_lock<std::mutex> lock(entry.mutex);
        const auto now = clock_();

        if (entry.artifact && entry.artifact->usable_for(monitor_id) &&
            now - entry.last_load < std::chrono::milliseconds(config_.freshness_ms)) {
            ++hits_;
            return Resolution{ResolveStatus::Fresh, entry.artifact, "cache hit"};
        }

        // Someone is already refreshing this key: wait for their result
        if (entry.in_flight.valid()) {
            std::shared_future<Resolution> pending = entry.in_flight;
            lock.unlock();
            ++coalesced_;
            return pending.get();
        }

        if (entry.abandoned_build.valid()) {
            if (!settled(entry.abandoned_build)) {
                return fallback(entry.artifact, "an earlier build for " + monitor_id + " is still running");
            }
            // A late build result is used before anything else is tried
            finished_build = entry.abandoned_build;
            entry.abandoned_build = std::shared_future<ArtifactBytes>();
        } else if (entry.consecutive_failures > 0 && now < entry.next_attempt) {
            return fallback(entry.artifact,
                            "backing off after " + std::to_string(entry.consecutive_failures) +
                            " consecutive failures");
        }

        entry.in_flight = promise.get_future().share();
    }

    RefreshOutcome outcome;
    try {
        outcome = refresh(monitor_id, finished_build);
    } catch (const std::exception& e) {
        outcome = RefreshOutcome();
        outcome.reason = std::string("unexpected refresh failure: ") + e.what();
    }

    Resolution result = complete(monitor_id, entry, std::move(outcome));
    promise.set_value(result);
    return result;
}

ModelCache::RefreshOutcome ModelCache::refresh(const std::string& monitor_id,
                                               std::shared_future<ArtifactBytes> finished_build) {
    RefreshOutcome outcome;

    if (finished_build.valid()) {
        std::string late_reason;
        try {
            outcome.artifact = adopt_build(monitor_id, finished_build.get(), late_reason);
        } catch (const std::exception& e) {
            ++build_failures_;
            late_reason = e.what();
        }
        if (outcome.artifact) {
            outcome.built = true;
            outcome.reason = "built from trend history";
            return outcome;
        }
        std::cerr << "[ModelCache] Late build for " << monitor_id << " is unusable: "
                  << late_reason << std::endl;
    }

    std::string load_reason;
    outcome.artifact = load_from_store(monitor_id, load_reason);
    if (outcome.artifact) {
        outcome.reason = "loaded from store";
        return outcome;
    }

    outcome.attempted_build = true;
    std::string build_reason;
    outcome.artifact = build_fresh(monitor_id, build_reason, outcome.abandoned_build);
    if (outcome.artifact) {
        outcome.built = true;
        outcome.reason = "built from trend history";
        return outcome;
    }

    outcome.reason = "load failed (" + load_reason + "); build failed (" + build_reason + ")";
    return outcome;
}

std::shared_ptr<const ModelArtifact> ModelCache::load_from_store(const std::string& monitor_id,
                                                                 std::string& reason) {
    std::optional<ArtifactBytes> bytes;
    auto store = store_;
    const size_t attempts = config_.max_load_retries + 1;

    for (size_t attempt = 1; attempt <= attempts; ++attempt) {
        try {
            bytes = run_with_timeout([store, monitor_id]() { return store->get(monitor_id); },
                                     config_.load_timeout_ms, "store fetch");
            reason.clear();
            break;
        } catch (const TimeoutError& e) {
            ++timeouts_;
            reason = e.what();
            break;
        } catch (const StorageError& e) {
            reason = e.what();
            std::cerr << "[ModelCache] Store fetch for " << monitor_id << " failed (attempt "
                      << attempt << "/" << attempts << "): " << e.what() << std::endl;
        } catch (const std::exception& e) {
            reason = std::string("unexpected store failure: ") + e.what();
            std::cerr << "[ModelCache] Store fetch for " << monitor_id << " failed: " << reason << std::endl;
            break;
        }
    }

    if (!reason.empty()) {
        ++load_failures_;
        return nullptr;
    }
    if (!bytes) {
        reason = "no artifact in store";
        ++load_failures_;
        return nullptr;
    }

    try {
        auto artifact = ArtifactCodec::decode(*bytes);
        if (!artifact->usable_for(monitor_id)) {
            reason = "stored artifact is invalid or belongs to " + artifact->monitor_id;
            ++load_failures_;
            return nullptr;
        }
        ++loads_;
        std::cout << "[ModelCache] Loaded " << artifact->algorithm() << " artifact for "
                  << monitor_id << " (version " << artifact->version << ")" << std::endl;
        return artifact;
    } catch (const std::exception& e) {
        reason = e.what();
        ++load_failures_;
        std::cerr << "[ModelCache] Stored artifact for " << monitor_id << " is unreadable: "
                  << e.what() << std::endl;
        return nullptr;
    }
}

std::shared_ptr<const ModelArtifact> ModelCache::build_fresh(const std::string& monitor_id,
                                                             std::string& reason,
                                                             std::shared_future<ArtifactBytes>& abandoned) {
    if (!builder_) {
        reason = "no model builder configured";
        ++build_failures_;
        return nullptr;
    }

    try {
        std::vector<Reading> history;
        if (trends_) {
            auto trends = trends_;
            const size_t limit = config_.history_limit;
            history = run_with_timeout([trends, monitor_id, limit]() { return trends->history(monitor_id, limit); },
                                       config_.load_timeout_ms, "trend fetch");
        }

        auto builder = builder_;
        std::shared_future<ArtifactBytes> build = launch_detached(
            [builder, monitor_id, history]() { return builder->build(monitor_id, history); });
        ArtifactBytes bytes;
        try {
            bytes = await_result(build, config_.build_timeout_ms, "model build");
        } catch (const TimeoutError&) {
            abandoned = build;
            throw;
        }
        return adopt_build(monitor_id, bytes, reason);

    } catch (const TimeoutError& e) {
        ++timeouts_;
        ++build_failures_;
        reason = e.what();
    } catch (const PipelineError& e) {
        ++build_failures_;
        reason = e.what();
    } catch (const std::exception& e) {
        ++build_failures_;
        reason = std::string("unexpected build failure: ") + e.what();
    }

    std::cerr << "[ModelCache] Build for " << monitor_id << " failed: " << reason << std::endl;
    return nullptr;
}

std::shared_ptr<const ModelArtifact> ModelCache::adopt_build(const std::string& monitor_id,
                                                             const ArtifactBytes& bytes,
                                                             std::string& reason) {
    auto artifact = ArtifactCodec::decode(bytes);
    if (!artifact->usable_for(monitor_id)) {
        reason = "builder produced an unusable artifact";
        ++build_failures_;
        return nullptr;
    }

    ++builds_;
    std::cout << "[ModelCache] Built " << artifact->algorithm() << " artifact for "
              << monitor_id << " (version " << artifact->version << ")" << std::endl;

    persist(monitor_id, bytes);
    return artifact;
}

void ModelCache::persist(const std::string& monitor_id, const ArtifactBytes& bytes) {
    auto store = store_;
    try {
        run_with_timeout([store, monitor_id, bytes]() { store->put(monitor_id, bytes); },
                         config_.persist_timeout_ms, "store persist");
    } catch (const TimeoutError& e) {
        ++timeouts_;
        ++persist_failures_;
        std::cerr << "[ModelCache] Persisting " << monitor_id << " failed: " << e.what() << std::endl;
    } catch (const std::exception& e) {
        ++persist_failures_;
        std::cerr << "[ModelCache] Persisting " << monitor_id << " failed: " << e.what() << std::endl;
    }
}

Resolution ModelCache::complete(const std::string& monitor_id, CacheEntry& entry, RefreshOutcome outcome) {
    std::lock_guard<std::mutex> lock(entry.mutex);
    const auto now = clock_();

    Resolution result;
    if (outcome.attempted_build) {
        entry.last_build_attempt = now;
    }
    if (outcome.abandoned_build.valid()) {
        entry.abandoned_build = outcome.abandoned_build;
    }

    if (outcome.artifact) {
        // Never replace a newer resident version with an older stored one
        if (!entry.artifact || outcome.artifact->version >= entry.artifact->version) {
            entry.artifact = outcome.artifact;
        }
        entry.last_load = now;
        entry.consecutive_failures = 0;
        entry.next_attempt = Clock::time_point{};
        result = Resolution{ResolveStatus::Fresh, entry.artifact, outcome.reason};
    } else {
        ++entry.consecutive_failures;
        entry.next_attempt = now + backoff_for(entry.consecutive_failures);
        std::cerr << "[ModelCache] Resolve for " << monitor_id << " failed ("
                  << entry.consecutive_failures << " in a row): " << outcome.reason << std::endl;
        result = fallback(entry.artifact, outcome.reason);
    }

    entry.in_flight = std::shared_future<Resolution>();
    return result;
}

Resolution ModelCache::fallback(const std::shared_ptr<const ModelArtifact>& stale, const std::string& reason) {
    if (stale) {
        ++degraded_;
        return Resolution{ResolveStatus::Degraded, stale, reason};
    }
    ++unavailable_;
    return Resolution{ResolveStatus::Unavailable, nullptr, reason};
}

ModelCache::Clock::duration ModelCache::backoff_for(size_t failures) const {
    int64_t delay = config_.backoff_base_ms;
    for (size_t i = 1; i < failures && delay < config_.backoff_max_ms; ++i) {
        delay *= 2;
    }
    return std::chrono::milliseconds(std::min(delay, config_.backoff_max_ms));
}

// ============================================
// Eviction
// ============================================

bool ModelCache::evictable(CacheEntry& entry) {
    if (entry.pins.load() > 0) {
        return false;
    }
    std::unique_lock<std::mutex> lock(entry.mutex, std::try_to_lock);
    if (!lock.owns_lock()) {
        return false;
    }
    return !entry.abandoned_build.valid() || settled(entry.abandoned_build);
}

void ModelCache::enforce_capacity() {
    while (entry_count_.load() > config_.capacity) {
        std::string victim;
        size_t victim_shard = 0;
        uint64_t oldest = std::numeric_limits<uint64_t>::max();
        bool victim_busy = false;

        for (size_t s = 0; s < shards_.size(); ++s) {
            std::lock_guard<std::mutex> lock(shards_[s].mutex);
            for (const auto& [id, entry] : shards_[s].entries) {
                uint64_t touched = entry->last_resolved.load();
                if (touched < oldest) {
                    oldest = touched;
                    victim = id;
                    victim_shard = s;
                    victim_busy = !evictable(*entry);
                }
            }
        }

        // The least recently resolved entry is mid-resolution or still has a
        // build running: a later resolve runs this again
        if (victim.empty() || victim_busy) {
            return;
        }

        Shard& shard = shards_[victim_shard];
        std::lock_guard<std::mutex> lock(shard.mutex);
        auto it = shard.entries.find(victim);
        if (it == shard.entries.end() || !evictable(*it->second) ||
            it->second->last_resolved.load() != oldest) {
            continue;  // touched or removed since the scan
        }
        // Reserve the slot so concurrent evictors never undershoot capacity
        size_t current = entry_count_.load();
        while (current > config_.capacity &&
               !entry_count_.compare_exchange_weak(current, current - 1)) {
        }
        if (current <= config_.capacity) {
            return;
        }

        shard.entries.erase(it);
        ++evictions_;
        std::cout << "[ModelCache] Evicted " << victim << " (capacity "
                  << config_.capacity << ")" << std::endl;
    }
}

} // namespace ai
} // namespace vigil
