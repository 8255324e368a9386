#pragma once
#ifndef VIGIL_AI_MODEL_CACHE_H
#define VIGIL_AI_MODEL_CACHE_H

#include "vigil/ai/model_artifact.h"
#include "vigil/ai/model_builder.h"
#include "vigil/ai/model_store.h"
#include "vigil/ai/trend_source.h"
#include "vigil/config.h"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace vigil {
namespace ai {

enum class ResolveStatus {
    Fresh,        // valid artifact within the freshness threshold
    Degraded,     // refresh failed, stale artifact returned
    Unavailable   // no artifact of any age
};

const char* to_string(ResolveStatus status);

struct Resolution {
    ResolveStatus status = ResolveStatus::Unavailable;
    std::shared_ptr<const ModelArtifact> artifact;
    std::string reason;

    bool usable() const { return status != ResolveStatus::Unavailable && artifact != nullptr; }
    bool degraded() const { return status == ResolveStatus::Degraded; }
};

struct CacheStats {
    size_t entries = 0;
    uint64_t hits = 0;
    uint64_t loads = 0;
    uint64_t builds = 0;
    uint64_t load_failures = 0;
    uint64_t build_failures = 0;
    uint64_t persist_failures = 0;
    uint64_t degraded = 0;
    uint64_t unavailable = 0;
    uint64_t coalesced = 0;
    uint64_t evictions = 0;
    uint64_t timeouts = 0;

    nlohmann::json to_json() const;
};

// Per-monitor artifact cache. Entries live in independently locked shards and
// each entry carries its own mutex; concurrent resolves of one stale key share
// a single in-flight future, so a key is never loaded or built twice at once.
class ModelCache {
public:
    using Clock = std::chrono::steady_clock;
    using ClockFn = std::function<Clock::time_point()>;

    ModelCache(CacheConfig config,
               std::shared_ptr<IModelStore> store,
               std::shared_ptr<IModelBuilder> builder,
               std::shared_ptr<ITrendSource> trends,
               ClockFn clock = ClockFn());
    ~ModelCache() = default;

    ModelCache(const ModelCache&) = delete;
    ModelCache& operator=(const ModelCache&) = delete;

    // Never throws for store/build failures; see Resolution::status
    Resolution resolve(const std::string& monitor_id);

    bool contains(const std::string& monitor_id) const;
    size_t size() const { return entry_count_.load(); }
    CacheStats stats() const;

    // Further resolves return Unavailable; in-flight ones complete normally
    void shutdown();

private:
    struct CacheEntry {
        std::mutex mutex;
        std::shared_ptr<const ModelArtifact> artifact;
        Clock::time_point last_load{};
        Clock::time_point last_build_attempt{};
        Clock::time_point next_attempt{};
        size_t consecutive_failures = 0;
        std::shared_future<Resolution> in_flight;
        // Build that outlived build_timeout_ms; no new build starts until it settles
        std::shared_future<ArtifactBytes> abandoned_build;

        std::atomic<uint64_t> last_resolved{0};
        // Resolves between entry_for() and their return; pinned entries are not evicted
        std::atomic<size_t> pins{0};
    };

    struct Shard {
        mutable std::mutex mutex;
        std::unordered_map<std::string, std::shared_ptr<CacheEntry>> entries;
    };

    // Result of one load/build pass, applied to the entry afterwards
    struct RefreshOutcome {
        std::shared_ptr<const ModelArtifact> artifact;
        bool built = false;
        bool attempted_build = false;
        std::string reason;
        std::shared_future<ArtifactBytes> abandoned_build;
    };

    Shard& shard_for(const std::string& monitor_id) const;
    std::shared_ptr<CacheEntry> entry_for(const std::string& monitor_id);

    Resolution resolve_pinned(const std::string& monitor_id, CacheEntry& entry);
    RefreshOutcome refresh(const std::string& monitor_id, std::shared_future<ArtifactBytes> finished_build);
    std::shared_ptr<const ModelArtifact> load_from_store(const std::string& monitor_id, std::string& reason);
    std::shared_ptr<const ModelArtifact> build_fresh(const std::string& monitor_id, std::string& reason,
                                                     std::shared_future<ArtifactBytes>& abandoned);
    std::shared_ptr<const ModelArtifact> adopt_build(const std::string& monitor_id, const ArtifactBytes& bytes,
                                                     std::string& reason);
    void persist(const std::string& monitor_id, const ArtifactBytes& bytes);

    Resolution complete(const std::string& monitor_id, CacheEntry& entry, RefreshOutcome outcome);
    Resolution fallback(const std::shared_ptr<const ModelArtifact>& stale, const std::string& reason);
    Clock::duration backoff_for(size_t failures) const;
    static bool evictable(CacheEntry& entry);
    void enforce_capacity();

    CacheConfig config_;
    std::shared_ptr<IModelStore> store_;
    std::shared_ptr<IModelBuilder> builder_;
    std::shared_ptr<ITrendSource> trends_;
    ClockFn clock_;

    mutable std::vector<Shard> shards_;
    std::atomic<size_t> entry_count_{0};
    std::atomic<uint64_t> tick_{0};
    std::atomic<bool> shutting_down_{false};

    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> loads_{0};
    std::atomic<uint64_t> builds_{0};
    std::atomic<uint64_t> load_failures_{0};
    std::atomic<uint64_t> build_failures_{0};
    std::atomic<uint64_t> persist_failures_{0};
    std::atomic<uint64_t> degraded_{0};
    std::atomic<uint64_t> unavailable_{0};
    std::atomic<uint64_t> coalesced_{0};
    std::atomic<uint64_t> evictions_{0};
    std::atomic<uint64_t> timeouts_{0};
};

} // namespace ai
} // namespace vigil

#endif // VIGIL_AI_MODEL_CACHE_H
