#pragma once

#include <atomic>
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/media_types.hpp"

struct ClipCacheConfig
{
    std::string cache_dir = "clips";
    std::uintmax_t max_size_bytes = 2048ULL * 1024 * 1024;
    int64_t max_age_seconds = 86400; // 0 disables the age bound
    std::string container = "mp4";
};

struct ClipCacheStats
{
    size_t entries = 0;
    std::uintmax_t bytes = 0;
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t extractions = 0;
    uint64_t coalesced_waits = 0;
    uint64_t evictions = 0;
};

/**
 * @brief Content-addressed store of synthesized clips, keyed by fingerprint
 *
 * Each artifact is written to a temp file and renamed into place next to a JSON
 * sidecar describing it, so a reader never sees a partial clip and the index can be
 * rebuilt with restore(). File names are unique per publication; an artifact evicted
 * while a response still holds it keeps its file until the last reference is released.
 */
class ClipCache
{
public:
    explicit ClipCache(ClipCacheConfig config = ClipCacheConfig());

    ClipCache(const ClipCache &) = delete;
    ClipCache &operator=(const ClipCache &) = delete;

    /**
     * @brief Look up an artifact, counting the hit or miss
     *
     * An artifact older than the age bound is a miss even before evict() removes it.
     */
    ClipArtifactRef lookup(const std::string &fingerprint);

    /**
     * @brief Look up an artifact without touching the statistics
     */
    ClipArtifactRef peek(const std::string &fingerprint) const;

    /**
     * @brief Write clip bytes and publish them under the fingerprint
     *
     * Replaces any artifact already published for the fingerprint.
     * @throws MediaExtractionError when the file cannot be written
     */
    ClipArtifactRef publish(const std::string &fingerprint, const std::string &video_id, double start, double end,
                            const std::vector<uint8_t> &bytes);

    /**
     * @brief Rebuild the index from the cache directory
     * @return Number of artifacts restored
     */
    size_t restore();

    /**
     * @brief Apply the age bound, then the size bound (oldest first)
     * @return Number of artifacts evicted
     */
    size_t evict();

    void recordExtraction() { extractions_.fetch_add(1); }
    void recordCoalescedWait() { coalesced_waits_.fetch_add(1); }

    ClipCacheStats stats() const;
    const ClipCacheConfig &config() const { return config_; }

private:
    // Caller holds the exclusive lock
    void dropLocked(const std::string &fingerprint);
    static std::filesystem::path sidecarFor(const std::filesystem::path &clip_path);
    bool isExpired(const ClipArtifact &artifact, std::time_t now) const;
    static bool isValidSidecar(const nlohmann::json &meta);

    ClipCacheConfig config_;
    std::filesystem::path dir_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, ClipArtifactRef> entries_;
    std::uintmax_t total_bytes_ = 0;

    std::atomic<uint64_t> publish_counter_{0};
    mutable std::atomic<uint64_t> hits_{0};
    mutable std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> extractions_{0};
    std::atomic<uint64_t> coalesced_waits_{0};
    std::atomic<uint64_t> evictions_{0};
};
