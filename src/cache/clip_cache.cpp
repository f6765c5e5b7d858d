#include "core/cache/clip_cache.hpp"
#include "core/errors.hpp"
#include "core/file_utils.hpp"
#include "logging/logger.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <chrono>
#include <fstream>
#include <mutex>
#include <set>

using json = nlohmann::json;

ClipCache::ClipCache(ClipCacheConfig config)
    : config_(std::move(config)), dir_(config_.cache_dir)
{
    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec)
    {
        Logger::error("Failed to create clip cache directory " + dir_.string() + ": " + ec.message());
    }
    Logger::info("ClipCache initialized at " + dir_.string() + " with max size: " +
                 std::to_string(config_.max_size_bytes / (1024 * 1024)) + " MB, max age: " +
                 std::to_string(config_.max_age_seconds) + "s");
}

fs::path ClipCache::sidecarFor(const fs::path &clip_path)
{
    fs::path sidecar = clip_path;
    sidecar.replace_extension(".json");
    return sidecar;
}

ClipArtifactRef ClipCache::lookup(const std::string &fingerprint)
{
    ClipArtifactRef artifact = peek(fingerprint);
    if (artifact)
        hits_.fetch_add(1);
    else
        misses_.fetch_add(1);
    return artifact;
}

ClipArtifactRef ClipCache::peek(const std::string &fingerprint) const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = entries_.find(fingerprint);
    if (it == entries_.end() || isExpired(*it->second, std::time(nullptr)))
        return nullptr;
    return it->second;
}

bool ClipCache::isExpired(const ClipArtifact &artifact, std::time_t now) const
{
    return config_.max_age_seconds > 0 && now - artifact.createdAt() > config_.max_age_seconds;
}

ClipArtifactRef ClipCache::publish(const std::string &fingerprint, const std::string &video_id, double start,
                                   double end, const std::vector<uint8_t> &bytes)
{
    auto now = std::chrono::system_clock::now();
    auto epoch_ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
    std::time_t created_at = std::chrono::system_clock::to_time_t(now);

    const std::string stem = fingerprint + "-" + std::to_string(epoch_ms) + "-" +
                             std::to_string(publish_counter_.fetch_add(1));
    const fs::path clip_path = dir_ / (stem + "." + config_.container);

    if (!FileUtils::writeFileAtomically(clip_path, bytes))
    {
        throw MediaExtractionError("Failed to write clip file " + clip_path.string());
    }

    json sidecar = {{"fingerprint", fingerprint},
                    {"video_id", video_id},
                    {"start", start},
                    {"end", end},
                    {"file", clip_path.filename().string()},
                    {"created_at", static_cast<int64_t>(created_at)}};
    if (!FileUtils::writeFileAtomically(sidecarFor(clip_path), sidecar.dump(2)))
    {
        std::error_code ec;
        fs::remove(clip_path, ec);
        throw MediaExtractionError("Failed to write clip metadata for " + clip_path.string());
    }

    auto artifact = std::make_shared<const ClipArtifact>(fingerprint, video_id, start, end, clip_path,
                                                         static_cast<std::uintmax_t>(bytes.size()), created_at);
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        if (entries_.count(fingerprint))
        {
            dropLocked(fingerprint);
        }
        entries_[fingerprint] = artifact;
        total_bytes_ += artifact->sizeBytes();
    }

    Logger::debug("Published clip " + clip_path.filename().string() + " (" + std::to_string(bytes.size()) + " bytes)");
    return artifact;
}

void ClipCache::dropLocked(const std::string &fingerprint)
{
    auto it = entries_.find(fingerprint);
    if (it == entries_.end())
        return;

    const ClipArtifactRef &artifact = it->second;
    std::error_code ec;
    fs::remove(sidecarFor(artifact->path()), ec);
    // The clip file itself goes with the last reference
    artifact->markEvicted();
    total_bytes_ -= std::min(total_bytes_, artifact->sizeBytes());
    entries_.erase(it);
    evictions_.fetch_add(1);
}

bool ClipCache::isValidSidecar(const json &meta)
{
    if (meta.is_discarded() || !meta.is_object())
        return false;
    if (!meta.contains("fingerprint") || !meta["fingerprint"].is_string() || !meta.contains("file") ||
        !meta["file"].is_string())
        return false;
    if (meta["fingerprint"].get<std::string>().empty())
        return false;

    // Only a bare file name, so eviction can never reach outside the cache directory
    const std::string file = meta["file"].get<std::string>();
    const fs::path file_path(file);
    if (file.empty() || file_path.filename().string() != file || file == "." || file == "..")
        return false;
    if (file_path.extension() == ".json")
        return false;

    if (meta.contains("video_id") && !meta["video_id"].is_string())
        return false;
    for (const char *key : {"start", "end", "created_at"})
    {
        if (meta.contains(key) && !meta[key].is_number())
            return false;
    }
    return true;
}

size_t ClipCache::restore()
{
    std::unique_lock<std::shared_mutex> lock(mutex_);

    std::error_code ec;
    if (!fs::is_directory(dir_, ec))
    {
        Logger::warn("Clip cache directory does not exist: " + dir_.string());
        return 0;
    }

    std::vector<fs::path> sidecars;
    std::vector<fs::path> clips;
    for (const auto &entry : fs::directory_iterator(dir_, ec))
    {
        std::error_code entry_ec;
        if (!entry.is_regular_file(entry_ec))
            continue;
        const std::string name = entry.path().filename().string();
        if (name.find(".tmp.") != std::string::npos)
        {
            // Leftover of an interrupted write
            fs::remove(entry.path(), entry_ec);
            continue;
        }
        if (entry.path().extension() == ".json")
            sidecars.push_back(entry.path());
        else
            clips.push_back(entry.path());
    }

    std::set<fs::path> referenced;
    for (const auto &sidecar_path : sidecars)
    {
        std::ifstream in(sidecar_path);
        json meta = json::parse(in, nullptr, false);
        if (!isValidSidecar(meta))
        {
            Logger::warn("Removing unreadable clip metadata: " + sidecar_path.string());
            fs::remove(sidecar_path, ec);
            continue;
        }

        fs::path clip_path = dir_ / meta["file"].get<std::string>();
        std::error_code size_ec;
        std::uintmax_t size = fs::file_size(clip_path, size_ec);
        if (size_ec)
        {
            Logger::warn("Clip metadata without clip file, removing: " + sidecar_path.string());
            fs::remove(sidecar_path, ec);
            continue;
        }

        auto artifact = std::make_shared<const ClipArtifact>(
            meta["fingerprint"].get<std::string>(), meta.value("video_id", std::string()),
            meta.value("start", 0.0), meta.value("end", 0.0), clip_path, size,
            static_cast<std::time_t>(meta.value("created_at", static_cast<int64_t>(0))));

        // Keep the newest publication of each fingerprint
        auto existing = entries_.find(artifact->fingerprint());
        if (existing != entries_.end())
        {
            if (existing->second->path() == clip_path)
            {
                referenced.insert(clip_path);
                continue;
            }
            if (existing->second->createdAt() >= artifact->createdAt())
            {
                artifact->markEvicted();
                fs::remove(sidecar_path, ec);
                continue;
            }
            referenced.erase(existing->second->path());
            dropLocked(artifact->fingerprint());
            evictions_.fetch_sub(1);
        }

        entries_[artifact->fingerprint()] = artifact;
        total_bytes_ += size;
        referenced.insert(clip_path);
    }

    for (const auto &clip : clips)
    {
        if (!referenced.count(clip))
        {
            Logger::debug("Removing orphaned clip file: " + clip.string());
            fs::remove(clip, ec);
        }
    }

    size_t restored = entries_.size();
    Logger::info("Restored " + std::to_string(restored) + " clips (" + std::to_string(total_bytes_) +
                 " bytes) from " + dir_.string());
    return restored;
}

size_t ClipCache::evict()
{
    std::unique_lock<std::shared_mutex> lock(mutex_);
    size_t evicted = 0;

    const std::time_t now = std::time(nullptr);
    std::vector<std::string> expired;
    for (const auto &entry : entries_)
    {
        if (isExpired(*entry.second, now))
            expired.push_back(entry.first);
    }
    for (const auto &fingerprint : expired)
    {
        dropLocked(fingerprint);
        ++evicted;
    }

    if (total_bytes_ > config_.max_size_bytes)
    {
        std::vector<ClipArtifactRef> by_age;
        by_age.reserve(entries_.size());
        for (const auto &entry : entries_)
            by_age.push_back(entry.second);
        std::sort(by_age.begin(), by_age.end(), [](const ClipArtifactRef &a, const ClipArtifactRef &b)
                  {
            if (a->createdAt() != b->createdAt())
                return a->createdAt() < b->createdAt();
            return a->path() < b->path(); });

        for (const auto &artifact : by_age)
        {
            if (total_bytes_ <= config_.max_size_bytes)
                break;
            dropLocked(artifact->fingerprint());
            ++evicted;
        }
    }

    if (evicted > 0)
    {
        Logger::info("Evicted " + std::to_string(evicted) + " clips, cache now holds " +
                     std::to_string(entries_.size()) + " clips (" + std::to_string(total_bytes_) + " bytes)");
    }
    return evicted;
}

ClipCacheStats ClipCache::stats() const
{
    ClipCacheStats stats;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        stats.entries = entries_.size();
        stats.bytes = total_bytes_;
    }
    stats.hits = hits_.load();
    stats.misses = misses_.load();
    stats.extractions = extractions_.load();
    stats.coalesced_waits = coalesced_waits_.load();
    stats.evictions = evictions_.load();
    return stats;
}
