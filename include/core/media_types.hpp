#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

/**
 * @brief A registered lecture video. Immutable once registered.
 */
struct VideoAsset
{
    std::string id;
    std::string media_path;
    double duration_seconds = 0.0;
    double frame_rate = 0.0;                     // Native frame rate of the video stream
    double frame_sample_interval_seconds = 0.0;  // Period used when sampling FrameSamples
};

/**
 * @brief One timed-text cue. Owned by its VideoAsset; video_id is a back-reference.
 */
struct SubtitleCue
{
    std::string video_id;
    double start = 0.0;
    double end = 0.0;
    std::string text;
};

/**
 * @brief A frame extracted at a fixed interval
 */
struct FrameSample
{
    std::string video_id;
    double timestamp = 0.0;
    std::string image_ref; // Path of the stored image
};

/**
 * @brief Merged, time-bounded unit of transcript text; the atomic retrieval unit.
 *
 * Invariants: start < end, range inside the video duration, duration <= configured maximum.
 */
struct TranscriptChunk
{
    std::string id;
    std::string video_id;
    double start = 0.0;
    double end = 0.0;
    std::string text;
    std::optional<FrameSample> frame;

    double duration() const { return end - start; }
};

/**
 * @brief Deterministic chunk identifier: "<video_id>#<start_ms>-<end_ms>"
 */
std::string makeChunkId(const std::string &video_id, double start, double end);

struct EmbeddingVector
{
    std::string chunk_id;
    std::vector<float> values;
    std::string model_id;
};

/**
 * @brief Ranked retrieval hit. Ephemeral, lives for one query.
 *
 * After deduplication chunk.start/chunk.end hold the union of the merged group and
 * merged_chunk_ids lists every chunk folded into this result.
 */
struct SearchResult
{
    TranscriptChunk chunk;
    double score = 0.0;
    int rank = 0;
    std::vector<std::string> merged_chunk_ids;
};

/**
 * @brief A synthesized clip on disk, addressed by its fingerprint.
 *
 * Shared between the clip cache index and any response still holding it. Once the
 * cache evicts an artifact the backing file is removed when the last holder lets go.
 */
class ClipArtifact
{
public:
    ClipArtifact(std::string fingerprint, std::string video_id, double start, double end,
                 std::filesystem::path path, std::uintmax_t size_bytes, std::time_t created_at)
        : fingerprint_(std::move(fingerprint)), video_id_(std::move(video_id)), start_(start), end_(end),
          path_(std::move(path)), size_bytes_(size_bytes), created_at_(created_at) {}

    ~ClipArtifact()
    {
        if (evicted_.load())
        {
            std::error_code ec;
            std::filesystem::remove(path_, ec);
        }
    }

    ClipArtifact(const ClipArtifact &) = delete;
    ClipArtifact &operator=(const ClipArtifact &) = delete;

    const std::string &fingerprint() const { return fingerprint_; }
    const std::string &videoId() const { return video_id_; }
    double start() const { return start_; }
    double end() const { return end_; }
    const std::filesystem::path &path() const { return path_; }
    std::uintmax_t sizeBytes() const { return size_bytes_; }
    std::time_t createdAt() const { return created_at_; }

    bool isEvicted() const { return evicted_.load(); }
    void markEvicted() const { evicted_.store(true); }

private:
    std::string fingerprint_;
    std::string video_id_;
    double start_;
    double end_;
    std::filesystem::path path_;
    std::uintmax_t size_bytes_;
    std::time_t created_at_;
    mutable std::atomic<bool> evicted_{false};
};

using ClipArtifactRef = std::shared_ptr<const ClipArtifact>;

/**
 * @brief Caller options for one query
 */
struct QueryOptions
{
    int top_k = 5;
    double min_score = 0.3;
    bool include_clip = true;
};

enum class QueryState
{
    Received,
    Embedding,
    Retrieving,
    Synthesizing,
    Composing,
    Assembled,
    Done,
    Failed
};

std::string queryStateName(QueryState state);

enum class QueryStatus
{
    Complete,
    Degraded
};

/**
 * @brief Outcome of one answered query. Returned to the caller, never persisted.
 */
struct QueryResult
{
    std::uint64_t query_id = 0;
    std::string query;
    std::string answer;
    bool has_answer = false;
    bool insufficient_grounding = false;
    std::vector<SearchResult> results;
    ClipArtifactRef clip;
    std::chrono::milliseconds latency{0};

    QueryStatus status = QueryStatus::Complete;
    bool retrieval_timed_out = false;
    bool clip_failed = false;
    bool answer_failed = false;
    std::vector<std::string> degradation_reasons;
    std::vector<QueryState> states;
};
