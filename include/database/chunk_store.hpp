#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <sqlite3.h>
#include "core/media_types.hpp"

struct DBOpResult
{
    bool success;
    std::string error_message;
    DBOpResult(bool s = true, const std::string &msg = "") : success(s), error_message(msg) {}
};

/**
 * @brief SQLite catalog of videos, their transcript chunks and embedding bookkeeping
 *
 * One connection serialized by a mutex. Pass ":memory:" for a private in-memory catalog.
 */
class ChunkStore
{
public:
    explicit ChunkStore(const std::string &db_path);
    ~ChunkStore();

    ChunkStore(const ChunkStore &) = delete;
    ChunkStore &operator=(const ChunkStore &) = delete;

    bool isOpen() const;
    const std::string &path() const { return db_path_; }

    // Videos
    DBOpResult registerVideo(const VideoAsset &video);
    std::optional<VideoAsset> getVideo(const std::string &video_id) const;
    std::vector<VideoAsset> listVideos() const;

    /**
     * @brief Remove a video together with its chunks and embedding records
     * @param removed_chunk_ids Receives the ids of the chunks that were deleted
     */
    DBOpResult removeVideo(const std::string &video_id, std::vector<std::string> *removed_chunk_ids = nullptr);

    // Chunks
    /**
     * @brief Atomically supersede the chunk set of a video
     * @param video_id Video whose chunks are replaced
     * @param chunks New chunk set
     * @param superseded_ids Receives ids of previous chunks absent from the new set
     * @return Operation result
     */
    DBOpResult replaceChunks(const std::string &video_id,
                             const std::vector<TranscriptChunk> &chunks,
                             std::vector<std::string> *superseded_ids = nullptr);

    std::optional<TranscriptChunk> getChunk(const std::string &chunk_id) const;
    std::vector<TranscriptChunk> getChunks(const std::vector<std::string> &chunk_ids) const;
    std::vector<TranscriptChunk> getChunksForVideo(const std::string &video_id) const;
    size_t chunkCount() const;

    // Embedding bookkeeping
    DBOpResult recordEmbedding(const std::string &chunk_id, const std::string &model_id, size_t dimensions);
    std::optional<std::string> embeddingModelFor(const std::string &chunk_id) const;

private:
    bool initialize();
    DBOpResult executeStatement(const std::string &sql);
    std::vector<std::string> chunkIdsForVideo(const std::string &video_id) const;
    static TranscriptChunk readChunk(sqlite3_stmt *stmt);

    sqlite3 *db_;
    std::string db_path_;
    mutable std::mutex mutex_;
};
