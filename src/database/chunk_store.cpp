#include "database/chunk_store.hpp"
#include "logging/logger.hpp"
#include <unordered_set>

ChunkStore::ChunkStore(const std::string &db_path)
    : db_(nullptr), db_path_(db_path)
{
    Logger::info("ChunkStore opening database: " + db_path);
    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK)
    {
        Logger::error("Failed to open database: " + std::string(sqlite3_errmsg(db_)));
        sqlite3_close(db_);
        db_ = nullptr;
        return;
    }

    if (db_path != ":memory:")
    {
        rc = sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
        if (rc != SQLITE_OK)
        {
            Logger::warn("Failed to enable WAL mode: " + std::string(sqlite3_errmsg(db_)));
        }
        sqlite3_exec(db_, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);
    }

    // Enable foreign key support
    rc = sqlite3_exec(db_, "PRAGMA foreign_keys=ON;", nullptr, nullptr, nullptr);
    if (rc != SQLITE_OK)
    {
        Logger::warn("Failed to enable foreign keys: " + std::string(sqlite3_errmsg(db_)));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!initialize())
    {
        Logger::error("ChunkStore table initialization failed for: " + db_path);
    }
}

ChunkStore::~ChunkStore()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_)
    {
        sqlite3_close(db_);
        db_ = nullptr;
        Logger::debug("ChunkStore connection closed");
    }
}

bool ChunkStore::isOpen() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return db_ != nullptr;
}

bool ChunkStore::initialize()
{
    const std::string videos_sql = R"(
        CREATE TABLE IF NOT EXISTS videos (
            id TEXT PRIMARY KEY,
            media_path TEXT NOT NULL,
            duration REAL NOT NULL,
            frame_rate REAL,
            frame_sample_interval REAL,
            created_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP
        )
    )";
    const std::string chunks_sql = R"(
        CREATE TABLE IF NOT EXISTS chunks (
            id TEXT PRIMARY KEY,
            video_id TEXT NOT NULL,
            start_seconds REAL NOT NULL,
            end_seconds REAL NOT NULL,
            text TEXT NOT NULL,
            frame_timestamp REAL,         -- NULL when the video has no frame samples
            frame_ref TEXT,
            generation INTEGER NOT NULL,  -- Ingestion generation that produced the chunk
            FOREIGN KEY (video_id) REFERENCES videos(id) ON DELETE CASCADE
        )
    )";
    const std::string embeddings_sql = R"(
        CREATE TABLE IF NOT EXISTS embeddings (
            chunk_id TEXT PRIMARY KEY,
            model_id TEXT NOT NULL,
            dimensions INTEGER NOT NULL,
            updated_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP,
            FOREIGN KEY (chunk_id) REFERENCES chunks(id) ON DELETE CASCADE
        )
    )";
    const std::string index_sql = "CREATE INDEX IF NOT EXISTS idx_chunks_video ON chunks(video_id, start_seconds)";

    return executeStatement(videos_sql).success && executeStatement(chunks_sql).success &&
           executeStatement(embeddings_sql).success && executeStatement(index_sql).success;
}

DBOpResult ChunkStore::executeStatement(const std::string &sql)
{
    if (!db_)
    {
        return DBOpResult(false, "Database not initialized");
    }
    char *err_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK)
    {
        std::string error_msg = "SQL execution failed: " + std::string(err_msg ? err_msg : "unknown error");
        Logger::error(error_msg);
        sqlite3_free(err_msg);
        return DBOpResult(false, error_msg);
    }
    return DBOpResult(true);
}

DBOpResult ChunkStore::registerVideo(const VideoAsset &video)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_)
        return DBOpResult(false, "Database not initialized");

    // Upsert rather than REPLACE so existing chunks are not cascaded away
    const std::string sql = R"(
        INSERT INTO videos (id, media_path, duration, frame_rate, frame_sample_interval)
        VALUES (?, ?, ?, ?, ?)
        ON CONFLICT(id) DO UPDATE SET
            media_path = excluded.media_path,
            duration = excluded.duration,
            frame_rate = excluded.frame_rate,
            frame_sample_interval = excluded.frame_sample_interval
    )";
    sqlite3_stmt *stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK)
    {
        return DBOpResult(false, "Failed to prepare statement: " + std::string(sqlite3_errmsg(db_)));
    }
    sqlite3_bind_text(stmt, 1, video.id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, video.media_path.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_double(stmt, 3, video.duration_seconds);
    sqlite3_bind_double(stmt, 4, video.frame_rate);
    sqlite3_bind_double(stmt, 5, video.frame_sample_interval_seconds);
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE)
    {
        std::string msg = "Failed to register video " + video.id + ": " + sqlite3_errmsg(db_);
        Logger::error(msg);
        return DBOpResult(false, msg);
    }
    Logger::debug("Registered video " + video.id + " (" + std::to_string(video.duration_seconds) + "s)");
    return DBOpResult(true);
}

std::optional<VideoAsset> ChunkStore::getVideo(const std::string &video_id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_)
        return std::nullopt;

    const std::string sql = "SELECT id, media_path, duration, frame_rate, frame_sample_interval FROM videos WHERE id = ?";
    sqlite3_stmt *stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK)
    {
        Logger::error("Failed to prepare video lookup: " + std::string(sqlite3_errmsg(db_)));
        return std::nullopt;
    }
    sqlite3_bind_text(stmt, 1, video_id.c_str(), -1, SQLITE_TRANSIENT);

    std::optional<VideoAsset> result;
    if (sqlite3_step(stmt) == SQLITE_ROW)
    {
        VideoAsset video;
        video.id = reinterpret_cast<const char *>(sqlite3_column_text(stmt, 0));
        video.media_path = reinterpret_cast<const char *>(sqlite3_column_text(stmt, 1));
        video.duration_seconds = sqlite3_column_double(stmt, 2);
        video.frame_rate = sqlite3_column_double(stmt, 3);
        video.frame_sample_interval_seconds = sqlite3_column_double(stmt, 4);
        result = video;
    }
    sqlite3_finalize(stmt);
    return result;
}

std::vector<VideoAsset> ChunkStore::listVideos() const
{
    std::vector<VideoAsset> videos;
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!db_)
            return videos;
        sqlite3_stmt *stmt = nullptr;
        if (sqlite3_prepare_v2(db_, "SELECT id FROM videos ORDER BY id", -1, &stmt, nullptr) != SQLITE_OK)
            return videos;
        while (sqlite3_step(stmt) == SQLITE_ROW)
            ids.emplace_back(reinterpret_cast<const char *>(sqlite3_column_text(stmt, 0)));
        sqlite3_finalize(stmt);
    }
    for (const auto &id : ids)
    {
        if (auto video = getVideo(id))
            videos.push_back(*video);
    }
    return videos;
}

DBOpResult ChunkStore::removeVideo(const std::string &video_id, std::vector<std::string> *removed_chunk_ids)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_)
        return DBOpResult(false, "Database not initialized");

    if (removed_chunk_ids)
        *removed_chunk_ids = chunkIdsForVideo(video_id);

    sqlite3_stmt *stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "DELETE FROM videos WHERE id = ?", -1, &stmt, nullptr) != SQLITE_OK)
    {
        return DBOpResult(false, "Failed to prepare statement: " + std::string(sqlite3_errmsg(db_)));
    }
    sqlite3_bind_text(stmt, 1, video_id.c_str(), -1, SQLITE_TRANSIENT);
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE)
    {
        return DBOpResult(false, "Failed to remove video " + video_id + ": " + sqlite3_errmsg(db_));
    }
    Logger::info("Removed video " + video_id + " and its chunks");
    return DBOpResult(true);
}

std::vector<std::string> ChunkStore::chunkIdsForVideo(const std::string &video_id) const
{
    std::vector<std::string> ids;
    sqlite3_stmt *stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "SELECT id FROM chunks WHERE video_id = ?", -1, &stmt, nullptr) != SQLITE_OK)
        return ids;
    sqlite3_bind_text(stmt, 1, video_id.c_str(), -1, SQLITE_TRANSIENT);
    while (sqlite3_step(stmt) == SQLITE_ROW)
        ids.emplace_back(reinterpret_cast<const char *>(sqlite3_column_text(stmt, 0)));
    sqlite3_finalize(stmt);
    return ids;
}

DBOpResult ChunkStore::replaceChunks(const std::string &video_id,
                                     const std::vector<TranscriptChunk> &chunks,
                                     std::vector<std::string> *superseded_ids)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_)
        return DBOpResult(false, "Database not initialized");

    for (const auto &chunk : chunks)
    {
        if (chunk.video_id != video_id)
        {
            return DBOpResult(false, "Chunk " + chunk.id + " does not belong to video " + video_id);
        }
    }

    auto begin = executeStatement("BEGIN IMMEDIATE");
    if (!begin.success)
        return begin;

    auto rollback = [this](const std::string &msg)
    {
        executeStatement("ROLLBACK");
        Logger::error(msg);
        return DBOpResult(false, msg);
    };

    std::vector<std::string> previous = chunkIdsForVideo(video_id);

    sqlite3_int64 generation = 1;
    {
        sqlite3_stmt *stmt = nullptr;
        if (sqlite3_prepare_v2(db_, "SELECT COALESCE(MAX(generation), 0) + 1 FROM chunks WHERE video_id = ?", -1, &stmt, nullptr) != SQLITE_OK)
            return rollback("Failed to prepare generation query: " + std::string(sqlite3_errmsg(db_)));
        sqlite3_bind_text(stmt, 1, video_id.c_str(), -1, SQLITE_TRANSIENT);
        if (sqlite3_step(stmt) == SQLITE_ROW)
            generation = sqlite3_column_int64(stmt, 0);
        sqlite3_finalize(stmt);
    }

    const std::string upsert_sql = R"(
        INSERT INTO chunks (id, video_id, start_seconds, end_seconds, text, frame_timestamp, frame_ref, generation)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?)
        ON CONFLICT(id) DO UPDATE SET
            start_seconds = excluded.start_seconds,
            end_seconds = excluded.end_seconds,
            text = excluded.text,
            frame_timestamp = excluded.frame_timestamp,
            frame_ref = excluded.frame_ref,
            generation = excluded.generation
    )";
    sqlite3_stmt *stmt = nullptr;
    if (sqlite3_prepare_v2(db_, upsert_sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK)
        return rollback("Failed to prepare chunk upsert: " + std::string(sqlite3_errmsg(db_)));

    for (const auto &chunk : chunks)
    {
        sqlite3_reset(stmt);
        sqlite3_clear_bindings(stmt);
        sqlite3_bind_text(stmt, 1, chunk.id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, chunk.video_id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_double(stmt, 3, chunk.start);
        sqlite3_bind_double(stmt, 4, chunk.end);
        sqlite3_bind_text(stmt, 5, chunk.text.c_str(), -1, SQLITE_TRANSIENT);
        if (chunk.frame)
        {
            sqlite3_bind_double(stmt, 6, chunk.frame->timestamp);
            sqlite3_bind_text(stmt, 7, chunk.frame->image_ref.c_str(), -1, SQLITE_TRANSIENT);
        }
        else
        {
            sqlite3_bind_null(stmt, 6);
            sqlite3_bind_null(stmt, 7);
        }
        sqlite3_bind_int64(stmt, 8, generation);
        if (sqlite3_step(stmt) != SQLITE_DONE)
        {
            std::string msg = "Failed to store chunk " + chunk.id + ": " + sqlite3_errmsg(db_);
            sqlite3_finalize(stmt);
            return rollback(msg);
        }
    }
    sqlite3_finalize(stmt);

    stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "DELETE FROM chunks WHERE video_id = ? AND generation < ?", -1, &stmt, nullptr) != SQLITE_OK)
        return rollback("Failed to prepare chunk cleanup: " + std::string(sqlite3_errmsg(db_)));
    sqlite3_bind_text(stmt, 1, video_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 2, generation);
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE)
        return rollback("Failed to delete superseded chunks: " + std::string(sqlite3_errmsg(db_)));

    auto commit = executeStatement("COMMIT");
    if (!commit.success)
        return rollback(commit.error_message);

    std::unordered_set<std::string> current;
    for (const auto &chunk : chunks)
        current.insert(chunk.id);
    std::vector<std::string> superseded;
    for (const auto &id : previous)
    {
        if (current.count(id) == 0)
            superseded.push_back(id);
    }
    if (superseded_ids)
        *superseded_ids = superseded;

    Logger::info("Stored " + std::to_string(chunks.size()) + " chunks for video " + video_id + " (generation " +
                 std::to_string(generation) + ", " + std::to_string(superseded.size()) + " superseded)");
    return DBOpResult(true);
}

TranscriptChunk ChunkStore::readChunk(sqlite3_stmt *stmt)
{
    TranscriptChunk chunk;
    chunk.id = reinterpret_cast<const char *>(sqlite3_column_text(stmt, 0));
    chunk.video_id = reinterpret_cast<const char *>(sqlite3_column_text(stmt, 1));
    chunk.start = sqlite3_column_double(stmt, 2);
    chunk.end = sqlite3_column_double(stmt, 3);
    chunk.text = reinterpret_cast<const char *>(sqlite3_column_text(stmt, 4));
    if (sqlite3_column_type(stmt, 5) != SQLITE_NULL)
    {
        FrameSample frame;
        frame.video_id = chunk.video_id;
        frame.timestamp = sqlite3_column_double(stmt, 5);
        const unsigned char *ref = sqlite3_column_text(stmt, 6);
        frame.image_ref = ref ? reinterpret_cast<const char *>(ref) : "";
        chunk.frame = frame;
    }
    return chunk;
}

std::optional<TranscriptChunk> ChunkStore::getChunk(const std::string &chunk_id) const
{
    auto chunks = getChunks({chunk_id});
    if (chunks.empty())
        return std::nullopt;
    return chunks.front();
}

std::vector<TranscriptChunk> ChunkStore::getChunks(const std::vector<std::string> &chunk_ids) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TranscriptChunk> chunks;
    if (!db_ || chunk_ids.empty())
        return chunks;

    const std::string sql = "SELECT id, video_id, start_seconds, end_seconds, text, frame_timestamp, frame_ref FROM chunks WHERE id = ?";
    sqlite3_stmt *stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK)
    {
        Logger::error("Failed to prepare chunk lookup: " + std::string(sqlite3_errmsg(db_)));
        return chunks;
    }
    for (const auto &id : chunk_ids)
    {
        sqlite3_reset(stmt);
        sqlite3_bind_text(stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT);
        if (sqlite3_step(stmt) == SQLITE_ROW)
            chunks.push_back(readChunk(stmt));
    }
    sqlite3_finalize(stmt);
    return chunks;
}

std::vector<TranscriptChunk> ChunkStore::getChunksForVideo(const std::string &video_id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TranscriptChunk> chunks;
    if (!db_)
        return chunks;

    const std::string sql = "SELECT id, video_id, start_seconds, end_seconds, text, frame_timestamp, frame_ref "
                            "FROM chunks WHERE video_id = ? ORDER BY start_seconds";
    sqlite3_stmt *stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK)
        return chunks;
    sqlite3_bind_text(stmt, 1, video_id.c_str(), -1, SQLITE_TRANSIENT);
    while (sqlite3_step(stmt) == SQLITE_ROW)
        chunks.push_back(readChunk(stmt));
    sqlite3_finalize(stmt);
    return chunks;
}

size_t ChunkStore::chunkCount() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_)
        return 0;
    sqlite3_stmt *stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM chunks", -1, &stmt, nullptr) != SQLITE_OK)
        return 0;
    size_t count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW)
        count = static_cast<size_t>(sqlite3_column_int64(stmt, 0));
    sqlite3_finalize(stmt);
    return count;
}

DBOpResult ChunkStore::recordEmbedding(const std::string &chunk_id, const std::string &model_id, size_t dimensions)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_)
        return DBOpResult(false, "Database not initialized");

    const std::string sql = R"(
        INSERT INTO embeddings (chunk_id, model_id, dimensions, updated_at)
        VALUES (?, ?, ?, CURRENT_TIMESTAMP)
        ON CONFLICT(chunk_id) DO UPDATE SET
            model_id = excluded.model_id,
            dimensions = excluded.dimensions,
            updated_at = CURRENT_TIMESTAMP
    )";
    sqlite3_stmt *stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK)
    {
        return DBOpResult(false, "Failed to prepare statement: " + std::string(sqlite3_errmsg(db_)));
    }
    sqlite3_bind_text(stmt, 1, chunk_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, model_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 3, static_cast<sqlite3_int64>(dimensions));
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE)
    {
        return DBOpResult(false, "Failed to record embedding for " + chunk_id + ": " + sqlite3_errmsg(db_));
    }
    return DBOpResult(true);
}

std::optional<std::string> ChunkStore::embeddingModelFor(const std::string &chunk_id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_)
        return std::nullopt;
    sqlite3_stmt *stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "SELECT model_id FROM embeddings WHERE chunk_id = ?", -1, &stmt, nullptr) != SQLITE_OK)
        return std::nullopt;
    sqlite3_bind_text(stmt, 1, chunk_id.c_str(), -1, SQLITE_TRANSIENT);
    std::optional<std::string> model;
    if (sqlite3_step(stmt) == SQLITE_ROW)
        model = std::string(reinterpret_cast<const char *>(sqlite3_column_text(stmt, 0)));
    sqlite3_finalize(stmt);
    return model;
}
