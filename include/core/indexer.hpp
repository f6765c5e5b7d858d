#pragma once

#include <memory>
#include <string>
#include <vector>
#include "core/capabilities.hpp"
#include "core/media_types.hpp"

class ChunkStore;

struct IndexerConfig
{
    int max_retries = 3;       // Embedding attempts per chunk
    int backoff_base_ms = 100; // First backoff delay, doubled per attempt
    int threads = 4;           // Concurrent embedding calls
};

struct ChunkFailure
{
    std::string chunk_id;
    std::string reason;
};

/**
 * @brief Outcome of one indexing batch
 */
struct IndexReport
{
    size_t attempted = 0;
    size_t written = 0;
    size_t invalidated = 0; // Vectors dropped because the embedding model changed
    std::vector<ChunkFailure> failures;

    bool partial() const { return !failures.empty(); }
};

/**
 * @brief Embeds transcript chunks and upserts them into the vector search service
 *
 * Each chunk is embedded once; transient failures are retried with exponential
 * backoff up to max_retries attempts, after which only that chunk fails. When the
 * embedding model differs from the one recorded for a chunk, the old vector is removed
 * before the new one is written.
 */
class Indexer
{
public:
    /**
     * @param embedder Embedding function
     * @param index Vector search service receiving the vectors
     * @param store Optional catalog recording which model produced each vector
     * @param config Retry and parallelism settings
     */
    Indexer(std::shared_ptr<EmbeddingFunction> embedder,
            std::shared_ptr<VectorSearchService> index,
            std::shared_ptr<ChunkStore> store,
            IndexerConfig config = IndexerConfig());

    /**
     * @brief Index a batch of chunks
     * @return Count of vectors written
     */
    size_t index(const std::vector<TranscriptChunk> &chunks);

    IndexReport indexWithReport(const std::vector<TranscriptChunk> &chunks);

    /**
     * @brief Remove the vectors of chunks that no longer exist
     */
    void removeChunks(const std::vector<std::string> &chunk_ids);

    const IndexerConfig &config() const { return config_; }

private:
    // Returns true when a stale vector of another model was removed
    bool indexChunk(const TranscriptChunk &chunk);

    std::shared_ptr<EmbeddingFunction> embedder_;
    std::shared_ptr<VectorSearchService> index_;
    std::shared_ptr<ChunkStore> store_;
    IndexerConfig config_;
};
