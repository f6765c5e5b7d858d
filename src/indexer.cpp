#include "core/indexer.hpp"
#include "core/error_recovery.hpp"
#include "core/errors.hpp"
#include "database/chunk_store.hpp"
#include "logging/logger.hpp"
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>
#include <atomic>
#include <mutex>

Indexer::Indexer(std::shared_ptr<EmbeddingFunction> embedder,
                 std::shared_ptr<VectorSearchService> index,
                 std::shared_ptr<ChunkStore> store,
                 IndexerConfig config)
    : embedder_(std::move(embedder)), index_(std::move(index)), store_(std::move(store)), config_(config)
{
    if (!embedder_ || !index_)
    {
        throw std::invalid_argument("Indexer requires an embedding function and a vector index");
    }
    if (config_.threads < 1)
        config_.threads = 1;
    if (config_.max_retries < 1)
        config_.max_retries = 1;
}

size_t Indexer::index(const std::vector<TranscriptChunk> &chunks)
{
    return indexWithReport(chunks).written;
}

IndexReport Indexer::indexWithReport(const std::vector<TranscriptChunk> &chunks)
{
    IndexReport report;
    report.attempted = chunks.size();
    if (chunks.empty())
        return report;

    Logger::info("Indexing " + std::to_string(chunks.size()) + " chunks with model " + embedder_->modelId() +
                 " using " + std::to_string(config_.threads) + " threads");

    std::atomic<size_t> written{0};
    std::atomic<size_t> invalidated{0};
    std::mutex failures_mutex;

    tbb::task_arena arena(config_.threads);
    arena.execute([&]()
                  { tbb::parallel_for(tbb::blocked_range<size_t>(0, chunks.size()),
                                      [&](const tbb::blocked_range<size_t> &range)
                                      {
                                          for (size_t i = range.begin(); i != range.end(); ++i)
                                          {
                                              const TranscriptChunk &chunk = chunks[i];
                                              try
                                              {
                                                  if (indexChunk(chunk))
                                                      invalidated.fetch_add(1);
                                                  written.fetch_add(1);
                                              }
                                              catch (const std::exception &e)
                                              {
                                                  Logger::error("Failed to index chunk " + chunk.id + ": " + e.what());
                                                  std::lock_guard<std::mutex> lock(failures_mutex);
                                                  report.failures.push_back({chunk.id, e.what()});
                                              }
                                          }
                                      }); });

    report.written = written.load();
    report.invalidated = invalidated.load();

    if (report.partial())
    {
        Logger::warn("Indexing finished with partial failure - written: " + std::to_string(report.written) +
                     ", failed: " + std::to_string(report.failures.size()));
    }
    else
    {
        Logger::info("Indexing completed - written: " + std::to_string(report.written) +
                     ", model changes: " + std::to_string(report.invalidated));
    }
    return report;
}

bool Indexer::indexChunk(const TranscriptChunk &chunk)
{
    const std::string model = embedder_->modelId();

    // A vector from another model is invalid for this chunk even if re-embedding fails
    bool invalidated = false;
    if (store_)
    {
        auto previous_model = store_->embeddingModelFor(chunk.id);
        if (previous_model && *previous_model != model)
        {
            Logger::info("Embedding model changed for chunk " + chunk.id + " (" + *previous_model + " -> " + model +
                         "), replacing vector");
            index_->remove(chunk.id);
            invalidated = true;
        }
    }

    std::vector<float> values = ErrorRecovery::retryWithBackoff(
        [this, &chunk]()
        { return embedder_->embed(chunk.text); },
        config_.max_retries, config_.backoff_base_ms, "embed chunk " + chunk.id);
    if (values.empty())
    {
        throw EmbeddingFailure("Embedding function returned an empty vector for chunk " + chunk.id);
    }

    EmbeddingVector vector;
    vector.chunk_id = chunk.id;
    vector.values = std::move(values);
    vector.model_id = model;
    const size_t dimensions = vector.values.size();
    index_->upsert(vector);

    if (store_)
    {
        DBOpResult recorded = store_->recordEmbedding(chunk.id, model, dimensions);
        if (!recorded.success)
        {
            Logger::warn("Vector written but embedding record failed for chunk " + chunk.id + ": " +
                         recorded.error_message);
        }
    }
    return invalidated;
}

void Indexer::removeChunks(const std::vector<std::string> &chunk_ids)
{
    for (const auto &id : chunk_ids)
    {
        try
        {
            index_->remove(id);
        }
        catch (const LecternError &e)
        {
            Logger::warn("Failed to remove vector for chunk " + id + ": " + e.what());
        }
    }
    if (!chunk_ids.empty())
    {
        Logger::info("Removed " + std::to_string(chunk_ids.size()) + " superseded vectors");
    }
}
