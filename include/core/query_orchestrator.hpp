#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "core/cancellation_token.hpp"
#include "core/capabilities.hpp"
#include "core/media_types.hpp"

class Retriever;
class ClipSynthesizer;
class AnswerComposer;

/**
 * @brief Per-step deadlines for the external calls made while answering a query
 */
struct OrchestratorConfig
{
    int embedding_timeout_ms = 5000;
    int search_timeout_ms = 3000;
    int generation_timeout_ms = 30000;
    int extraction_timeout_ms = 20000;
};

/**
 * @brief Drives one query through embedding, retrieval, clip synthesis and answer composition
 *
 * Clip synthesis and answer composition run concurrently once results are known.
 * Every external call is bounded by its step timeout. Failures after retrieval
 * degrade the result and are flagged on it; only bad parameters, embedding failure
 * and cancellation are raised to the caller.
 */
class QueryOrchestrator
{
public:
    QueryOrchestrator(std::shared_ptr<EmbeddingFunction> embedder,
                      std::shared_ptr<Retriever> retriever,
                      std::shared_ptr<ClipSynthesizer> synthesizer,
                      std::shared_ptr<AnswerComposer> composer,
                      OrchestratorConfig config = OrchestratorConfig());

    /**
     * @brief Answer a natural-language query
     * @param query_text Question text, must not be blank
     * @param options top_k, min_score and include_clip
     * @param cancel Optional token; once cancelled the query stops at its next external call
     * @return Result with answer, ranked results, optional clip and status flags
     * @throws InvalidQueryError on bad parameters
     * @throws EmbeddingFailure when the query cannot be embedded in time
     * @throws QueryCancelled when the token is cancelled
     */
    QueryResult answer(const std::string &query_text, const QueryOptions &options = QueryOptions(),
                       const CancellationToken *cancel = nullptr);

    const OrchestratorConfig &config() const { return config_; }

private:
    std::vector<float> embedQuery(const std::string &query_text, const CancellationToken *cancel);

    std::shared_ptr<EmbeddingFunction> embedder_;
    std::shared_ptr<Retriever> retriever_;
    std::shared_ptr<ClipSynthesizer> synthesizer_;
    std::shared_ptr<AnswerComposer> composer_;
    OrchestratorConfig config_;
    std::atomic<uint64_t> next_query_id_{1};
};

/**
 * @brief JSON rendering of a query result for the command line
 */
nlohmann::json queryResultToJson(const QueryResult &result);
