#include "core/query_orchestrator.hpp"
#include "core/answer_composer.hpp"
#include "core/clip_synthesizer.hpp"
#include "core/error_recovery.hpp"
#include "core/errors.hpp"
#include "core/retriever.hpp"
#include "logging/logger.hpp"
#include <future>

namespace
{
    void checkCancelled(const CancellationToken *cancel, const std::string &step)
    {
        if (cancel && cancel->isCancelled())
        {
            throw QueryCancelled("Query cancelled before " + step);
        }
    }

    void degrade(QueryResult &result, const std::string &reason)
    {
        result.status = QueryStatus::Degraded;
        result.degradation_reasons.push_back(reason);
        Logger::warn("Query " + std::to_string(result.query_id) + " degraded: " + reason);
    }

    std::string tag(uint64_t query_id)
    {
        return "Query " + std::to_string(query_id);
    }
}

QueryOrchestrator::QueryOrchestrator(std::shared_ptr<EmbeddingFunction> embedder,
                                     std::shared_ptr<Retriever> retriever,
                                     std::shared_ptr<ClipSynthesizer> synthesizer,
                                     std::shared_ptr<AnswerComposer> composer,
                                     OrchestratorConfig config)
    : embedder_(std::move(embedder)), retriever_(std::move(retriever)), synthesizer_(std::move(synthesizer)),
      composer_(std::move(composer)), config_(config)
{
    if (!embedder_ || !retriever_ || !synthesizer_ || !composer_)
    {
        throw std::invalid_argument("QueryOrchestrator requires all of its collaborators");
    }
}

std::vector<float> QueryOrchestrator::embedQuery(const std::string &query_text, const CancellationToken *cancel)
{
    auto embedder = embedder_;
    std::vector<float> query_vector;
    try
    {
        query_vector = ErrorRecovery::callWithTimeout(
            [embedder, query_text]()
            { return embedder->embed(query_text); },
            config_.embedding_timeout_ms, "embedding", cancel);
    }
    catch (const QueryCancelled &)
    {
        throw;
    }
    catch (const EmbeddingFailure &)
    {
        throw;
    }
    catch (const StepTimeout &e)
    {
        throw EmbeddingFailure(std::string("Query embedding timed out: ") + e.what());
    }
    catch (const std::exception &e)
    {
        throw EmbeddingFailure(std::string("Query embedding failed: ") + e.what());
    }

    if (query_vector.empty())
    {
        throw EmbeddingFailure("Embedding model " + embedder_->modelId() + " returned an empty query vector");
    }
    return query_vector;
}

QueryResult QueryOrchestrator::answer(const std::string &query_text, const QueryOptions &options,
                                      const CancellationToken *cancel)
{
    auto started = std::chrono::steady_clock::now();

    QueryResult result;
    result.query_id = next_query_id_.fetch_add(1);
    result.query = query_text;
    result.states.push_back(QueryState::Received);

    try
    {
        if (query_text.find_first_not_of(" \t\r\n") == std::string::npos)
        {
            throw InvalidQueryError("Query text is empty");
        }
        Retriever::validate(options.top_k, options.min_score);
        Logger::info(tag(result.query_id) + " received (top_k=" + std::to_string(options.top_k) +
                     ", min_score=" + std::to_string(options.min_score) +
                     ", include_clip=" + (options.include_clip ? "true" : "false") + ")");

        checkCancelled(cancel, "embedding");
        result.states.push_back(QueryState::Embedding);
        std::vector<float> query_vector = embedQuery(query_text, cancel);

        checkCancelled(cancel, "retrieval");
        result.states.push_back(QueryState::Retrieving);
        auto retriever = retriever_;
        try
        {
            const int top_k = options.top_k;
            const double min_score = options.min_score;
            result.results = ErrorRecovery::callWithTimeout(
                [retriever, query_vector, top_k, min_score]()
                { return retriever->search(query_vector, top_k, min_score); },
                config_.search_timeout_ms, "vector search", cancel);
        }
        catch (const StepTimeout &)
        {
            RetrievalTimeout timeout("Vector search exceeded " + std::to_string(config_.search_timeout_ms) + "ms");
            result.retrieval_timed_out = true;
            degrade(result, timeout.what());
        }
        catch (const InvalidQueryError &)
        {
            throw;
        }
        catch (const QueryCancelled &)
        {
            throw;
        }
        catch (const std::exception &e)
        {
            degrade(result, std::string("Vector search failed: ") + e.what());
        }

        Logger::debug(tag(result.query_id) + " retrieved " + std::to_string(result.results.size()) + " results");

        // Clip and answer only depend on the results, so they run side by side
        std::future<ClipArtifactRef> clip_future;
        const bool want_clip = options.include_clip && !result.results.empty();
        if (want_clip)
        {
            result.states.push_back(QueryState::Synthesizing);
            auto synthesizer = synthesizer_;
            const TranscriptChunk top = result.results.front().chunk;
            const int timeout_ms = config_.extraction_timeout_ms;
            clip_future = std::async(std::launch::async, [synthesizer, top, timeout_ms, cancel]()
                                     { return ErrorRecovery::callWithTimeout(
                                           [synthesizer, top]()
                                           { return synthesizer->synthesize(top.video_id, top.start, top.end); },
                                           timeout_ms, "clip synthesis", cancel); });
        }

        result.states.push_back(QueryState::Composing);
        std::future<std::string> answer_future;
        if (result.results.empty())
        {
            // Fixed response, no generation call
            std::promise<std::string> immediate;
            immediate.set_value(composer_->compose(query_text, result.results));
            answer_future = immediate.get_future();
        }
        else
        {
            auto composer = composer_;
            const std::vector<SearchResult> results = result.results;
            const int timeout_ms = config_.generation_timeout_ms;
            answer_future = std::async(std::launch::async, [composer, query_text, results, timeout_ms, cancel]()
                                       { return ErrorRecovery::callWithTimeout(
                                             [composer, query_text, results]()
                                             { return composer->compose(query_text, results); },
                                             timeout_ms, "answer generation", cancel); });
        }

        // Both branches are awaited before a cancellation is raised
        bool cancelled = false;
        if (want_clip)
        {
            try
            {
                result.clip = clip_future.get();
            }
            catch (const QueryCancelled &)
            {
                cancelled = true;
            }
            catch (const StepTimeout &e)
            {
                result.clip_failed = true;
                degrade(result, std::string("Clip synthesis timed out: ") + e.what());
            }
            catch (const std::exception &e)
            {
                result.clip_failed = true;
                degrade(result, std::string("Clip synthesis failed: ") + e.what());
            }
        }

        try
        {
            result.answer = answer_future.get();
            result.has_answer = true;
        }
        catch (const QueryCancelled &)
        {
            cancelled = true;
        }
        catch (const StepTimeout &)
        {
            GenerationTimeout timeout("Answer generation exceeded " + std::to_string(config_.generation_timeout_ms) +
                                      "ms");
            result.answer_failed = true;
            degrade(result, timeout.what());
        }
        catch (const std::exception &e)
        {
            result.answer_failed = true;
            degrade(result, std::string("Answer generation failed: ") + e.what());
        }

        if (cancelled)
        {
            throw QueryCancelled(tag(result.query_id) + " cancelled while waiting for clip or answer");
        }
    }
    catch (const LecternError &e)
    {
        result.states.push_back(QueryState::Failed);
        Logger::error(tag(result.query_id) + " failed: " + e.what());
        throw;
    }

    result.insufficient_grounding = result.results.empty() && !result.answer_failed;
    result.states.push_back(QueryState::Assembled);
    result.latency = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
    result.states.push_back(QueryState::Done);

    Logger::info(tag(result.query_id) + " done in " + std::to_string(result.latency.count()) + "ms - results: " +
                 std::to_string(result.results.size()) + ", clip: " + (result.clip ? "yes" : "no") +
                 ", status: " + (result.status == QueryStatus::Complete ? "complete" : "degraded"));
    return result;
}

nlohmann::json queryResultToJson(const QueryResult &result)
{
    nlohmann::json results = nlohmann::json::array();
    for (const auto &hit : result.results)
    {
        nlohmann::json item = {{"rank", hit.rank},
                               {"score", hit.score},
                               {"chunk_id", hit.chunk.id},
                               {"video_id", hit.chunk.video_id},
                               {"start", hit.chunk.start},
                               {"end", hit.chunk.end},
                               {"text", hit.chunk.text},
                               {"merged_chunk_ids", hit.merged_chunk_ids}};
        if (hit.chunk.frame)
            item["frame"] = hit.chunk.frame->image_ref;
        results.push_back(item);
    }

    nlohmann::json states = nlohmann::json::array();
    for (QueryState state : result.states)
        states.push_back(queryStateName(state));

    nlohmann::json out = {{"query_id", result.query_id},
                          {"query", result.query},
                          {"status", result.status == QueryStatus::Complete ? "complete" : "degraded"},
                          {"answer", result.has_answer ? nlohmann::json(result.answer) : nlohmann::json(nullptr)},
                          {"insufficient_grounding", result.insufficient_grounding},
                          {"results", results},
                          {"retrieval_timed_out", result.retrieval_timed_out},
                          {"clip_failed", result.clip_failed},
                          {"answer_failed", result.answer_failed},
                          {"degradation_reasons", result.degradation_reasons},
                          {"latency_ms", result.latency.count()},
                          {"states", states}};
    if (result.clip)
    {
        out["clip"] = {{"path", result.clip->path().string()},
                       {"video_id", result.clip->videoId()},
                       {"start", result.clip->start()},
                       {"end", result.clip->end()},
                       {"size_bytes", result.clip->sizeBytes()}};
    }
    else
    {
        out["clip"] = nullptr;
    }
    return out;
}
