#include "core/retriever.hpp"
#include "core/errors.hpp"
#include "database/chunk_store.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <climits>
#include <cmath>
#include <unordered_map>

namespace
{
    bool rankedBefore(const SearchResult &a, const SearchResult &b)
    {
        if (a.score != b.score)
            return a.score > b.score;
        if (a.chunk.start != b.chunk.start)
            return a.chunk.start < b.chunk.start;
        return a.chunk.id < b.chunk.id;
    }

    // Overlapping ranges give a negative separation
    bool withinGap(const TranscriptChunk &a, const TranscriptChunk &b, double gap_seconds)
    {
        if (a.video_id != b.video_id)
            return false;
        double separation = std::max(a.start, b.start) - std::min(a.end, b.end);
        return separation < 0.0 || separation < gap_seconds;
    }

    void absorb(SearchResult &into, const SearchResult &other)
    {
        into.chunk.start = std::min(into.chunk.start, other.chunk.start);
        into.chunk.end = std::max(into.chunk.end, other.chunk.end);
        for (const auto &id : other.merged_chunk_ids)
        {
            if (std::find(into.merged_chunk_ids.begin(), into.merged_chunk_ids.end(), id) == into.merged_chunk_ids.end())
                into.merged_chunk_ids.push_back(id);
        }
    }
}

Retriever::Retriever(std::shared_ptr<VectorSearchService> index,
                     std::shared_ptr<ChunkStore> store,
                     RetrieverConfig config)
    : index_(std::move(index)), store_(std::move(store)), config_(config)
{
    if (!index_ || !store_)
    {
        throw std::invalid_argument("Retriever requires a vector index and a chunk store");
    }
    if (config_.overfetch_factor < 1)
        config_.overfetch_factor = 1;
    if (config_.merge_gap_seconds < 0.0)
        config_.merge_gap_seconds = 0.0;
}

void Retriever::validate(int top_k, double min_score)
{
    if (top_k < 1)
    {
        throw InvalidQueryError("top_k must be at least 1, got " + std::to_string(top_k));
    }
    if (std::isnan(min_score) || min_score < 0.0 || min_score > 1.0)
    {
        throw InvalidQueryError("min_score must be within [0,1], got " + std::to_string(min_score));
    }
}

std::vector<SearchResult> Retriever::search(const std::vector<float> &query_vector, int top_k, double min_score)
{
    validate(top_k, min_score);
    if (query_vector.empty())
    {
        throw InvalidQueryError("Query vector is empty");
    }

    long long wanted = static_cast<long long>(top_k) * config_.overfetch_factor;
    int fetch = static_cast<int>(std::min<long long>(wanted, INT_MAX));

    std::vector<VectorCandidate> candidates = index_->search(query_vector, fetch);

    std::vector<std::string> ids;
    std::unordered_map<std::string, double> scores;
    for (const auto &candidate : candidates)
    {
        if (candidate.score < min_score)
            continue;
        auto it = scores.find(candidate.chunk_id);
        if (it == scores.end())
        {
            ids.push_back(candidate.chunk_id);
            scores[candidate.chunk_id] = candidate.score;
        }
        else if (candidate.score > it->second)
        {
            it->second = candidate.score;
        }
    }

    std::vector<SearchResult> hits;
    if (!ids.empty())
    {
        // Vectors may outlive their chunk briefly during re-ingestion; such ids are skipped
        for (auto &chunk : store_->getChunks(ids))
        {
            SearchResult hit;
            hit.score = scores[chunk.id];
            hit.merged_chunk_ids.push_back(chunk.id);
            hit.chunk = std::move(chunk);
            hits.push_back(std::move(hit));
        }
        if (hits.size() < ids.size())
        {
            Logger::warn("Vector index returned " + std::to_string(ids.size() - hits.size()) +
                         " candidates with no stored chunk");
        }
    }

    std::sort(hits.begin(), hits.end(), rankedBefore);
    std::vector<SearchResult> results = deduplicate(hits, config_.merge_gap_seconds);
    if (results.size() > static_cast<size_t>(top_k))
        results.resize(static_cast<size_t>(top_k));
    for (size_t i = 0; i < results.size(); ++i)
        results[i].rank = static_cast<int>(i) + 1;

    Logger::debug("Retrieval kept " + std::to_string(results.size()) + " of " + std::to_string(candidates.size()) +
                  " candidates (top_k=" + std::to_string(top_k) + ", min_score=" + std::to_string(min_score) + ")");
    return results;
}

std::vector<SearchResult> Retriever::deduplicate(const std::vector<SearchResult> &sorted, double gap_seconds)
{
    std::vector<SearchResult> groups;
    for (const auto &hit : sorted)
    {
        bool joined = false;
        for (auto &group : groups)
        {
            if (withinGap(group.chunk, hit.chunk, gap_seconds))
            {
                absorb(group, hit);
                joined = true;
                break;
            }
        }
        if (!joined)
            groups.push_back(hit);
    }

    // Widening a group can bring it within reach of another one
    bool merged = true;
    while (merged)
    {
        merged = false;
        for (size_t i = 0; i < groups.size() && !merged; ++i)
        {
            for (size_t j = i + 1; j < groups.size(); ++j)
            {
                if (withinGap(groups[i].chunk, groups[j].chunk, gap_seconds))
                {
                    // groups are in best-first order, so i keeps its text and score
                    absorb(groups[i], groups[j]);
                    groups.erase(groups.begin() + static_cast<std::ptrdiff_t>(j));
                    merged = true;
                    break;
                }
            }
        }
    }

    std::sort(groups.begin(), groups.end(), rankedBefore);
    return groups;
}
