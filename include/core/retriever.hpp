#pragma once

#include <memory>
#include <vector>
#include "core/capabilities.hpp"
#include "core/media_types.hpp"

class ChunkStore;

struct RetrieverConfig
{
    int overfetch_factor = 3;       // Candidates requested per wanted result
    double merge_gap_seconds = 1.0; // Same-video hits closer than this are one result
};

/**
 * @brief Turns a query vector into ranked, deduplicated search results
 */
class Retriever
{
public:
    Retriever(std::shared_ptr<VectorSearchService> index,
              std::shared_ptr<ChunkStore> store,
              RetrieverConfig config = RetrieverConfig());

    /**
     * @brief Nearest chunks of a query vector
     *
     * Over-fetches top_k * overfetch_factor candidates, drops the ones below min_score,
     * then merges hits of the same video whose ranges overlap or sit within the merge
     * gap. The best hit of each group is kept with its range widened to the group union.
     *
     * @param query_vector Embedding of the query text
     * @param top_k Maximum results, at least 1
     * @param min_score Score floor in [0,1]
     * @return Results ordered by descending score, then earlier start. Empty when nothing clears min_score.
     * @throws InvalidQueryError on bad parameters
     */
    std::vector<SearchResult> search(const std::vector<float> &query_vector, int top_k, double min_score);

    /**
     * @brief Merge same-video results that overlap or lie within gap_seconds of each other
     *
     * Input must already be sorted best first.
     */
    static std::vector<SearchResult> deduplicate(const std::vector<SearchResult> &sorted, double gap_seconds);

    static void validate(int top_k, double min_score);

    const RetrieverConfig &config() const { return config_; }

private:
    std::shared_ptr<VectorSearchService> index_;
    std::shared_ptr<ChunkStore> store_;
    RetrieverConfig config_;
};
