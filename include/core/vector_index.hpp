#pragma once

#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "core/capabilities.hpp"

/**
 * @brief Exact cosine-similarity index held in memory
 *
 * Scores are max(0, cos) so they stay inside [0,1]. Vectors whose dimension differs
 * from the query are skipped.
 */
class InMemoryVectorIndex : public VectorSearchService
{
public:
    InMemoryVectorIndex() = default;

    std::vector<VectorCandidate> search(const std::vector<float> &query_vector, int k) override;
    void upsert(const EmbeddingVector &vector) override;
    void remove(const std::string &chunk_id) override;

    size_t size() const;
    bool contains(const std::string &chunk_id) const;
    std::optional<std::string> modelFor(const std::string &chunk_id) const;

    static double cosineSimilarity(const std::vector<float> &a, const std::vector<float> &b);

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, EmbeddingVector> vectors_;
};

/**
 * @brief VectorSearchService backed by a Qdrant-compatible HTTP service
 *
 * Chunk ids are mapped to 63-bit point ids derived from SHA-256; the original id is
 * kept in the point payload as "chunk_id". Connection failures and 5xx replies raise
 * TransientServiceError.
 */
class QdrantVectorIndex : public VectorSearchService
{
public:
    QdrantVectorIndex(std::string base_url, std::string collection, int dimensions, int timeout_seconds = 10);

    /**
     * @brief Create the collection with cosine distance if it does not exist yet
     */
    void ensureCollection();

    std::vector<VectorCandidate> search(const std::vector<float> &query_vector, int k) override;
    void upsert(const EmbeddingVector &vector) override;
    void remove(const std::string &chunk_id) override;

    static uint64_t pointIdFor(const std::string &chunk_id);

private:
    std::string request(const std::string &path, const std::string &body, const std::string &method);

    std::string base_url_;
    std::string collection_;
    int dimensions_;
    int timeout_seconds_;
};
