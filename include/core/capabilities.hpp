#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "core/media_types.hpp"

/**
 * @brief Text to fixed-length vector. Deterministic for a fixed model version.
 *
 * Implementations throw TransientServiceError for failures worth retrying and
 * EmbeddingFailure for everything else.
 */
class EmbeddingFunction
{
public:
    virtual ~EmbeddingFunction() = default;
    virtual std::vector<float> embed(const std::string &text) = 0;
    virtual std::string modelId() const = 0;
};

/**
 * @brief (prompt, context) to text. Idempotent to call repeatedly.
 *
 * Implementations throw TransientServiceError or GenerationFailure.
 */
class GenerationFunction
{
public:
    virtual ~GenerationFunction() = default;
    virtual std::string generate(const std::string &prompt, const std::string &context) = 0;
    virtual std::string modelId() const = 0;
};

struct VectorCandidate
{
    std::string chunk_id;
    double score = 0.0;
};

/**
 * @brief Approximate nearest-neighbour service holding one vector per chunk
 */
class VectorSearchService
{
public:
    virtual ~VectorSearchService() = default;

    /**
     * @brief Nearest neighbours of a query vector, best first
     * @param query_vector Query embedding
     * @param k Maximum number of candidates
     * @return Candidates with similarity scores in [0,1]
     */
    virtual std::vector<VectorCandidate> search(const std::vector<float> &query_vector, int k) = 0;

    /**
     * @brief Insert or overwrite the vector stored for vector.chunk_id
     */
    virtual void upsert(const EmbeddingVector &vector) = 0;

    virtual void remove(const std::string &chunk_id) = 0;
};

/**
 * @brief Seekable handle onto a video's source media
 */
struct MediaHandle
{
    std::string video_id;
    std::string media_path;
    double duration_seconds = 0.0;
};

/**
 * @brief Source media access. Failures surface as MediaExtractionError.
 */
class MediaStore
{
public:
    virtual ~MediaStore() = default;
    virtual MediaHandle open(const std::string &video_id) = 0;
    virtual std::vector<uint8_t> extract(const MediaHandle &handle, double start, double end) = 0;
};

/**
 * @brief Yields the cues of one video in time order
 */
class SubtitleSource
{
public:
    virtual ~SubtitleSource() = default;
    virtual std::vector<SubtitleCue> cuesFor(const std::string &video_id) = 0;
};
