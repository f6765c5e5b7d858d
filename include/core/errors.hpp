#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

/**
 * @brief Base class for every failure that crosses a Lectern component boundary
 */
class LecternError : public std::runtime_error
{
public:
    explicit LecternError(const std::string &message) : std::runtime_error(message) {}
};

/**
 * @brief Bad ingestion data (subtitle cues, frame interval, media paths).
 *
 * Fatal to the single item being ingested, never to the batch.
 */
class MalformedInputError : public LecternError
{
public:
    MalformedInputError(const std::string &message, std::size_t item_index)
        : LecternError(message + " (item " + std::to_string(item_index) + ")"), item_index_(item_index) {}

    explicit MalformedInputError(const std::string &message)
        : LecternError(message), item_index_(npos) {}

    std::size_t itemIndex() const { return item_index_; }
    bool hasItemIndex() const { return item_index_ != npos; }

    static constexpr std::size_t npos = static_cast<std::size_t>(-1);

private:
    std::size_t item_index_;
};

/**
 * @brief Bad caller parameters. Fatal to the query and reported to the caller.
 */
class InvalidQueryError : public LecternError
{
public:
    explicit InvalidQueryError(const std::string &message) : LecternError(message) {}
};

/**
 * @brief External service failure that may succeed if retried
 */
class TransientServiceError : public LecternError
{
public:
    explicit TransientServiceError(const std::string &message) : LecternError(message) {}
};

/**
 * @brief Embedding could not be produced. Fatal to a query, per-chunk during indexing.
 */
class EmbeddingFailure : public LecternError
{
public:
    explicit EmbeddingFailure(const std::string &message) : LecternError(message) {}
};

/**
 * @brief A bounded external call did not finish before its deadline
 */
class StepTimeout : public LecternError
{
public:
    StepTimeout(const std::string &step, int timeout_ms)
        : LecternError("Step '" + step + "' timed out after " + std::to_string(timeout_ms) + "ms"),
          step_(step), timeout_ms_(timeout_ms) {}

    const std::string &step() const { return step_; }
    int timeoutMs() const { return timeout_ms_; }

private:
    std::string step_;
    int timeout_ms_;
};

class RetrievalTimeout : public LecternError
{
public:
    explicit RetrievalTimeout(const std::string &message) : LecternError(message) {}
};

/**
 * @brief Clip synthesis failed (corrupt source, unsupported codec, unknown video).
 *
 * A failed extraction never populates the clip cache.
 */
class MediaExtractionError : public LecternError
{
public:
    explicit MediaExtractionError(const std::string &message) : LecternError(message) {}
};

class GenerationTimeout : public LecternError
{
public:
    explicit GenerationTimeout(const std::string &message) : LecternError(message) {}
};

class GenerationFailure : public LecternError
{
public:
    explicit GenerationFailure(const std::string &message) : LecternError(message) {}
};

class QueryCancelled : public LecternError
{
public:
    explicit QueryCancelled(const std::string &message) : LecternError(message) {}
};
