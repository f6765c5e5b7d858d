#pragma once

#include <memory>
#include <string>
#include <vector>
#include "core/capabilities.hpp"
#include "core/media_types.hpp"

struct ComposerConfig
{
    size_t max_context_chars = 6000;
};

/**
 * @brief Builds a grounding context from search results and asks the generation model for an answer
 */
class AnswerComposer
{
public:
    static const char *const kInsufficientGroundingAnswer;

    AnswerComposer(std::shared_ptr<GenerationFunction> generator, ComposerConfig config = ComposerConfig());

    /**
     * @brief Answer a query from its results
     *
     * With no results the fixed insufficient-grounding text is returned and the
     * generation model is not called.
     * @throws GenerationFailure when the model fails or returns nothing
     */
    std::string compose(const std::string &query, const std::vector<SearchResult> &results);

    /**
     * @brief Concatenate result texts in rank order, each tagged with its source range
     *
     * Lowest-ranked entries are dropped first when the context would exceed the limit.
     */
    std::string buildContext(const std::vector<SearchResult> &results) const;

    static std::string buildPrompt(const std::string &query);

    // MM:SS, or H:MM:SS past the hour
    static std::string formatTimestamp(double seconds);

    const ComposerConfig &config() const { return config_; }

private:
    std::shared_ptr<GenerationFunction> generator_;
    ComposerConfig config_;
};
