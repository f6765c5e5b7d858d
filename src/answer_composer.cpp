#include "core/answer_composer.hpp"
#include "core/errors.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

const char *const AnswerComposer::kInsufficientGroundingAnswer =
    "I could not find anything in the indexed lectures that answers this question, "
    "so I cannot give a grounded answer.";

namespace
{
    // Longest prefix of at most max_bytes that does not split a UTF-8 sequence
    size_t utf8Prefix(const std::string &text, size_t max_bytes)
    {
        if (max_bytes >= text.size())
            return text.size();
        size_t cut = max_bytes;
        while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80)
            --cut;
        return cut;
    }

    std::string contextEntry(const SearchResult &result, const std::string &text)
    {
        std::ostringstream entry;
        entry << "[" << result.rank << "] (video " << result.chunk.video_id << ", "
              << AnswerComposer::formatTimestamp(result.chunk.start) << " - "
              << AnswerComposer::formatTimestamp(result.chunk.end) << ", score "
              << std::fixed << std::setprecision(2) << result.score << ")\n"
              << text;
        return entry.str();
    }
}

AnswerComposer::AnswerComposer(std::shared_ptr<GenerationFunction> generator, ComposerConfig config)
    : generator_(std::move(generator)), config_(config)
{
    if (!generator_)
    {
        throw std::invalid_argument("AnswerComposer requires a generation function");
    }
}

std::string AnswerComposer::formatTimestamp(double seconds)
{
    long total = static_cast<long>(std::floor(std::max(0.0, seconds)));
    long hours = total / 3600;
    long minutes = (total % 3600) / 60;
    long secs = total % 60;

    std::ostringstream out;
    out << std::setfill('0');
    if (hours > 0)
        out << hours << ":" << std::setw(2) << minutes;
    else
        out << std::setw(2) << minutes;
    out << ":" << std::setw(2) << secs;
    return out.str();
}

std::string AnswerComposer::buildContext(const std::vector<SearchResult> &results) const
{
    static const std::string kSeparator = "\n\n";

    std::vector<std::string> entries;
    size_t total = 0;
    for (const auto &result : results)
    {
        std::string entry = contextEntry(result, result.chunk.text);
        size_t added = entry.size() + (entries.empty() ? 0 : kSeparator.size());
        if (total + added > config_.max_context_chars)
        {
            if (entries.empty())
            {
                // The best result alone is too long: keep as much of its text as fits
                size_t header = contextEntry(result, "").size();
                if (header >= config_.max_context_chars)
                {
                    Logger::warn("Context limit of " + std::to_string(config_.max_context_chars) +
                                 " characters is too small for a single result header");
                    break;
                }
                size_t room = utf8Prefix(result.chunk.text, config_.max_context_chars - header);
                entries.push_back(contextEntry(result, result.chunk.text.substr(0, room)));
                Logger::debug("Truncated top result text to " + std::to_string(room) + " characters");
            }
            else
            {
                Logger::debug("Context limit reached, dropping " + std::to_string(results.size() - entries.size()) +
                              " lower-ranked results");
            }
            break;
        }
        entries.push_back(std::move(entry));
        total += added;
    }

    std::string context;
    for (size_t i = 0; i < entries.size(); ++i)
    {
        if (i > 0)
            context += kSeparator;
        context += entries[i];
    }
    return context;
}

std::string AnswerComposer::buildPrompt(const std::string &query)
{
    return "You answer questions about recorded lectures. Use only the lecture excerpts provided below. "
           "If they do not contain the answer, say that the lectures do not cover it instead of guessing. "
           "Cite the time ranges of the excerpts you rely on.\n\nQuestion: " +
           query;
}

std::string AnswerComposer::compose(const std::string &query, const std::vector<SearchResult> &results)
{
    if (results.empty())
    {
        Logger::info("No grounding results for query, returning insufficient grounding answer");
        return kInsufficientGroundingAnswer;
    }

    std::string context = buildContext(results);
    std::string answer = generator_->generate(buildPrompt(query), context);

    auto first = answer.find_first_not_of(" \t\r\n");
    if (first == std::string::npos)
    {
        throw GenerationFailure("Generation model " + generator_->modelId() + " returned an empty answer");
    }
    auto last = answer.find_last_not_of(" \t\r\n");
    return answer.substr(first, last - first + 1);
}
