#include "core/media_types.hpp"
#include <cmath>

std::string makeChunkId(const std::string &video_id, double start, double end)
{
    auto start_ms = static_cast<long long>(std::llround(start * 1000.0));
    auto end_ms = static_cast<long long>(std::llround(end * 1000.0));
    return video_id + "#" + std::to_string(start_ms) + "-" + std::to_string(end_ms);
}

std::string queryStateName(QueryState state)
{
    switch (state)
    {
    case QueryState::Received:
        return "Received";
    case QueryState::Embedding:
        return "Embedding";
    case QueryState::Retrieving:
        return "Retrieving";
    case QueryState::Synthesizing:
        return "Synthesizing";
    case QueryState::Composing:
        return "Composing";
    case QueryState::Assembled:
        return "Assembled";
    case QueryState::Done:
        return "Done";
    case QueryState::Failed:
        return "Failed";
    }
    return "Unknown";
}
