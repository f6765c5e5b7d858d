#pragma once

#include <optional>
#include <string>
#include <vector>
#include "core/media_types.hpp"

struct SegmenterConfig
{
    double max_chunk_duration_seconds = 30.0;
    double silence_gap_seconds = 2.0; // A gap strictly larger than this closes the chunk
};

/**
 * @brief Merges time-ordered subtitle cues into transcript chunks
 *
 * Chunks never overlap, never exceed the maximum duration and stay inside the video's
 * duration. Each chunk carries the frame sample nearest its midpoint.
 */
class Segmenter
{
public:
    explicit Segmenter(SegmenterConfig config = SegmenterConfig());

    /**
     * @brief Segment the cues of one video using the configured maximum duration
     * @throws MalformedInputError naming the first non-monotonic cue
     */
    std::vector<TranscriptChunk> segment(const VideoAsset &video,
                                         const std::vector<SubtitleCue> &cues,
                                         const std::vector<FrameSample> &frames) const;

    /**
     * @brief Segment the cues of one video with an explicit maximum chunk duration
     * @param video Owning video; its duration clamps chunk ranges when known (> 0)
     * @param cues Cues in time order
     * @param frames Frame samples of the video, any order
     * @param max_chunk_duration Upper bound on every chunk's duration in seconds
     * @return Chunks in time order; empty when there are no cues
     * @throws MalformedInputError naming the first non-monotonic cue
     */
    std::vector<TranscriptChunk> segment(const VideoAsset &video,
                                         const std::vector<SubtitleCue> &cues,
                                         const std::vector<FrameSample> &frames,
                                         double max_chunk_duration) const;

    /**
     * @brief Frame whose timestamp is closest to the given time, ties to the earliest
     */
    static std::optional<FrameSample> nearestFrame(const std::vector<FrameSample> &frames, double timestamp);

    /**
     * @brief Collapse whitespace runs to a single space and trim both ends
     */
    static std::string normalizeWhitespace(const std::string &text);

    const SegmenterConfig &config() const { return config_; }

private:
    static void validateCues(const std::vector<SubtitleCue> &cues);

    SegmenterConfig config_;
};
