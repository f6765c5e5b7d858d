#pragma once

#include <optional>
#include <string>
#include <vector>
#include "core/capabilities.hpp"
#include "core/media_types.hpp"

/**
 * @brief Timed-text parsing for WebVTT and SubRip files
 *
 * Cue text lines are joined with a single space, inline markup tags are stripped and
 * cue settings after the end timestamp are ignored. Any cue whose end precedes its
 * start, or whose timing line cannot be parsed, raises MalformedInputError carrying
 * the zero-based index the cue would have in the returned list. Cues left empty after
 * stripping are dropped and take no index, matching the indices the Segmenter reports.
 */
class SubtitleParser
{
public:
    /**
     * @brief Parse a subtitle file, choosing the format from its extension
     * @param file_path Path to a .vtt or .srt file
     * @param video_id Video the cues belong to
     * @return Cues in file order
     */
    static std::vector<SubtitleCue> parseFile(const std::string &file_path, const std::string &video_id);

    static std::vector<SubtitleCue> parseVtt(const std::string &content, const std::string &video_id);
    static std::vector<SubtitleCue> parseSrt(const std::string &content, const std::string &video_id);

    /**
     * @brief Parse "HH:MM:SS.mmm", "MM:SS.mmm" or "HH:MM:SS,mmm" into seconds
     * @return Seconds, or std::nullopt when the text is not a timestamp
     */
    static std::optional<double> parseTimestamp(const std::string &text);

    static bool isSupportedFile(const std::string &file_path);

private:
    static std::vector<SubtitleCue> parseBlocks(const std::string &content, const std::string &video_id, bool vtt);
};

/**
 * @brief SubtitleSource backed by a directory of "<video_id>.vtt" / "<video_id>.srt" files
 */
class DirectorySubtitleSource : public SubtitleSource
{
public:
    explicit DirectorySubtitleSource(std::string directory);

    std::vector<SubtitleCue> cuesFor(const std::string &video_id) override;

    /**
     * @brief Locate the subtitle file of a video, preferring WebVTT
     */
    std::optional<std::string> findSubtitleFile(const std::string &video_id) const;

private:
    std::string directory_;
};
