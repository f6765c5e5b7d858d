#include "core/segmenter.hpp"
#include "core/errors.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>

Segmenter::Segmenter(SegmenterConfig config)
    : config_(config)
{
}

std::vector<TranscriptChunk> Segmenter::segment(const VideoAsset &video,
                                                const std::vector<SubtitleCue> &cues,
                                                const std::vector<FrameSample> &frames) const
{
    return segment(video, cues, frames, config_.max_chunk_duration_seconds);
}

std::vector<TranscriptChunk> Segmenter::segment(const VideoAsset &video,
                                                const std::vector<SubtitleCue> &cues,
                                                const std::vector<FrameSample> &frames,
                                                double max_chunk_duration) const
{
    if (!(max_chunk_duration > 0.0))
    {
        throw MalformedInputError("max_chunk_duration must be positive, got " + std::to_string(max_chunk_duration));
    }

    std::vector<TranscriptChunk> chunks;
    if (cues.empty())
    {
        return chunks;
    }
    validateCues(cues);

    const bool clamp = video.duration_seconds > 0.0;
    const double silence_gap = config_.silence_gap_seconds;

    bool open = false;
    double cur_start = 0.0;
    double cur_end = 0.0;
    std::string cur_text;
    double floor = -std::numeric_limits<double>::infinity(); // End of the last closed chunk

    auto close_chunk = [&]()
    {
        if (!open)
            return;
        TranscriptChunk chunk;
        chunk.video_id = video.id;
        chunk.start = cur_start;
        chunk.end = cur_end;
        chunk.id = makeChunkId(video.id, cur_start, cur_end);
        chunk.text = normalizeWhitespace(cur_text);
        chunk.frame = nearestFrame(frames, cur_start + (cur_end - cur_start) / 2.0);
        chunks.push_back(std::move(chunk));
        floor = cur_end;
        open = false;
        cur_text.clear();
    };

    for (size_t i = 0; i < cues.size(); ++i)
    {
        const SubtitleCue &cue = cues[i];
        if (clamp && cue.start >= video.duration_seconds)
        {
            Logger::warn("Dropping cue " + std::to_string(i) + " of video " + video.id + " starting at " +
                         std::to_string(cue.start) + "s, past the video duration of " +
                         std::to_string(video.duration_seconds) + "s");
            continue;
        }
        const double cue_end = clamp ? std::min(cue.end, video.duration_seconds) : cue.end;

        if (open)
        {
            bool gap_exceeded = cue.start - cur_end > silence_gap;
            bool too_long = std::max(cur_end, cue_end) - cur_start > max_chunk_duration;
            if (!gap_exceeded && !too_long)
            {
                cur_end = std::max(cur_end, cue_end);
                cur_text += ' ';
                cur_text += cue.text;
                continue;
            }
            close_chunk();
        }

        // Overlapping cues start the next chunk where the previous one ended
        double start = std::max(cue.start, floor);
        double end = cue_end;
        if (end - start > max_chunk_duration)
        {
            end = start + max_chunk_duration;
            while (end - start > max_chunk_duration)
                end = std::nextafter(end, start);
        }

        if (end <= start)
        {
            if (!chunks.empty())
            {
                TranscriptChunk &previous = chunks.back();
                previous.text = normalizeWhitespace(previous.text + " " + cue.text);
            }
            else
            {
                Logger::warn("Dropping empty-range cue " + std::to_string(i) + " of video " + video.id);
            }
            continue;
        }

        open = true;
        cur_start = start;
        cur_end = end;
        cur_text = cue.text;
    }
    close_chunk();

    Logger::debug("Segmented " + std::to_string(cues.size()) + " cues of video " + video.id + " into " +
                  std::to_string(chunks.size()) + " chunks");
    return chunks;
}

void Segmenter::validateCues(const std::vector<SubtitleCue> &cues)
{
    for (size_t i = 0; i < cues.size(); ++i)
    {
        const SubtitleCue &cue = cues[i];
        if (std::isnan(cue.start) || std::isnan(cue.end) || cue.start < 0.0)
        {
            throw MalformedInputError("Cue has an invalid timestamp", i);
        }
        if (cue.end < cue.start)
        {
            throw MalformedInputError("Cue ends before it starts", i);
        }
        if (i > 0 && cue.start < cues[i - 1].start)
        {
            throw MalformedInputError("Cue starts before the previous cue", i);
        }
    }
}

std::optional<FrameSample> Segmenter::nearestFrame(const std::vector<FrameSample> &frames, double timestamp)
{
    const FrameSample *best = nullptr;
    double best_distance = 0.0;
    for (const auto &frame : frames)
    {
        double distance = std::fabs(frame.timestamp - timestamp);
        if (!best || distance < best_distance ||
            (distance == best_distance && frame.timestamp < best->timestamp))
        {
            best = &frame;
            best_distance = distance;
        }
    }
    if (!best)
        return std::nullopt;
    return *best;
}

std::string Segmenter::normalizeWhitespace(const std::string &text)
{
    std::string out;
    out.reserve(text.size());
    bool pending_space = false;
    for (char c : text)
    {
        if (std::isspace(static_cast<unsigned char>(c)))
        {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space)
        {
            out.push_back(' ');
            pending_space = false;
        }
        out.push_back(c);
    }
    return out;
}
