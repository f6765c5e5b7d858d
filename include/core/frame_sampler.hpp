#pragma once

#include <string>
#include <vector>
#include "core/ffmpeg_media_store.hpp"
#include "core/media_types.hpp"

/**
 * @brief Media inspection used during ingestion
 */
class MediaAnalyzer
{
public:
    virtual ~MediaAnalyzer() = default;

    virtual MediaProbe probe(const std::string &media_path) = 0;

    /**
     * @brief Extract one frame every interval_seconds
     * @throws MalformedInputError if interval_seconds <= 0
     * @throws MediaExtractionError when the video cannot be decoded
     */
    virtual std::vector<FrameSample> sampleFrames(const VideoAsset &video, double interval_seconds) = 0;
};

/**
 * @brief MediaAnalyzer decoding with libavcodec and storing frames as JPEG with OpenCV
 *
 * Frames are written to <output_dir>/<video_id>/f<NNNNNN>.jpg.
 */
class FFmpegMediaAnalyzer : public MediaAnalyzer
{
public:
    explicit FFmpegMediaAnalyzer(std::string output_dir);

    MediaProbe probe(const std::string &media_path) override;
    std::vector<FrameSample> sampleFrames(const VideoAsset &video, double interval_seconds) override;

private:
    std::string output_dir_;
};
