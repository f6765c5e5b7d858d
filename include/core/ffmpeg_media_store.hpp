#pragma once

#include <memory>
#include <string>
#include <vector>
#include "core/capabilities.hpp"

class ChunkStore;

/**
 * @brief Container-level facts about a media file
 */
struct MediaProbe
{
    double duration_seconds = 0.0;
    double frame_rate = 0.0;
    int width = 0;
    int height = 0;
};

/**
 * @brief MediaStore reading registered videos from disk with libavformat
 *
 * Clips are produced by stream copy (no re-encode) into an in-memory container,
 * starting at the keyframe at or before the requested start.
 */
class FFmpegMediaStore : public MediaStore
{
public:
    /**
     * @param catalog Catalog resolving video ids to media paths
     * @param container Output container short name understood by libavformat (mp4, matroska, ...)
     */
    FFmpegMediaStore(std::shared_ptr<ChunkStore> catalog, std::string container = "mp4");

    MediaHandle open(const std::string &video_id) override;
    std::vector<uint8_t> extract(const MediaHandle &handle, double start, double end) override;

    /**
     * @brief Read duration, frame rate and size of the first video stream
     * @throws MediaExtractionError when the file cannot be opened or has no video stream
     */
    static MediaProbe probe(const std::string &media_path);

private:
    std::shared_ptr<ChunkStore> catalog_;
    std::string container_;
};
