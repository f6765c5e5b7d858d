#pragma once

#include <memory>
#include <string>
#include <vector>
#include "core/indexer.hpp"
#include "core/segmenter.hpp"

class ChunkStore;
class MediaAnalyzer;

struct IngestionConfig
{
    double frame_sample_interval_seconds = 10.0;
};

/**
 * @brief Outcome of ingesting one video
 */
struct IngestionReport
{
    std::string video_id;
    bool success = false;
    std::string error_message;
    size_t cues = 0;
    size_t frames = 0;
    size_t chunks = 0;
    size_t vectors_written = 0;
    size_t superseded = 0;
    std::vector<ChunkFailure> failures; // Chunks whose embedding failed
};

/**
 * @brief Takes a video and its subtitles from disk to indexed chunks
 *
 * probe -> parse cues -> sample frames -> segment -> register -> store chunks
 * -> drop vectors of superseded chunks -> index. Re-ingesting a video replaces
 * its previous chunk set.
 */
class IngestionPipeline
{
public:
    IngestionPipeline(std::shared_ptr<MediaAnalyzer> analyzer,
                      std::shared_ptr<ChunkStore> store,
                      std::shared_ptr<Indexer> indexer,
                      SegmenterConfig segmenter_config = SegmenterConfig(),
                      IngestionConfig config = IngestionConfig());

    /**
     * @brief Ingest one video. Never throws for bad input; failures land in the report.
     */
    IngestionReport ingest(const std::string &video_id, const std::string &media_path,
                           const std::string &subtitle_path);

    /**
     * @brief Ingest every video in a directory that has a subtitle file with the same stem
     *
     * A failing video does not stop the others.
     */
    std::vector<IngestionReport> ingestDirectory(const std::string &dir_path);

    static const std::vector<std::string> &videoExtensions();

private:
    std::shared_ptr<MediaAnalyzer> analyzer_;
    std::shared_ptr<ChunkStore> store_;
    std::shared_ptr<Indexer> indexer_;
    Segmenter segmenter_;
    IngestionConfig config_;
};
