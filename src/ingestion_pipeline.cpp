#include "core/ingestion_pipeline.hpp"
#include "core/errors.hpp"
#include "core/file_utils.hpp"
#include "core/frame_sampler.hpp"
#include "core/subtitle_parser.hpp"
#include "database/chunk_store.hpp"
#include "logging/logger.hpp"

IngestionPipeline::IngestionPipeline(std::shared_ptr<MediaAnalyzer> analyzer,
                                     std::shared_ptr<ChunkStore> store,
                                     std::shared_ptr<Indexer> indexer,
                                     SegmenterConfig segmenter_config,
                                     IngestionConfig config)
    : analyzer_(std::move(analyzer)), store_(std::move(store)), indexer_(std::move(indexer)),
      segmenter_(segmenter_config), config_(config)
{
    if (!analyzer_ || !store_ || !indexer_)
    {
        throw std::invalid_argument("IngestionPipeline requires a media analyzer, a chunk store and an indexer");
    }
}

const std::vector<std::string> &IngestionPipeline::videoExtensions()
{
    static const std::vector<std::string> extensions = {".mp4", ".mkv", ".webm", ".mov", ".avi"};
    return extensions;
}

IngestionReport IngestionPipeline::ingest(const std::string &video_id, const std::string &media_path,
                                          const std::string &subtitle_path)
{
    IngestionReport report;
    report.video_id = video_id;
    Logger::info("Ingesting video " + video_id + " from " + media_path);

    try
    {
        if (video_id.empty())
        {
            throw MalformedInputError("Video id is empty for " + media_path);
        }

        MediaProbe probe = analyzer_->probe(media_path);

        VideoAsset video;
        video.id = video_id;
        video.media_path = media_path;
        video.duration_seconds = probe.duration_seconds;
        video.frame_rate = probe.frame_rate;
        video.frame_sample_interval_seconds = config_.frame_sample_interval_seconds;

        std::vector<SubtitleCue> cues = SubtitleParser::parseFile(subtitle_path, video_id);
        report.cues = cues.size();

        std::vector<FrameSample> frames;
        try
        {
            frames = analyzer_->sampleFrames(video, config_.frame_sample_interval_seconds);
        }
        catch (const MediaExtractionError &e)
        {
            // Chunks stay usable without frame references
            Logger::warn("Frame sampling failed for " + video_id + ", continuing without frames: " + e.what());
        }
        report.frames = frames.size();

        std::vector<TranscriptChunk> chunks = segmenter_.segment(video, cues, frames);
        report.chunks = chunks.size();

        DBOpResult registered = store_->registerVideo(video);
        if (!registered.success)
        {
            throw LecternError("Failed to register video " + video_id + ": " + registered.error_message);
        }

        std::vector<std::string> superseded;
        DBOpResult stored = store_->replaceChunks(video_id, chunks, &superseded);
        if (!stored.success)
        {
            throw LecternError("Failed to store chunks for " + video_id + ": " + stored.error_message);
        }
        report.superseded = superseded.size();
        indexer_->removeChunks(superseded);

        IndexReport indexed = indexer_->indexWithReport(chunks);
        report.vectors_written = indexed.written;
        report.failures = indexed.failures;
        report.success = true;

        Logger::info("Ingested " + video_id + " - cues: " + std::to_string(report.cues) + ", frames: " +
                     std::to_string(report.frames) + ", chunks: " + std::to_string(report.chunks) +
                     ", vectors: " + std::to_string(report.vectors_written) +
                     (indexed.partial() ? ", failed chunks: " + std::to_string(indexed.failures.size()) : ""));
    }
    catch (const MalformedInputError &e)
    {
        report.error_message = e.what();
        Logger::error("Malformed input for video " + video_id + ": " + e.what());
    }
    catch (const std::exception &e)
    {
        report.error_message = e.what();
        Logger::error("Failed to ingest video " + video_id + ": " + e.what());
    }
    return report;
}

std::vector<IngestionReport> IngestionPipeline::ingestDirectory(const std::string &dir_path)
{
    std::vector<IngestionReport> reports;
    if (!FileUtils::isValidDirectory(dir_path))
    {
        Logger::error("Ingestion directory does not exist: " + dir_path);
        return reports;
    }

    DirectorySubtitleSource subtitles(dir_path);
    for (const auto &media_path : FileUtils::listFiles(dir_path, videoExtensions()))
    {
        const std::string video_id = fs::path(media_path).stem().string();
        auto subtitle_path = subtitles.findSubtitleFile(video_id);
        if (!subtitle_path)
        {
            Logger::warn("Skipping " + media_path + ": no " + video_id + ".vtt or " + video_id + ".srt");
            continue;
        }
        reports.push_back(ingest(video_id, media_path, *subtitle_path));
    }

    size_t succeeded = 0;
    for (const auto &report : reports)
    {
        if (report.success)
            ++succeeded;
    }
    Logger::info("Directory ingestion completed - " + std::to_string(succeeded) + " of " +
                 std::to_string(reports.size()) + " videos ingested from " + dir_path);
    return reports;
}
