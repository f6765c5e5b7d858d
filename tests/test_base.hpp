#pragma once

#include <gtest/gtest.h>
#include <filesystem>
#include <string>
#include <fstream>
#include <memory>
#include "database/chunk_store.hpp"
#include "core/poco_config_adapter.hpp"
#include "logging/logger.hpp"

/**
 * @brief Base class for tests that touch the filesystem or the catalog
 *
 * Every test gets its own scratch directory and an in-memory ChunkStore.
 */
class TestBase : public ::testing::Test
{
protected:
    void SetUp() override
    {
        Logger::init("WARN");

        const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string name = std::string(info->test_suite_name()) + "_" + info->name();
        for (auto &c : name)
        {
            if (c == '/')
                c = '_';
        }
        test_dir_ = std::filesystem::temp_directory_path() / ("lectern_test_" + name);
        std::filesystem::remove_all(test_dir_);
        std::filesystem::create_directories(test_dir_);

        store_ = std::make_shared<ChunkStore>(":memory:");
        ASSERT_TRUE(store_->isOpen());

        // Configuration is a process-wide singleton; start every test from defaults
        PocoConfigAdapter::getInstance().resetToDefaults();
    }

    void TearDown() override
    {
        store_.reset();
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    // Helper to create a file under the scratch directory
    std::string createFile(const std::string &filename, const std::string &content = "dummy content")
    {
        std::filesystem::path file_path = test_dir_ / filename;
        std::filesystem::create_directories(file_path.parent_path());
        std::ofstream ofs(file_path, std::ios::binary);
        ofs << content;
        ofs.close();
        return file_path.string();
    }

    // Registers a video and stores its chunks, returning the chunks
    std::vector<TranscriptChunk> storeChunks(const std::string &video_id, double duration,
                                             const std::vector<std::pair<std::pair<double, double>, std::string>> &ranges)
    {
        VideoAsset video;
        video.id = video_id;
        video.media_path = video_id + ".mp4";
        video.duration_seconds = duration;
        video.frame_rate = 25.0;
        video.frame_sample_interval_seconds = 10.0;
        EXPECT_TRUE(store_->registerVideo(video).success);

        std::vector<TranscriptChunk> chunks;
        for (const auto &range : ranges)
        {
            TranscriptChunk chunk;
            chunk.video_id = video_id;
            chunk.start = range.first.first;
            chunk.end = range.first.second;
            chunk.text = range.second;
            chunk.id = makeChunkId(video_id, chunk.start, chunk.end);
            chunks.push_back(chunk);
        }
        EXPECT_TRUE(store_->replaceChunks(video_id, chunks).success);
        return chunks;
    }

    std::string testDir() const { return test_dir_.string(); }

    std::filesystem::path test_dir_;
    std::shared_ptr<ChunkStore> store_;
};
