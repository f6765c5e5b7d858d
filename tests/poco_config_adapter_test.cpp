#include <gtest/gtest.h>
#include "core/poco_config_adapter.hpp"
#include "core/config_observer.hpp"
#include "core/logger_observer.hpp"
#include "core/thread_pool_manager.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <fstream>
#include <filesystem>

/**
 * @brief Observer that records every event it receives
 */
class RecordingObserver : public ConfigObserver
{
public:
    void onConfigUpdate(const ConfigUpdateEvent &event) override
    {
        events.push_back(event);
    }

    bool sawKey(const std::string &key) const
    {
        for (const auto &event : events)
        {
            if (std::find(event.changed_keys.begin(), event.changed_keys.end(), key) != event.changed_keys.end())
                return true;
        }
        return false;
    }

    std::vector<ConfigUpdateEvent> events;
};

class PocoConfigAdapterTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        // Initialize logger for tests
        Logger::init("WARN");

        // Create a temporary test config file
        test_config_path_ = "test_lectern_config.json";
        createTestConfig();

        auto &config = PocoConfigAdapter::getInstance();
        config.resetToDefaults();
        ASSERT_TRUE(config.loadConfig(test_config_path_));
    }

    void TearDown() override
    {
        PocoConfigAdapter::getInstance().resetToDefaults();
        ThreadPoolManager::shutdown();
        Logger::setLevel("WARN");

        // Clean up test files
        if (std::filesystem::exists(test_config_path_))
        {
            std::filesystem::remove(test_config_path_);
        }
    }

    void createTestConfig()
    {
        std::ofstream config_file(test_config_path_);
        config_file << R"({
            "log_level": "DEBUG",
            "database_path": "test.db",
            "segmenter": {
                "max_chunk_duration_seconds": 45.0,
                "silence_gap_seconds": 1.5
            },
            "frames": {
                "sample_interval_seconds": 10.0
            },
            "indexer": {
                "max_retries": 5,
                "backoff_base_ms": 50,
                "threads": 2
            },
            "retrieval": {
                "overfetch_factor": 4,
                "merge_gap_seconds": 2.0
            },
            "clip": {
                "granularity_seconds": 1.0,
                "cache_dir": "test_clips",
                "max_cache_size_mb": 16,
                "max_age_seconds": 600,
                "container": "mkv"
            },
            "composer": {
                "max_context_chars": 3000
            },
            "timeouts": {
                "embedding_ms": 1000,
                "search_ms": 2000,
                "generation_ms": 3000,
                "extraction_ms": 4000
            },
            "services": {
                "embedding_url": "http://embed.test:11434",
                "embedding_model": "test-embed",
                "vector_url": "http://qdrant.test:6333",
                "vector_collection": "test_chunks",
                "vector_dimensions": 128
            }
        })";
        config_file.close();
    }

    std::string test_config_path_;
};

// Test basic functionality
TEST_F(PocoConfigAdapterTest, SingletonPattern)
{
    auto &instance1 = PocoConfigAdapter::getInstance();
    auto &instance2 = PocoConfigAdapter::getInstance();

    EXPECT_EQ(&instance1, &instance2);
}

TEST_F(PocoConfigAdapterTest, ConfigurationGetters)
{
    auto &config = PocoConfigAdapter::getInstance();

    EXPECT_EQ(config.getLogLevel(), "DEBUG");
    EXPECT_EQ(config.getDatabasePath(), "test.db");
    EXPECT_DOUBLE_EQ(config.getFrameSampleIntervalSeconds(), 10.0);
    EXPECT_EQ(config.getVectorDimensions(), 128);

    SegmenterConfig segmenter = config.getSegmenterConfig();
    EXPECT_DOUBLE_EQ(segmenter.max_chunk_duration_seconds, 45.0);
    EXPECT_DOUBLE_EQ(segmenter.silence_gap_seconds, 1.5);

    IndexerConfig indexer = config.getIndexerConfig();
    EXPECT_EQ(indexer.max_retries, 5);
    EXPECT_EQ(indexer.backoff_base_ms, 50);
    EXPECT_EQ(indexer.threads, 2);

    RetrieverConfig retriever = config.getRetrieverConfig();
    EXPECT_EQ(retriever.overfetch_factor, 4);
    EXPECT_DOUBLE_EQ(retriever.merge_gap_seconds, 2.0);

    ClipCacheConfig cache = config.getClipCacheConfig();
    EXPECT_EQ(cache.cache_dir, "test_clips");
    EXPECT_EQ(cache.max_size_bytes, 16u * 1024 * 1024);
    EXPECT_EQ(cache.max_age_seconds, 600);
    EXPECT_EQ(cache.container, "mkv");
    EXPECT_DOUBLE_EQ(config.getClipSynthesizerConfig().granularity_seconds, 1.0);

    EXPECT_EQ(config.getComposerConfig().max_context_chars, 3000u);

    OrchestratorConfig timeouts = config.getOrchestratorConfig();
    EXPECT_EQ(timeouts.embedding_timeout_ms, 1000);
    EXPECT_EQ(timeouts.search_timeout_ms, 2000);
    EXPECT_EQ(timeouts.generation_timeout_ms, 3000);
    EXPECT_EQ(timeouts.extraction_timeout_ms, 4000);

    ServiceEndpoints endpoints = config.getServiceEndpoints();
    EXPECT_EQ(endpoints.embedding_url, "http://embed.test:11434");
    EXPECT_EQ(endpoints.embedding_model, "test-embed");
    EXPECT_EQ(endpoints.vector_url, "http://qdrant.test:6333");
    EXPECT_EQ(endpoints.vector_collection, "test_chunks");
    EXPECT_EQ(endpoints.vector_dimensions, 128);
}

TEST_F(PocoConfigAdapterTest, MissingKeysFallBackToDefaults)
{
    auto &config = PocoConfigAdapter::getInstance();
    config.resetToDefaults();

    EXPECT_EQ(config.getLogLevel(), "INFO");
    EXPECT_EQ(config.getDatabasePath(), "lectern.db");
    EXPECT_DOUBLE_EQ(config.getSegmenterConfig().max_chunk_duration_seconds, 30.0);
    EXPECT_DOUBLE_EQ(config.getClipSynthesizerConfig().granularity_seconds, 0.5);
    EXPECT_EQ(config.getOrchestratorConfig().generation_timeout_ms, 30000);
    EXPECT_EQ(config.getEmbeddingCacheCapacity(), 4096u);
    EXPECT_TRUE(config.validateConfig());
}

TEST_F(PocoConfigAdapterTest, UpdatePublishesChangedKeys)
{
    auto &config = PocoConfigAdapter::getInstance();
    RecordingObserver observer;
    config.subscribe(&observer);

    config.updateConfig(R"({"retrieval": {"merge_gap_seconds": 3.5}, "log_level": "WARN"})", "cli");

    config.unsubscribe(&observer);
    ASSERT_EQ(observer.events.size(), 1u);
    EXPECT_EQ(observer.events[0].source, "cli");
    EXPECT_FALSE(observer.events[0].update_id.empty());
    EXPECT_TRUE(observer.sawKey("retrieval.merge_gap_seconds"));
    EXPECT_TRUE(observer.sawKey("log_level"));
    EXPECT_DOUBLE_EQ(config.getRetrieverConfig().merge_gap_seconds, 3.5);

    // Values not in the patch are untouched
    EXPECT_EQ(config.getRetrieverConfig().overfetch_factor, 4);
}

TEST_F(PocoConfigAdapterTest, UpdateIsPersistedToLoadedFile)
{
    auto &config = PocoConfigAdapter::getInstance();
    config.updateConfig(R"({"composer": {"max_context_chars": 1234}})");

    config.resetToDefaults();
    ASSERT_TRUE(config.loadConfig(test_config_path_));
    EXPECT_EQ(config.getComposerConfig().max_context_chars, 1234u);
}

TEST_F(PocoConfigAdapterTest, InvalidJsonIsIgnored)
{
    auto &config = PocoConfigAdapter::getInstance();
    RecordingObserver observer;
    config.subscribe(&observer);

    config.updateConfig("{not json");
    config.updateConfig("[1, 2, 3]");

    config.unsubscribe(&observer);
    EXPECT_TRUE(observer.events.empty());
    EXPECT_EQ(config.getLogLevel(), "DEBUG");
}

TEST_F(PocoConfigAdapterTest, LoadingMissingFileFails)
{
    auto &config = PocoConfigAdapter::getInstance();
    EXPECT_FALSE(config.loadConfig("does_not_exist.json"));
    EXPECT_EQ(config.getLogLevel(), "DEBUG");
}

TEST_F(PocoConfigAdapterTest, ValidationReportsBadValues)
{
    auto &config = PocoConfigAdapter::getInstance();
    EXPECT_TRUE(config.validateConfig());

    config.updateConfig(R"({"log_level": "LOUD", "clip": {"granularity_seconds": 0}, "indexer": {"max_retries": 0}})");

    auto errors = config.validationErrors();
    EXPECT_FALSE(config.validateConfig());
    EXPECT_EQ(errors.size(), 3u);
    auto mentions = [&errors](const std::string &key)
    {
        return std::any_of(errors.begin(), errors.end(), [&key](const std::string &error)
                           { return error.find(key) != std::string::npos; });
    };
    EXPECT_TRUE(mentions("log_level"));
    EXPECT_TRUE(mentions("clip.granularity_seconds"));
    EXPECT_TRUE(mentions("indexer.max_retries"));
}

TEST_F(PocoConfigAdapterTest, LoggerObserverAppliesLevel)
{
    auto &config = PocoConfigAdapter::getInstance();
    LoggerObserver observer(config);
    config.subscribe(&observer);

    config.setLogLevel("ERROR");
    EXPECT_EQ(observer.appliedLevel(), "ERROR");
    EXPECT_EQ(Logger::getLogger()->level(), spdlog::level::err);

    // Unrelated keys leave the level alone
    config.updateConfig(R"({"retrieval": {"overfetch_factor": 2}})");
    EXPECT_EQ(observer.appliedLevel(), "ERROR");

    config.unsubscribe(&observer);
}

TEST_F(PocoConfigAdapterTest, ThreadPoolFollowsIndexerThreads)
{
    auto &config = PocoConfigAdapter::getInstance();
    ThreadPoolManager::initialize(static_cast<size_t>(config.getIndexerConfig().threads));
    ASSERT_TRUE(ThreadPoolManager::isInitialized());
    EXPECT_EQ(ThreadPoolManager::getCurrentThreadCount(), 2u);

    ThreadPoolManager observer(config);
    config.subscribe(&observer);

    config.updateConfig(R"({"indexer": {"threads": 3}})");
    EXPECT_EQ(ThreadPoolManager::getCurrentThreadCount(), 3u);

    // Out of range values are rejected and the pool keeps its size
    config.updateConfig(R"({"indexer": {"threads": 0}})");
    EXPECT_EQ(ThreadPoolManager::getCurrentThreadCount(), 3u);

    config.unsubscribe(&observer);
}
