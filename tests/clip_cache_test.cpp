#include "test_base.hpp"
#include "core/cache/clip_cache.hpp"
#include "core/errors.hpp"
#include <nlohmann/json.hpp>

class ClipCacheTest : public TestBase
{
protected:
    ClipCacheConfig configFor(std::uintmax_t max_bytes = 1024 * 1024, int64_t max_age = 0)
    {
        ClipCacheConfig config;
        config.cache_dir = (test_dir_ / "clips").string();
        config.max_size_bytes = max_bytes;
        config.max_age_seconds = max_age;
        config.container = "mp4";
        return config;
    }

    static std::vector<uint8_t> bytes(size_t n, uint8_t fill = 7)
    {
        return std::vector<uint8_t>(n, fill);
    }
};

TEST_F(ClipCacheTest, PublishThenLookup)
{
    ClipCache cache(configFor());
    EXPECT_EQ(cache.lookup("fp1"), nullptr);

    ClipArtifactRef published = cache.publish("fp1", "lec1", 10.0, 15.0, bytes(32));
    ASSERT_NE(published, nullptr);
    EXPECT_TRUE(std::filesystem::exists(published->path()));
    EXPECT_EQ(published->sizeBytes(), 32u);
    EXPECT_EQ(published->path().extension(), ".mp4");

    ClipArtifactRef found = cache.lookup("fp1");
    EXPECT_EQ(found, published);

    ClipCacheStats stats = cache.stats();
    EXPECT_EQ(stats.entries, 1u);
    EXPECT_EQ(stats.bytes, 32u);
    EXPECT_EQ(stats.hits, 1u);
    EXPECT_EQ(stats.misses, 1u);
}

TEST_F(ClipCacheTest, PeekDoesNotCount)
{
    ClipCache cache(configFor());
    cache.publish("fp1", "lec1", 0.0, 1.0, bytes(4));
    EXPECT_NE(cache.peek("fp1"), nullptr);
    EXPECT_EQ(cache.peek("missing"), nullptr);
    EXPECT_EQ(cache.stats().hits, 0u);
    EXPECT_EQ(cache.stats().misses, 0u);
}

TEST_F(ClipCacheTest, EvictedClipSurvivesWhileHeld)
{
    ClipCache cache(configFor(10));
    ClipArtifactRef held = cache.publish("aaa", "lec1", 0.0, 5.0, bytes(8));
    cache.publish("bbb", "lec1", 5.0, 10.0, bytes(8));

    EXPECT_EQ(cache.evict(), 1u);

    EXPECT_EQ(cache.peek("aaa"), nullptr);
    EXPECT_NE(cache.peek("bbb"), nullptr);
    EXPECT_TRUE(held->isEvicted());
    std::filesystem::path held_path = held->path();
    EXPECT_TRUE(std::filesystem::exists(held_path));

    held.reset();
    EXPECT_FALSE(std::filesystem::exists(held_path));
    EXPECT_LE(cache.stats().bytes, 10u);
    EXPECT_EQ(cache.stats().evictions, 1u);
}

TEST_F(ClipCacheTest, RepublishReplacesPreviousArtifact)
{
    ClipCache cache(configFor());
    ClipArtifactRef first = cache.publish("fp1", "lec1", 0.0, 5.0, bytes(8));
    ClipArtifactRef second = cache.publish("fp1", "lec1", 0.0, 5.0, bytes(12));

    EXPECT_NE(first->path(), second->path());
    EXPECT_TRUE(first->isEvicted());
    EXPECT_EQ(cache.peek("fp1"), second);
    EXPECT_EQ(cache.stats().bytes, 12u);
}

TEST_F(ClipCacheTest, RestoreRebuildsIndexFromDisk)
{
    std::string first_path;
    {
        ClipCache cache(configFor());
        first_path = cache.publish("fp1", "lec1", 10.0, 15.0, bytes(16))->path().string();
        cache.publish("fp2", "lec2", 0.0, 5.0, bytes(8));
    }
    createFile("clips/orphan.mp4", "no metadata");
    createFile("clips/fp3.mp4.tmp.12345", "partial");

    ClipCache restored(configFor());
    EXPECT_EQ(restored.restore(), 2u);

    ClipArtifactRef artifact = restored.lookup("fp1");
    ASSERT_NE(artifact, nullptr);
    EXPECT_EQ(artifact->path().string(), first_path);
    EXPECT_EQ(artifact->videoId(), "lec1");
    EXPECT_DOUBLE_EQ(artifact->start(), 10.0);
    EXPECT_DOUBLE_EQ(artifact->end(), 15.0);
    EXPECT_EQ(restored.stats().bytes, 24u);

    EXPECT_FALSE(std::filesystem::exists(test_dir_ / "clips" / "orphan.mp4"));
    EXPECT_FALSE(std::filesystem::exists(test_dir_ / "clips" / "fp3.mp4.tmp.12345"));

    // A second restore must not disturb live artifacts
    EXPECT_EQ(restored.restore(), 2u);
    EXPECT_TRUE(std::filesystem::exists(first_path));
}

TEST_F(ClipCacheTest, RestoreDropsMetadataWithoutClip)
{
    {
        ClipCache cache(configFor());
        auto artifact = cache.publish("fp1", "lec1", 0.0, 5.0, bytes(8));
        std::filesystem::remove(artifact->path());
    }
    ClipCache restored(configFor());
    EXPECT_EQ(restored.restore(), 0u);
    EXPECT_EQ(restored.peek("fp1"), nullptr);
}

TEST_F(ClipCacheTest, AgeBoundEvictsExpiredClips)
{
    nlohmann::json meta = {{"fingerprint", "old"},
                           {"video_id", "lec1"},
                           {"start", 0.0},
                           {"end", 5.0},
                           {"file", "old-0-0.mp4"},
                           {"created_at", 1000}};
    createFile("clips/old-0-0.mp4", "stale clip");
    createFile("clips/old-0-0.json", meta.dump());

    ClipCache cache(configFor(1024 * 1024, 3600));
    ASSERT_EQ(cache.restore(), 1u);
    cache.publish("fresh", "lec1", 5.0, 10.0, bytes(4));

    EXPECT_EQ(cache.evict(), 1u);
    EXPECT_EQ(cache.peek("old"), nullptr);
    EXPECT_NE(cache.peek("fresh"), nullptr);
    EXPECT_FALSE(std::filesystem::exists(test_dir_ / "clips" / "old-0-0.mp4"));
}

TEST_F(ClipCacheTest, ExpiredClipIsAMissBeforeEviction)
{
    nlohmann::json meta = {{"fingerprint", "stale"},
                           {"video_id", "lec1"},
                           {"start", 0.0},
                           {"end", 5.0},
                           {"file", "stale-0-0.mp4"},
                           {"created_at", static_cast<int64_t>(std::time(nullptr)) - 2 * 86400}};
    createFile("clips/stale-0-0.mp4", "two days old");
    createFile("clips/stale-0-0.json", meta.dump());

    ClipCache cache(configFor(1024 * 1024, 86400));
    ASSERT_EQ(cache.restore(), 1u);

    EXPECT_EQ(cache.lookup("stale"), nullptr);
    EXPECT_EQ(cache.peek("stale"), nullptr);
    EXPECT_EQ(cache.stats().misses, 1u);
    EXPECT_EQ(cache.stats().hits, 0u);

    // A fresh publication under the same fingerprint is served and survives eviction
    ClipArtifactRef fresh = cache.publish("stale", "lec1", 0.0, 5.0, bytes(4));
    EXPECT_EQ(cache.evict(), 0u);
    EXPECT_EQ(cache.lookup("stale"), fresh);
    EXPECT_TRUE(std::filesystem::exists(fresh->path()));
}

TEST_F(ClipCacheTest, RestoreSkipsMetadataWithWrongTypes)
{
    createFile("clips/a.mp4", "clip a");
    createFile("clips/a.json", R"({"fingerprint": "fa", "file": 5})");
    createFile("clips/b.mp4", "clip b");
    createFile("clips/b.json", R"({"fingerprint": ["fb"], "file": "b.mp4"})");
    createFile("clips/c.mp4", "clip c");
    createFile("clips/c.json", R"({"fingerprint": "fc", "file": "c.mp4", "start": "ten"})");
    createFile("clips/d.json", R"([1, 2, 3])");

    ClipCache cache(configFor());
    ClipArtifactRef good = cache.publish("fgood", "lec1", 0.0, 5.0, bytes(4));

    ClipCache restored(configFor());
    EXPECT_EQ(restored.restore(), 1u);
    EXPECT_NE(restored.peek("fgood"), nullptr);
    EXPECT_EQ(restored.peek("fa"), nullptr);
    EXPECT_EQ(restored.peek("fb"), nullptr);
    EXPECT_EQ(restored.peek("fc"), nullptr);
    EXPECT_FALSE(std::filesystem::exists(test_dir_ / "clips" / "a.json"));
    EXPECT_FALSE(std::filesystem::exists(test_dir_ / "clips" / "d.json"));
}

TEST_F(ClipCacheTest, RestoreNeverReachesOutsideTheCacheDirectory)
{
    std::string outside = createFile("keep_me.txt", "not a clip");
    nlohmann::json meta = {{"fingerprint", "escape"}, {"file", "../keep_me.txt"}, {"created_at", 0}};
    createFile("clips/escape.json", meta.dump());

    ClipCache cache(configFor(1024 * 1024, 60));
    EXPECT_EQ(cache.restore(), 0u);
    EXPECT_EQ(cache.peek("escape"), nullptr);
    cache.evict();

    EXPECT_TRUE(std::filesystem::exists(outside));
    EXPECT_FALSE(std::filesystem::exists(test_dir_ / "clips" / "escape.json"));
}
