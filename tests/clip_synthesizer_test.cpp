#include "test_base.hpp"
#include "core/clip_synthesizer.hpp"
#include "core/cache/clip_cache.hpp"
#include "core/errors.hpp"
#include "stubs/fake_services.hpp"
#include <thread>

class ClipSynthesizerTest : public TestBase
{
protected:
    void SetUp() override
    {
        TestBase::SetUp();
        media_ = std::make_shared<InMemoryMediaStore>();
        media_->addVideo("lec1", 600.0);
        ClipCacheConfig config;
        config.cache_dir = (test_dir_ / "clips").string();
        cache_ = std::make_shared<ClipCache>(config);
        synthesizer_ = std::make_shared<ClipSynthesizer>(media_, cache_);
    }

    std::shared_ptr<InMemoryMediaStore> media_;
    std::shared_ptr<ClipCache> cache_;
    std::shared_ptr<ClipSynthesizer> synthesizer_;
};

TEST_F(ClipSynthesizerTest, NearbyRequestsShareAFingerprint)
{
    auto a = ClipSynthesizer::snapRange(10.0, 15.0, 0.5);
    auto b = ClipSynthesizer::snapRange(10.2, 15.1, 0.5);
    EXPECT_EQ(a, b);
    EXPECT_EQ(ClipSynthesizer::fingerprint("lec1", a.first, a.second),
              ClipSynthesizer::fingerprint("lec1", b.first, b.second));
    EXPECT_NE(ClipSynthesizer::fingerprint("lec1", a.first, a.second),
              ClipSynthesizer::fingerprint("lec2", a.first, a.second));
}

TEST_F(ClipSynthesizerTest, SnapRangeNeverCollapses)
{
    auto snapped = ClipSynthesizer::snapRange(3.1, 3.2, 0.5);
    EXPECT_DOUBLE_EQ(snapped.first, 3.0);
    EXPECT_DOUBLE_EQ(snapped.second, 3.5);

    auto clamped = ClipSynthesizer::snapRange(-2.0, 1.0, 0.5);
    EXPECT_DOUBLE_EQ(clamped.first, 0.0);
    EXPECT_DOUBLE_EQ(clamped.second, 1.0);
}

TEST_F(ClipSynthesizerTest, SecondRequestIsServedFromCache)
{
    ClipArtifactRef first = synthesizer_->synthesize("lec1", 10.0, 15.0);
    ClipArtifactRef second = synthesizer_->synthesize("lec1", 10.2, 15.1);

    EXPECT_EQ(first, second);
    EXPECT_EQ(media_->extractions.load(), 1);
    EXPECT_DOUBLE_EQ(first->start(), 10.0);
    EXPECT_DOUBLE_EQ(first->end(), 15.0);
    EXPECT_EQ(cache_->stats().hits, 1u);
}

TEST_F(ClipSynthesizerTest, ConcurrentRequestsTriggerOneExtraction)
{
    media_->delay_ms = 200;
    const int kThreads = 8;
    std::vector<ClipArtifactRef> artifacts(kThreads);
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i)
    {
        threads.emplace_back([this, &artifacts, i]()
                             { artifacts[i] = synthesizer_->synthesize("lec1", 10.0 + 0.02 * i, 15.0); });
    }
    for (auto &thread : threads)
        thread.join();

    EXPECT_EQ(media_->extractions.load(), 1);
    for (const auto &artifact : artifacts)
    {
        ASSERT_NE(artifact, nullptr);
        EXPECT_EQ(artifact, artifacts[0]);
    }
    ClipCacheStats stats = cache_->stats();
    EXPECT_EQ(stats.extractions, 1u);
    EXPECT_GE(stats.hits + stats.coalesced_waits, 1u);
    EXPECT_LE(stats.hits + stats.coalesced_waits, static_cast<uint64_t>(kThreads - 1));
}

TEST_F(ClipSynthesizerTest, FailedExtractionIsNotCached)
{
    media_->fail = true;
    EXPECT_THROW(synthesizer_->synthesize("lec1", 10.0, 15.0), MediaExtractionError);
    EXPECT_EQ(cache_->stats().entries, 0u);

    media_->fail = false;
    ClipArtifactRef artifact = synthesizer_->synthesize("lec1", 10.0, 15.0);
    EXPECT_NE(artifact, nullptr);
    EXPECT_EQ(media_->extractions.load(), 2);
}

TEST_F(ClipSynthesizerTest, ConcurrentWaitersShareTheFailure)
{
    media_->delay_ms = 200;
    media_->fail = true;
    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i)
    {
        threads.emplace_back([this, &failures]()
                             {
            try
            {
                synthesizer_->synthesize("lec1", 20.0, 25.0);
            }
            catch (const MediaExtractionError &)
            {
                failures.fetch_add(1);
            } });
    }
    for (auto &thread : threads)
        thread.join();

    EXPECT_EQ(failures.load(), 4);
    EXPECT_LE(media_->extractions.load(), 4);
    EXPECT_EQ(cache_->peek(ClipSynthesizer::fingerprint("lec1", 20.0, 25.0)), nullptr);
}

TEST_F(ClipSynthesizerTest, UnknownVideoFails)
{
    EXPECT_THROW(synthesizer_->synthesize("missing", 0.0, 5.0), MediaExtractionError);
    EXPECT_EQ(media_->extractions.load(), 0);
}

TEST_F(ClipSynthesizerTest, RangeIsCheckedAgainstDuration)
{
    media_->addVideo("short", 30.0);
    EXPECT_THROW(synthesizer_->synthesize("short", 40.0, 45.0), MediaExtractionError);

    ClipArtifactRef clamped = synthesizer_->synthesize("short", 25.0, 35.0);
    EXPECT_DOUBLE_EQ(clamped->end(), 30.0);
}

TEST_F(ClipSynthesizerTest, TailRangeRoundedPastTheEndIsClamped)
{
    // 11.8 snaps up to 12.0, which lies beyond the 11.95s video
    media_->addVideo("tail", 11.95);
    ClipArtifactRef clip = synthesizer_->synthesize("tail", 11.8, 11.95);

    ASSERT_NE(clip, nullptr);
    EXPECT_DOUBLE_EQ(clip->start(), 11.5);
    EXPECT_DOUBLE_EQ(clip->end(), 11.95);
    EXPECT_LT(clip->start(), clip->end());
    EXPECT_EQ(media_->extractions.load(), 1);

    // A duration that falls on the grid clamps to the step before it
    media_->addVideo("exact", 12.0);
    ClipArtifactRef exact = synthesizer_->synthesize("exact", 11.9, 12.0);
    EXPECT_DOUBLE_EQ(exact->start(), 11.5);
    EXPECT_DOUBLE_EQ(exact->end(), 12.0);
}

TEST_F(ClipSynthesizerTest, InvalidGranularityFallsBackToDefault)
{
    ClipSynthesizerConfig config;
    config.granularity_seconds = 0.0;
    ClipSynthesizer synthesizer(media_, cache_, config);
    EXPECT_DOUBLE_EQ(synthesizer.config().granularity_seconds, 0.5);
}
