#include <gtest/gtest.h>
#include "core/segmenter.hpp"
#include "core/errors.hpp"
#include "logging/logger.hpp"
#include <tuple>

class SegmenterTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        Logger::init("WARN");
        video_.id = "lec1";
        video_.media_path = "lec1.mp4";
        video_.duration_seconds = 600.0;
    }

    SubtitleCue cue(double start, double end, const std::string &text)
    {
        return SubtitleCue{video_.id, start, end, text};
    }

    VideoAsset video_;
};

TEST_F(SegmenterTest, AdjacentCuesMergeIntoOneChunk)
{
    Segmenter segmenter;
    auto chunks = segmenter.segment(video_, {cue(0, 5, "Today we cover"), cue(5, 12, "gradient descent.")}, {}, 30.0);

    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_DOUBLE_EQ(chunks[0].start, 0.0);
    EXPECT_DOUBLE_EQ(chunks[0].end, 12.0);
    EXPECT_EQ(chunks[0].text, "Today we cover gradient descent.");
    EXPECT_EQ(chunks[0].video_id, "lec1");
    EXPECT_EQ(chunks[0].id, "lec1#0-12000");
}

TEST_F(SegmenterTest, MaximumDurationClosesChunk)
{
    Segmenter segmenter;
    auto chunks = segmenter.segment(video_,
                                    {cue(0, 10, "one"), cue(10, 20, "two"), cue(20, 30, "three"), cue(30, 40, "four")},
                                    {}, 25.0);

    ASSERT_EQ(chunks.size(), 2u);
    EXPECT_DOUBLE_EQ(chunks[0].end, 20.0);
    EXPECT_EQ(chunks[0].text, "one two");
    EXPECT_DOUBLE_EQ(chunks[1].start, 20.0);
    EXPECT_DOUBLE_EQ(chunks[1].end, 40.0);
    for (const auto &chunk : chunks)
        EXPECT_LE(chunk.duration(), 25.0);
}

TEST_F(SegmenterTest, SilenceGapClosesChunk)
{
    SegmenterConfig config;
    config.silence_gap_seconds = 2.0;
    Segmenter segmenter(config);

    auto chunks = segmenter.segment(video_, {cue(0, 5, "before the break"), cue(8, 10, "after the break")}, {});

    ASSERT_EQ(chunks.size(), 2u);
    EXPECT_EQ(chunks[0].text, "before the break");
    EXPECT_EQ(chunks[1].text, "after the break");
}

TEST_F(SegmenterTest, SingleCueLongerThanMaximumIsTruncated)
{
    Segmenter segmenter;
    auto chunks = segmenter.segment(video_, {cue(0, 50, "a very long monologue")}, {}, 20.0);

    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_DOUBLE_EQ(chunks[0].start, 0.0);
    EXPECT_LE(chunks[0].duration(), 20.0);
    EXPECT_EQ(chunks[0].text, "a very long monologue");
}

TEST_F(SegmenterTest, OverlappingCuesNeverProduceOverlappingChunks)
{
    Segmenter segmenter;
    auto chunks = segmenter.segment(video_, {cue(0, 10, "first"), cue(9, 25, "second"), cue(24, 30, "third")}, {}, 12.0);

    ASSERT_GE(chunks.size(), 2u);
    for (size_t i = 1; i < chunks.size(); ++i)
    {
        EXPECT_GE(chunks[i].start, chunks[i - 1].end);
        EXPECT_LT(chunks[i].start, chunks[i].end);
        EXPECT_LE(chunks[i].duration(), 12.0);
    }
}

TEST_F(SegmenterTest, EmptyCueListYieldsNoChunks)
{
    Segmenter segmenter;
    EXPECT_TRUE(segmenter.segment(video_, {}, {}).empty());
}

TEST_F(SegmenterTest, NonMonotonicCuesAreRejectedWithIndex)
{
    Segmenter segmenter;
    try
    {
        segmenter.segment(video_, {cue(5, 6, "late"), cue(7, 8, "later"), cue(3, 4, "early")}, {});
        FAIL() << "Expected MalformedInputError";
    }
    catch (const MalformedInputError &e)
    {
        EXPECT_TRUE(e.hasItemIndex());
        EXPECT_EQ(e.itemIndex(), 2u);
    }
}

TEST_F(SegmenterTest, CueEndingBeforeStartIsRejected)
{
    Segmenter segmenter;
    EXPECT_THROW(segmenter.segment(video_, {cue(5, 4, "backwards")}, {}), MalformedInputError);
}

TEST_F(SegmenterTest, NonPositiveMaximumIsRejected)
{
    Segmenter segmenter;
    EXPECT_THROW(segmenter.segment(video_, {cue(0, 1, "x")}, {}, 0.0), MalformedInputError);
}

TEST_F(SegmenterTest, ChunksAreClampedToVideoDuration)
{
    video_.duration_seconds = 10.0;
    Segmenter segmenter;
    auto chunks = segmenter.segment(video_, {cue(8, 15, "closing words"), cue(12, 14, "after the end")}, {});

    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_DOUBLE_EQ(chunks[0].start, 8.0);
    EXPECT_DOUBLE_EQ(chunks[0].end, 10.0);
    EXPECT_EQ(chunks[0].text, "closing words");
}

TEST_F(SegmenterTest, ChunkCarriesFrameNearestItsMidpoint)
{
    std::vector<FrameSample> frames = {{"lec1", 0.0, "f0.jpg"}, {"lec1", 10.0, "f10.jpg"}, {"lec1", 20.0, "f20.jpg"}};
    Segmenter segmenter;
    auto chunks = segmenter.segment(video_, {cue(0, 5, "Today we cover"), cue(5, 12, "gradient descent.")}, frames);

    ASSERT_EQ(chunks.size(), 1u);
    ASSERT_TRUE(chunks[0].frame.has_value());
    EXPECT_EQ(chunks[0].frame->image_ref, "f10.jpg");
}

TEST_F(SegmenterTest, NearestFrameTiesGoToEarlierFrame)
{
    std::vector<FrameSample> frames = {{"lec1", 10.0, "f10.jpg"}, {"lec1", 0.0, "f0.jpg"}};
    auto frame = Segmenter::nearestFrame(frames, 5.0);
    ASSERT_TRUE(frame.has_value());
    EXPECT_EQ(frame->image_ref, "f0.jpg");
    EXPECT_FALSE(Segmenter::nearestFrame({}, 5.0).has_value());
}

TEST_F(SegmenterTest, NormalizeWhitespace)
{
    EXPECT_EQ(Segmenter::normalizeWhitespace("  a \t b\n\nc  "), "a b c");
    EXPECT_EQ(Segmenter::normalizeWhitespace("   "), "");
}

/**
 * @brief Chunk invariants over a grid of silence gaps and maximum durations
 */
class SegmenterTunablesTest : public ::testing::TestWithParam<std::tuple<double, double>>
{
protected:
    void SetUp() override
    {
        Logger::init("WARN");
        video_.id = "lec1";
        video_.media_path = "lec1.mp4";
        video_.duration_seconds = 600.0;

        // Mixed pauses and cue lengths, including one cue longer than any bound
        const double gaps[] = {0.0, 0.3, 1.0, 1.8, 3.0, 6.0, 0.0, 0.2, 4.0};
        const double lengths[] = {4.0, 7.0, 2.5, 12.0, 3.0, 70.0, 5.0, 9.0, 1.5};
        double t = 0.0;
        for (int i = 0; i < 36; ++i)
        {
            t += gaps[i % 9];
            double end = t + lengths[i % 9];
            cues_.push_back(SubtitleCue{video_.id, t, end, "cue " + std::to_string(i)});
            t = end;
        }
    }

    VideoAsset video_;
    std::vector<SubtitleCue> cues_;
};

TEST_P(SegmenterTunablesTest, ChunksRespectBoundsAndGaps)
{
    SegmenterConfig config;
    config.silence_gap_seconds = std::get<0>(GetParam());
    config.max_chunk_duration_seconds = std::get<1>(GetParam());
    Segmenter segmenter(config);

    auto chunks = segmenter.segment(video_, cues_, {});

    ASSERT_FALSE(chunks.empty());
    EXPECT_LT(chunks.size(), cues_.size());
    for (size_t i = 0; i < chunks.size(); ++i)
    {
        EXPECT_GT(chunks[i].end, chunks[i].start);
        EXPECT_LE(chunks[i].duration(), config.max_chunk_duration_seconds);
        EXPECT_GE(chunks[i].start, 0.0);
        EXPECT_LE(chunks[i].end, video_.duration_seconds);
        if (i > 0)
            EXPECT_LE(chunks[i - 1].end, chunks[i].start) << "chunks " << i - 1 << " and " << i << " overlap";
    }

    // A pause longer than the silence gap always separates two chunks
    for (size_t i = 1; i < cues_.size(); ++i)
    {
        if (cues_[i].start - cues_[i - 1].end <= config.silence_gap_seconds)
            continue;
        for (const auto &chunk : chunks)
        {
            EXPECT_FALSE(chunk.start <= cues_[i - 1].start && chunk.end >= cues_[i].start)
                << "chunk " << chunk.id << " spans a " << cues_[i].start - cues_[i - 1].end << "s pause";
        }
    }

    // Every cue start lies inside some chunk
    for (const auto &cue : cues_)
    {
        bool covered = false;
        for (const auto &chunk : chunks)
            covered = covered || (chunk.start <= cue.start && cue.start <= chunk.end);
        EXPECT_TRUE(covered) << "cue at " << cue.start << "s is not in any chunk";
    }
}

INSTANTIATE_TEST_SUITE_P(SilenceGapAndMaxDuration, SegmenterTunablesTest,
                         ::testing::Combine(::testing::Values(0.5, 2.0, 5.0),
                                            ::testing::Values(10.0, 30.0, 60.0)));
