#include "test_base.hpp"
#include <algorithm>

class ChunkStoreTest : public TestBase
{
};

TEST_F(ChunkStoreTest, RegisterAndFetchVideo)
{
    storeChunks("lec1", 600.0, {});

    auto video = store_->getVideo("lec1");
    ASSERT_TRUE(video.has_value());
    EXPECT_EQ(video->media_path, "lec1.mp4");
    EXPECT_DOUBLE_EQ(video->duration_seconds, 600.0);
    EXPECT_FALSE(store_->getVideo("missing").has_value());
    EXPECT_EQ(store_->listVideos().size(), 1u);
}

TEST_F(ChunkStoreTest, StoresChunksWithFrames)
{
    VideoAsset video;
    video.id = "lec1";
    video.media_path = "lec1.mp4";
    video.duration_seconds = 60.0;
    ASSERT_TRUE(store_->registerVideo(video).success);

    TranscriptChunk chunk;
    chunk.video_id = "lec1";
    chunk.start = 0.0;
    chunk.end = 12.0;
    chunk.text = "Today we cover gradient descent.";
    chunk.id = makeChunkId("lec1", 0.0, 12.0);
    chunk.frame = FrameSample{"lec1", 10.0, "frames/lec1/f000001.jpg"};
    ASSERT_TRUE(store_->replaceChunks("lec1", {chunk}).success);

    auto loaded = store_->getChunk(chunk.id);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->text, chunk.text);
    EXPECT_DOUBLE_EQ(loaded->end, 12.0);
    ASSERT_TRUE(loaded->frame.has_value());
    EXPECT_EQ(loaded->frame->image_ref, "frames/lec1/f000001.jpg");
}

TEST_F(ChunkStoreTest, ReplaceChunksReportsSupersededIds)
{
    auto first = storeChunks("lec1", 600.0, {{{0, 10}, "alpha"}, {{10, 20}, "beta"}});
    ASSERT_EQ(store_->chunkCount(), 2u);

    TranscriptChunk kept = first[1];
    kept.text = "beta revised";
    TranscriptChunk added;
    added.video_id = "lec1";
    added.start = 20.0;
    added.end = 30.0;
    added.text = "gamma";
    added.id = makeChunkId("lec1", 20.0, 30.0);

    std::vector<std::string> superseded;
    ASSERT_TRUE(store_->replaceChunks("lec1", {kept, added}, &superseded).success);

    ASSERT_EQ(superseded.size(), 1u);
    EXPECT_EQ(superseded[0], first[0].id);
    EXPECT_FALSE(store_->getChunk(first[0].id).has_value());
    EXPECT_EQ(store_->getChunk(kept.id)->text, "beta revised");

    auto chunks = store_->getChunksForVideo("lec1");
    ASSERT_EQ(chunks.size(), 2u);
    EXPECT_LT(chunks[0].start, chunks[1].start);
}

TEST_F(ChunkStoreTest, ReplaceChunksRejectsForeignChunks)
{
    storeChunks("lec1", 600.0, {});
    TranscriptChunk chunk;
    chunk.video_id = "lec2";
    chunk.start = 0.0;
    chunk.end = 5.0;
    chunk.id = makeChunkId("lec2", 0.0, 5.0);

    DBOpResult result = store_->replaceChunks("lec1", {chunk});
    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.error_message.empty());
}

TEST_F(ChunkStoreTest, GetChunksSkipsUnknownIds)
{
    auto chunks = storeChunks("lec1", 600.0, {{{0, 10}, "alpha"}});
    auto found = store_->getChunks({chunks[0].id, "lec1#99-100"});
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].id, chunks[0].id);
}

TEST_F(ChunkStoreTest, EmbeddingModelBookkeeping)
{
    auto chunks = storeChunks("lec1", 600.0, {{{0, 10}, "alpha"}});
    EXPECT_FALSE(store_->embeddingModelFor(chunks[0].id).has_value());

    ASSERT_TRUE(store_->recordEmbedding(chunks[0].id, "model-a", 384).success);
    EXPECT_EQ(*store_->embeddingModelFor(chunks[0].id), "model-a");

    ASSERT_TRUE(store_->recordEmbedding(chunks[0].id, "model-b", 768).success);
    EXPECT_EQ(*store_->embeddingModelFor(chunks[0].id), "model-b");
}

TEST_F(ChunkStoreTest, RemoveVideoDropsItsChunks)
{
    auto chunks = storeChunks("lec1", 600.0, {{{0, 10}, "alpha"}, {{10, 20}, "beta"}});
    storeChunks("lec2", 300.0, {{{0, 10}, "other"}});

    std::vector<std::string> removed;
    ASSERT_TRUE(store_->removeVideo("lec1", &removed).success);

    EXPECT_EQ(removed.size(), 2u);
    EXPECT_FALSE(store_->getVideo("lec1").has_value());
    EXPECT_EQ(store_->chunkCount(), 1u);
}

TEST_F(ChunkStoreTest, PersistsAcrossReopen)
{
    const std::string path = testDir() + "/catalog.db";
    {
        ChunkStore store(path);
        ASSERT_TRUE(store.isOpen());
        VideoAsset video;
        video.id = "lec1";
        video.media_path = "lec1.mp4";
        video.duration_seconds = 30.0;
        ASSERT_TRUE(store.registerVideo(video).success);
    }
    ChunkStore reopened(path);
    EXPECT_TRUE(reopened.getVideo("lec1").has_value());
}
