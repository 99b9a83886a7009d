/**
 * @file test_fingerprintcollector.cpp
 * @brief Unit tests for per-file signal extraction and embedding sub-batches
 */

#include <gtest/gtest.h>

#include "ExactHash.h"
#include "FingerprintCollector.h"
#include "TestSupport.h"

using namespace testsupport;

/**
 * @class FingerprintCollectorTest
 * @brief Fake decoder and provider with small, deterministic settings
 */
class FingerprintCollectorTest : public ::testing::Test {
protected:
    EngineSettings cfg;
    FakeImageDecoder decoder;
    FakeEmbeddingProvider provider;
    CancellationToken token;
    BatchStats stats;
    std::vector<FileDescriptor> files;

    void SetUp() override
    {
        cfg.parallelism = 3;
        cfg.embeddingBatchSize = 2;
        files.clear();
        stats = BatchStats {};
    }

    std::vector<FingerprintSet> collect(bool withProvider = false)
    {
        FingerprintCollector c(cfg, decoder, withProvider ? &provider : nullptr);
        return c.collect(files, token, stats);
    }
};

TEST_F(FingerprintCollectorTest, BinaryContentGetsOnlyExactHash)
{
    files.push_back(inlineFile("a", "payload"));

    auto sets = collect();
    ASSERT_EQ(sets.size(), 1u);
    ASSERT_TRUE(sets[0].exactHash);
    EXPECT_EQ(*sets[0].exactHash, sha256_hex(bytes("payload")));
    EXPECT_FALSE(sets[0].perceptualHash);
    EXPECT_FALSE(sets[0].embedding);
    EXPECT_EQ(stats.filesFingerprinted, 1u);
}

TEST_F(FingerprintCollectorTest, ImageContentIsHashedPerceptually)
{
    files.push_back(inlineFile("up", "grad:+", MediaType::Image));
    files.push_back(inlineFile("down", "grad:-", MediaType::Image));

    auto sets = collect();
    ASSERT_TRUE(sets[0].perceptualHash);
    ASSERT_TRUE(sets[1].perceptualHash);
    EXPECT_EQ(*sets[0].perceptualHash, "ffffffffffffffff");
    EXPECT_EQ(*sets[1].perceptualHash, "0000000000000000");
}

TEST_F(FingerprintCollectorTest, UndecodableImageKeepsOtherSignals)
{
    files.push_back(inlineFile("broken", "not an image", MediaType::Image));

    auto sets = collect();
    EXPECT_TRUE(sets[0].exactHash);
    EXPECT_FALSE(sets[0].perceptualHash);
}

TEST_F(FingerprintCollectorTest, SuppliedHashIsUsedAndNormalised)
{
    auto f = inlineFile("img", "grad:+", MediaType::Image);
    f.perceptualHash = "ABCDEF0123456789";
    files.push_back(f);

    auto sets = collect();
    ASSERT_TRUE(sets[0].perceptualHash);
    EXPECT_EQ(*sets[0].perceptualHash, "abcdef0123456789");
    EXPECT_EQ(decoder.calls.load(), 0);
}

TEST_F(FingerprintCollectorTest, SuppliedHashOnNonImageIsIgnored)
{
    auto f = inlineFile("doc", "text", MediaType::Text);
    f.perceptualHash = "0000000000000000";
    files.push_back(f);

    EXPECT_FALSE(collect()[0].perceptualHash);
}

TEST_F(FingerprintCollectorTest, PerceptualHashingCanBeDisabled)
{
    cfg.perceptualHashing = false;
    files.push_back(inlineFile("img", "grad:+", MediaType::Image));

    auto sets = collect();
    EXPECT_FALSE(sets[0].perceptualHash);
    EXPECT_EQ(decoder.calls.load(), 0);
}

TEST_F(FingerprintCollectorTest, UnreadablePathLeavesFileWithoutSignals)
{
    FileDescriptor f;
    f.id = "gone";
    f.path = "/nonexistent/ndf/gone.png";
    f.mediaType = MediaType::Image;
    files.push_back(f);

    auto sets = collect();
    EXPECT_TRUE(sets[0].empty());
}

TEST_F(FingerprintCollectorTest, ManyFilesKeepInputOrder)
{
    for (int i = 0; i < 25; ++i)
        files.push_back(inlineFile("f" + std::to_string(i), "content " + std::to_string(i)));

    auto sets = collect();
    ASSERT_EQ(sets.size(), 25u);
    for (int i = 0; i < 25; ++i)
        EXPECT_EQ(*sets[i].exactHash, sha256_hex(bytes("content " + std::to_string(i))));
}

TEST_F(FingerprintCollectorTest, TextEmbeddingsRequestedInSubBatches)
{
    provider.textVectors["hello world"] = { 0.5f, 0.5f };
    files.push_back(inlineFile("t0", "  hello \n  world ", MediaType::Text));
    for (int i = 1; i < 5; ++i)
        files.push_back(inlineFile("t" + std::to_string(i), "doc " + std::to_string(i), MediaType::Text));

    auto sets = collect(true);
    EXPECT_EQ(provider.textBatches, (std::vector<std::size_t> { 2, 2, 1 }));
    ASSERT_TRUE(sets[0].embedding);
    EXPECT_EQ(*sets[0].embedding, (Embedding { 0.5f, 0.5f }));
    for (int i = 1; i < 5; ++i)
        EXPECT_TRUE(sets[i].embedding);
    EXPECT_EQ(stats.embeddingBatchesFailed, 0u);
}

TEST_F(FingerprintCollectorTest, ImageEmbeddingsUseDecodedPixels)
{
    files.push_back(inlineFile("img", "grad:+", MediaType::Image));

    auto sets = collect(true);
    EXPECT_EQ(provider.imageBatches, std::vector<std::size_t> { 1 });
    ASSERT_TRUE(sets[0].embedding);
    EXPECT_EQ(*sets[0].embedding, provider.imageVector);
}

TEST_F(FingerprintCollectorTest, SuppliedEmbeddingSkipsProvider)
{
    auto f = inlineFile("t", "some text", MediaType::Text);
    f.embedding = Embedding { 9.0f };
    files.push_back(f);

    auto sets = collect(true);
    EXPECT_TRUE(provider.textBatches.empty());
    EXPECT_EQ(*sets[0].embedding, Embedding { 9.0f });
}

TEST_F(FingerprintCollectorTest, FailingSubBatchDegradesOnlyItsFiles)
{
    provider.mode = FakeEmbeddingProvider::Mode::Throws;
    for (int i = 0; i < 5; ++i)
        files.push_back(inlineFile("t" + std::to_string(i), "doc " + std::to_string(i), MediaType::Text));

    auto sets = collect(true);
    EXPECT_EQ(provider.textBatches.size(), 3u);
    EXPECT_EQ(stats.embeddingBatchesFailed, 3u);
    for (auto const& s : sets) {
        EXPECT_FALSE(s.embedding);
        EXPECT_TRUE(s.exactHash);
    }
}

TEST_F(FingerprintCollectorTest, WrongVectorCountDropsSubBatch)
{
    provider.mode = FakeEmbeddingProvider::Mode::WrongCount;
    files.push_back(inlineFile("a", "alpha", MediaType::Text));
    files.push_back(inlineFile("b", "beta", MediaType::Text));

    auto sets = collect(true);
    EXPECT_EQ(stats.embeddingBatchesFailed, 1u);
    EXPECT_FALSE(sets[0].embedding);
    EXPECT_FALSE(sets[1].embedding);
}

TEST_F(FingerprintCollectorTest, UnavailableProviderIsNotCalledAgain)
{
    provider.mode = FakeEmbeddingProvider::Mode::Unavailable;
    for (int i = 0; i < 4; ++i)
        files.push_back(inlineFile("t" + std::to_string(i), "doc " + std::to_string(i), MediaType::Text));
    files.push_back(inlineFile("img", "grad:+", MediaType::Image));

    auto sets = collect(true);
    EXPECT_EQ(provider.textBatches.size(), 1u);
    EXPECT_TRUE(provider.imageBatches.empty());
    EXPECT_EQ(stats.embeddingBatchesFailed, 1u);
    EXPECT_TRUE(sets[4].perceptualHash);
}

TEST_F(FingerprintCollectorTest, CancelledBeforeStartThrows)
{
    files.push_back(inlineFile("a", "x"));
    token.cancel();
    EXPECT_THROW(collect(), BatchCancelledError);
}
