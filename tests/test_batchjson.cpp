/**
 * @file test_batchjson.cpp
 * @brief Unit tests for the JSON request and result mapping
 */

#include <gtest/gtest.h>

#include "BatchJson.h"
#include "DedupeErrors.h"
#include "TestSupport.h"

#include <fstream>

using namespace testsupport;
using nlohmann::json;

TEST(BatchJsonTest, ParsesInlineFiles)
{
    auto j = json::parse(R"({
        "batchId": "lic-42",
        "threshold": 0.9,
        "files": [
            { "id": "notes.txt", "content": "hello" },
            { "id": "pic", "size": 1234, "mediaType": "image", "perceptualHash": "00ff00ff00ff00ff" },
            { "id": "vec", "mediaType": "text", "embedding": [0.5, 0.25] }
        ]
    })");

    auto req = parseBatchRequest(j);
    EXPECT_EQ(req.batchId, "lic-42");
    ASSERT_TRUE(req.threshold);
    EXPECT_DOUBLE_EQ(*req.threshold, 0.9);
    ASSERT_EQ(req.files.size(), 3u);

    auto const& notes = req.files[0];
    EXPECT_EQ(notes.size, 5u);
    EXPECT_EQ(notes.mediaType, MediaType::Text);
    ASSERT_TRUE(notes.content);
    EXPECT_EQ(*notes.content, bytes("hello"));

    auto const& pic = req.files[1];
    EXPECT_EQ(pic.size, 1234u);
    EXPECT_EQ(pic.mediaType, MediaType::Image);
    EXPECT_EQ(pic.perceptualHash.value_or(""), "00ff00ff00ff00ff");

    auto const& vec = req.files[2];
    ASSERT_TRUE(vec.embedding);
    EXPECT_EQ(*vec.embedding, (Embedding { 0.5f, 0.25f }));
}

TEST(BatchJsonTest, PathSizeAndTypeComeFromDisk)
{
    TempDir dir;
    auto p = dir.path() / "upload.bin";
    {
        std::ofstream out(p, std::ios::binary);
        unsigned char const gif[] = { 'G', 'I', 'F', '8', '9', 'a', 0, 0, 0, 0 };
        out.write(reinterpret_cast<char const*>(gif), sizeof(gif));
    }

    json j = { { "batchId", "b" },
        { "files", json::array({ { { "id", "u" }, { "path", p.string() }, { "mediaType", "auto" } } }) } };

    auto req = parseBatchRequest(j);
    ASSERT_EQ(req.files.size(), 1u);
    EXPECT_EQ(req.files[0].size, 10u);
    EXPECT_EQ(req.files[0].mediaType, MediaType::Image);
    EXPECT_EQ(req.files[0].path.value_or(""), p.string());
    EXPECT_FALSE(req.files[0].content);
}

/**
 * @test BinaryContentTravelsAsBase64
 * @brief Inline samples with bytes >= 0x80 reach the engine unchanged
 *
 * A JSON text string would re-encode 0x89 as the UTF-8 pair C2 89, breaking
 * both the exact hash and magic-byte detection.
 */
TEST(BatchJsonTest, BinaryContentTravelsAsBase64)
{
    std::vector<std::uint8_t> const png { 0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A, 0x00, 0x01, 0xFF };
    auto j = json::parse(R"({
        "files": [
            { "id": "blob", "contentBase64": "iVBORw0KGgoAAf8=" },
            { "id": "empty.bin", "contentBase64": "" }
        ]
    })");

    auto req = parseBatchRequest(j);
    ASSERT_EQ(req.files.size(), 2u);
    ASSERT_TRUE(req.files[0].content);
    EXPECT_EQ(*req.files[0].content, png);
    EXPECT_EQ(req.files[0].size, png.size());
    EXPECT_EQ(req.files[0].mediaType, MediaType::Image);

    ASSERT_TRUE(req.files[1].content);
    EXPECT_TRUE(req.files[1].content->empty());
    EXPECT_EQ(req.files[1].size, 0u);
}

TEST(BatchJsonTest, BadBase64Rejected)
{
    EXPECT_THROW(parseBatchRequest(json::parse(R"({"files": [{"id": "a", "contentBase64": "iVBOR"}]})")), InvalidBatchError);
    EXPECT_THROW(parseBatchRequest(json::parse(R"({"files": [{"id": "a", "contentBase64": "!!!!"}]})")), InvalidBatchError);
    EXPECT_THROW(parseBatchRequest(json::parse(R"({"files": [{"id": "a", "contentBase64": 12}]})")), InvalidBatchError);
    EXPECT_THROW(parseBatchRequest(json::parse(R"({"files": [{"id": "a", "content": "x", "contentBase64": "eA=="}]})")), InvalidBatchError);
}

TEST(BatchJsonTest, NegativeSizeRejected)
{
    EXPECT_THROW(parseBatchRequest(json::parse(R"({"files": [{"id": "a", "size": -1}]})")), InvalidBatchError);
}

TEST(BatchJsonTest, MalformedRequestsRaiseInvalidBatch)
{
    EXPECT_THROW(parseBatchRequest(json::parse(R"({"batchId": "b"})")), InvalidBatchError);
    EXPECT_THROW(parseBatchRequest(json::parse(R"({"files": {"id": "a"}})")), InvalidBatchError);
    EXPECT_THROW(parseBatchRequest(json::parse(R"({"files": [{"size": 3}]})")), InvalidBatchError);
    EXPECT_THROW(parseBatchRequest(json::parse(R"({"files": [42]})")), InvalidBatchError);
    EXPECT_THROW(parseBatchRequest(json::parse(R"({"files": [{"id": "a", "mediaType": "video"}]})")), InvalidBatchError);
    EXPECT_THROW(parseBatchRequest(json::parse(R"({"files": [{"id": "a", "embedding": "nope"}]})")), InvalidBatchError);
}

TEST(BatchJsonTest, LoadReportsUnreadableAndInvalidFiles)
{
    TempDir dir;
    EXPECT_THROW(loadBatchRequest((dir.path() / "missing.json").string()), IOError);

    auto p = (dir.path() / "bad.json").string();
    {
        std::ofstream out(p);
        out << "{ \"files\": [ ";
    }
    EXPECT_THROW(loadBatchRequest(p), InvalidBatchError);
}

TEST(BatchJsonTest, ResultSerialisation)
{
    DedupeResult r;
    r.batchId = "b1";
    DuplicateGroup g;
    g.members = { "a", "b" };
    g.primary = "a";
    g.confidence = 1.0;
    g.reclaimableBytes = 77;
    PairScore e;
    e.first = "a";
    e.second = "b";
    e.exact = 1.0;
    e.combined = 1.0;
    e.reason = "Exact match (identical files)";
    g.edges = { e };
    r.groups = { g };
    r.ungrouped = { "c" };
    r.totals.totalFiles = 3;
    r.totals.filesKept = 2;
    r.totals.filesRemovable = 1;
    r.totals.bytesReclaimable = 77;
    r.stats.pairsScored = 3;

    auto j = toJson(r);
    EXPECT_EQ(j["batchId"], "b1");
    ASSERT_EQ(j["groups"].size(), 1u);
    EXPECT_EQ(j["groups"][0]["primary"], "a");
    EXPECT_EQ(j["groups"][0]["members"], json::array({ "a", "b" }));
    EXPECT_EQ(j["groups"][0]["reclaimableBytes"], 77);
    EXPECT_EQ(j["groups"][0]["edges"][0]["exact"], 1.0);
    EXPECT_FALSE(j["groups"][0]["edges"][0].contains("perceptual"));
    EXPECT_EQ(j["ungrouped"], json::array({ "c" }));
    EXPECT_EQ(j["totals"]["filesRemovable"], 1);
    EXPECT_EQ(j["stats"]["pairsScored"], 3);
}
