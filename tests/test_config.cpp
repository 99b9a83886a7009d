/**
 * @file test_config.cpp
 * @brief Unit tests for EngineSettings JSON mapping and the config file
 */

#include <gtest/gtest.h>

#include "ConfigManager.h"
#include "TestSupport.h"

#include <fstream>

using namespace testsupport;

TEST(EngineSettingsTest, MissingKeysKeepDefaults)
{
    auto s = nlohmann::json::object().get<EngineSettings>();
    EngineSettings d;
    EXPECT_DOUBLE_EQ(s.threshold, d.threshold);
    EXPECT_EQ(s.maxBatchSize, d.maxBatchSize);
    EXPECT_EQ(s.parallelism, d.parallelism);
    EXPECT_EQ(s.embeddingBatchSize, d.embeddingBatchSize);
    EXPECT_EQ(s.logLevel, "info");
}

TEST(EngineSettingsTest, OutOfRangeValuesAreClamped)
{
    nlohmann::json j = { { "threshold", 4.2 },
        { "maxBatchSize", 0 },
        { "parallelism", 9000 },
        { "pairPartitions", -3 },
        { "embeddingImageSize", 1 },
        { "timeoutMs", -50 } };
    auto s = j.get<EngineSettings>();
    EXPECT_DOUBLE_EQ(s.threshold, 1.0);
    EXPECT_EQ(s.maxBatchSize, 1u);
    EXPECT_EQ(s.parallelism, 256);
    EXPECT_EQ(s.pairPartitions, 1);
    EXPECT_EQ(s.embeddingImageSize, 16);
    EXPECT_EQ(s.timeoutMs, 0);
}

/**
 * @test NegativeCountsClampToOne
 * @brief A negative count must not wrap around to a huge unsigned limit
 */
TEST(EngineSettingsTest, NegativeCountsClampToOne)
{
    nlohmann::json j = { { "maxBatchSize", -1 },
        { "maxSampleBytes", -1 },
        { "embeddingBatchSize", -5 },
        { "textExcerptChars", -2 } };
    auto s = j.get<EngineSettings>();
    EXPECT_EQ(s.maxBatchSize, 1u);
    EXPECT_EQ(s.maxSampleBytes, 1u);
    EXPECT_EQ(s.embeddingBatchSize, 1u);
    EXPECT_EQ(s.textExcerptChars, 1u);

    j = { { "maxBatchSize", 250000 }, { "embeddingBatchSize", 100000 } };
    s = j.get<EngineSettings>();
    EXPECT_EQ(s.maxBatchSize, 100000u);
    EXPECT_EQ(s.embeddingBatchSize, 4096u);
}

TEST(ConfigManagerTest, SaveThenLoadRoundTrips)
{
    TempDir dir;
    auto path = (dir.path() / cfg::defaultConfigPath()).string();

    EngineSettings s;
    s.threshold = 0.7;
    s.parallelism = 2;
    s.perceptualHashing = false;
    s.logLevel = "debug";
    ASSERT_TRUE(cfg::saveSettings(path, s));

    auto loaded = cfg::loadSettings(path);
    ASSERT_TRUE(loaded);
    EXPECT_DOUBLE_EQ(loaded->threshold, 0.7);
    EXPECT_EQ(loaded->parallelism, 2);
    EXPECT_FALSE(loaded->perceptualHashing);
    EXPECT_EQ(loaded->logLevel, "debug");
}

TEST(ConfigManagerTest, MissingFileGivesNothing)
{
    TempDir dir;
    EXPECT_FALSE(cfg::loadSettings((dir.path() / "none.json").string()));
}

TEST(ConfigManagerTest, MalformedFileIsIgnored)
{
    TempDir dir;
    auto path = (dir.path() / "config.json").string();
    {
        std::ofstream out(path);
        out << "{ not json";
    }
    EXPECT_FALSE(cfg::loadSettings(path));

    {
        std::ofstream out(path, std::ios::trunc);
        out << "[1, 2, 3]";
    }
    EXPECT_FALSE(cfg::loadSettings(path));
}

TEST(ConfigManagerTest, UnwritablePathReportsFailure)
{
    EXPECT_FALSE(cfg::saveSettings("/nonexistent/ndf/config.json", EngineSettings {}));
}
