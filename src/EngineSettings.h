#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <nlohmann/json.hpp>
#include <string>

struct EngineSettings {
    double threshold = 0.85;                      // 0-1, exact pairs always qualify
    std::size_t maxBatchSize = 100;               // 1-100000
    std::size_t maxSampleBytes = 10 * 1024 * 1024; // inline content limit
    int parallelism = 4;                          // 1-256 concurrent file tasks
    int pairPartitions = 16;                      // 1-1024
    std::size_t embeddingBatchSize = 32;          // 1-4096 inputs per provider call
    int embeddingImageSize = 224;                 // 16-2048, square RGB24
    std::size_t textExcerptChars = 2000;
    bool perceptualHashing = true;
    std::int64_t timeoutMs = 0; // 0 = no deadline
    std::string logLevel = "info";
};

/* json helpers */
inline void to_json(nlohmann::json& j, EngineSettings const& s)
{
    j = { { "threshold", s.threshold },
        { "maxBatchSize", s.maxBatchSize },
        { "maxSampleBytes", s.maxSampleBytes },
        { "parallelism", s.parallelism },
        { "pairPartitions", s.pairPartitions },
        { "embeddingBatchSize", s.embeddingBatchSize },
        { "embeddingImageSize", s.embeddingImageSize },
        { "textExcerptChars", s.textExcerptChars },
        { "perceptualHashing", s.perceptualHashing },
        { "timeoutMs", s.timeoutMs },
        { "logLevel", s.logLevel } };
}

// Reads a count as signed so that a negative value clamps instead of wrapping.
inline std::size_t count_setting(nlohmann::json const& j, char const* key,
    std::size_t current, std::int64_t lo, std::int64_t hi)
{
    auto v = j.value(key, static_cast<std::int64_t>(current));
    return static_cast<std::size_t>(std::clamp(v, lo, hi));
}

// Missing keys keep their defaults; out-of-range values are clamped.
inline void from_json(nlohmann::json const& j, EngineSettings& s)
{
    constexpr std::int64_t kNoLimit = std::numeric_limits<std::int64_t>::max();

    s.threshold = j.value("threshold", s.threshold);
    s.maxBatchSize = count_setting(j, "maxBatchSize", s.maxBatchSize, 1, 100'000);
    s.maxSampleBytes = count_setting(j, "maxSampleBytes", s.maxSampleBytes, 1, kNoLimit);
    s.parallelism = j.value("parallelism", s.parallelism);
    s.pairPartitions = j.value("pairPartitions", s.pairPartitions);
    s.embeddingBatchSize = count_setting(j, "embeddingBatchSize", s.embeddingBatchSize, 1, 4096);
    s.embeddingImageSize = j.value("embeddingImageSize", s.embeddingImageSize);
    s.textExcerptChars = count_setting(j, "textExcerptChars", s.textExcerptChars, 1, kNoLimit);
    s.perceptualHashing = j.value("perceptualHashing", s.perceptualHashing);
    s.timeoutMs = j.value("timeoutMs", s.timeoutMs);
    if (j.contains("logLevel") && j["logLevel"].is_string())
        j.at("logLevel").get_to(s.logLevel);

    s.threshold = std::clamp(s.threshold, 0.0, 1.0);
    s.parallelism = std::clamp(s.parallelism, 1, 256);
    s.pairPartitions = std::clamp(s.pairPartitions, 1, 1024);
    s.embeddingImageSize = std::clamp(s.embeddingImageSize, 16, 2048);
    s.timeoutMs = std::max<std::int64_t>(s.timeoutMs, 0);
}
