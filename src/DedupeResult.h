#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

struct PairScore {
    std::string first;  // first < second
    std::string second;

    std::optional<double> exact;
    std::optional<double> perceptual;
    std::optional<double> embedding;
    double combined = 0.0;

    std::string reason; // filled by the result assembler
};

struct DuplicateGroup {
    std::vector<std::string> members; // batch order
    std::string primary;
    double confidence = 0.0;
    std::vector<PairScore> edges; // pairs that triggered a union
    std::uint64_t reclaimableBytes = 0;
};

struct BatchStats {
    std::size_t filesFingerprinted = 0;
    std::size_t pairsScored = 0;
    std::size_t pairsIncomparable = 0;
    std::size_t pairsFailed = 0;
    std::size_t embeddingBatchesFailed = 0;
};

struct DedupeTotals {
    std::size_t totalFiles = 0;
    std::size_t filesKept = 0;
    std::size_t filesRemovable = 0;
    std::uint64_t bytesReclaimable = 0;
};

struct DedupeResult {
    std::string batchId;
    std::vector<DuplicateGroup> groups;
    std::vector<std::string> ungrouped; // batch order
    DedupeTotals totals;
    BatchStats stats;
};
