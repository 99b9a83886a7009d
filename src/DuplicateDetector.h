#pragma once

#include "CancellationToken.h"
#include "DedupeResult.h"
#include "FileDescriptor.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

struct ClusterSettings {
    double threshold = 0.85;
    std::size_t maxBatchSize = 100;
    int parallelism = 4;
    int pairPartitions = 16;
};

// One union-find component of size >= 2, in batch positions.
struct ClusterGroup {
    std::vector<int> members; // ascending
    int primary = -1;
    double confidence = 0.0;
    std::vector<PairScore> edges; // triggering edges, strongest first
};

struct Clustering {
    std::vector<ClusterGroup> groups; // ordered by smallest member
    std::vector<int> ungrouped;       // ascending
};

// Throws BatchTooLargeError when `size` exceeds `limit`.
void checkBatchSize(std::size_t size, std::size_t limit);

// FNV-1a over "first\0second"; stable across runs and platforms.
std::uint64_t pairKey(std::string const& first, std::string const& second);

Clustering
findDuplicates(std::vector<FileSignals> const& batch,
               ClusterSettings const& cfg,
               CancellationToken const& token,
               BatchStats& stats);
