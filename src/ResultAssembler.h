#pragma once

#include "DedupeResult.h"
#include "DuplicateDetector.h"
#include "FileDescriptor.h"

#include <cstdint>
#include <string>
#include <vector>

/*!
 * \brief assembleResult
 * Shapes a clustering into the externally consumed result.
 *
 * Groups are ordered by descending confidence, ties by ascending primary id.
 * Members and ungrouped ids keep batch order. Every triggering edge gets a
 * human-readable reason. Throws std::logic_error if the clustering does not
 * cover the batch exactly once (a bug, not a runtime condition).
 */
DedupeResult assembleResult(std::string const& batchId,
    std::vector<FileSignals> const& batch,
    Clustering const& clustering,
    BatchStats const& stats);

// Why two files were matched, e.g. "Exact match (identical files)" or
// "Likely duplicate (93% similar)". `type` is the media type of the pair.
std::string explainMatch(PairScore const& score, MediaType type);

// 512 B, 1.5 KB, 2.0 MB, 1.2 GB
std::string formatBytes(std::uint64_t bytes);

std::string formatGroupReport(DuplicateGroup const& group,
    std::vector<FileDescriptor> const& files);
