#include "ResultAssembler.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <unordered_map>

static constexpr double kExactMatch = 0.98;
static constexpr double kHighSimilarity = 0.90;
static constexpr double kMediumSimilarity = 0.85;

std::string explainMatch(PairScore const& score, MediaType type)
{
    if (score.exact && *score.exact == 1.0)
        return "Exact match (identical files)";
    if (score.perceptual && *score.perceptual == 1.0)
        return "Visually identical";

    int const pct = static_cast<int>(std::lround(score.combined * 100.0));
    if (score.combined >= kExactMatch) {
        switch (type) {
        case MediaType::Image:
            return fmt::format("Visual similarity: {}%", pct);
        case MediaType::Text:
            return fmt::format("Text similarity: {}%", pct);
        case MediaType::Binary:
            break;
        }
        return fmt::format("Similarity: {}%", pct);
    }
    if (score.combined >= kHighSimilarity)
        return fmt::format("Likely duplicate ({}% similar)", pct);
    if (score.combined >= kMediumSimilarity)
        return fmt::format("Possible duplicate ({}% similar)", pct);
    return "Low similarity";
}

std::string formatBytes(std::uint64_t bytes)
{
    constexpr double KiB = 1024.0;
    auto const b = static_cast<double>(bytes);
    if (b < KiB)
        return fmt::format("{} B", bytes);
    if (b < KiB * KiB)
        return fmt::format("{:.1f} KB", b / KiB);
    if (b < KiB * KiB * KiB)
        return fmt::format("{:.1f} MB", b / (KiB * KiB));
    return fmt::format("{:.1f} GB", b / (KiB * KiB * KiB));
}

std::string formatGroupReport(DuplicateGroup const& group,
    std::vector<FileDescriptor> const& files)
{
    std::unordered_map<std::string, std::uint64_t> sizeOf;
    sizeOf.reserve(files.size());
    for (auto const& f : files)
        sizeOf.emplace(f.id, f.size);

    std::string out = fmt::format("Found {} duplicate files\n", group.members.size());
    out += fmt::format("Keeping: {} ({})\n\nDuplicates:\n", group.primary, formatBytes(sizeOf[group.primary]));
    for (auto const& id : group.members) {
        if (id != group.primary)
            out += fmt::format("  - {} ({})\n", id, formatBytes(sizeOf[id]));
    }
    out += fmt::format("\nTotal space saved: {}", formatBytes(group.reclaimableBytes));
    return out;
}

DedupeResult assembleResult(std::string const& batchId,
    std::vector<FileSignals> const& batch,
    Clustering const& clustering,
    BatchStats const& stats)
{
    std::unordered_map<std::string, MediaType> typeOf;
    typeOf.reserve(batch.size());
    for (auto const& fs : batch)
        typeOf.emplace(fs.file->id, fs.file->mediaType);

    DedupeResult r;
    r.batchId = batchId;
    r.stats = stats;

    std::size_t covered = clustering.ungrouped.size();
    for (auto const& cg : clustering.groups) {
        if (cg.members.size() < 2 || cg.primary < 0)
            throw std::logic_error("assembleResult: malformed cluster group");
        covered += cg.members.size();

        DuplicateGroup g;
        g.primary = batch.at(cg.primary).file->id;
        g.confidence = cg.confidence;
        for (int m : cg.members) {
            auto const& f = *batch.at(m).file;
            g.members.push_back(f.id);
            if (m != cg.primary)
                g.reclaimableBytes += f.size;
        }
        g.edges = cg.edges;
        for (auto& e : g.edges)
            e.reason = explainMatch(e, typeOf[e.first]);

        r.totals.filesRemovable += g.members.size() - 1;
        r.totals.bytesReclaimable += g.reclaimableBytes;
        r.groups.push_back(std::move(g));
    }
    if (covered != batch.size())
        throw std::logic_error(fmt::format("assembleResult: clustering covers {} of {} files", covered, batch.size()));

    for (int u : clustering.ungrouped)
        r.ungrouped.push_back(batch.at(u).file->id);

    std::stable_sort(r.groups.begin(), r.groups.end(), [](DuplicateGroup const& a, DuplicateGroup const& b) {
        if (a.confidence != b.confidence)
            return a.confidence > b.confidence;
        return a.primary < b.primary;
    });

    r.totals.totalFiles = batch.size();
    r.totals.filesKept = r.totals.totalFiles - r.totals.filesRemovable;

    spdlog::info("[result] {} groups, {} ungrouped, {} removable files, {} reclaimable",
        r.groups.size(), r.ungrouped.size(), r.totals.filesRemovable, formatBytes(r.totals.bytesReclaimable));
    return r;
}
