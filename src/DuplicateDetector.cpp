#include "DuplicateDetector.h"
#include "DedupeErrors.h"
#include "SimilarityScorer.h"
#include "UnionFind.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <future>
#include <iterator>
#include <optional>
#include <tuple>

namespace {

struct Edge {
    int a = 0; // batch positions
    int b = 0;
    PairScore score;
};

// strongest first, then by identifier pair
bool edgeOrder(Edge const& x, Edge const& y)
{
    if (x.score.combined != y.score.combined)
        return x.score.combined > y.score.combined;
    return std::tie(x.score.first, x.score.second) < std::tie(y.score.first, y.score.second);
}

// Applies `edges` in edgeOrder to `uf` and keeps the ones that merged two
// sets: a maximum spanning forest of the edge set.
std::vector<Edge> spanningForest(std::vector<Edge> edges, UnionFind& uf)
{
    std::sort(edges.begin(), edges.end(), edgeOrder);
    std::vector<Edge> forest;
    for (auto& e : edges) {
        if (uf.unite(e.a, e.b))
            forest.push_back(std::move(e));
    }
    return forest;
}

bool isExactMatch(PairScore const& s)
{
    return s.exact && *s.exact == 1.0;
}

} // namespace

void checkBatchSize(std::size_t size, std::size_t limit)
{
    if (size > limit)
        throw BatchTooLargeError(size, limit);
}

std::uint64_t pairKey(std::string const& first, std::string const& second)
{
    constexpr std::uint64_t FNV_prime = 1099511628211u;
    std::uint64_t hash = 14695981039346656037u;

    auto mix = [&](unsigned char c) {
        hash ^= c;
        hash *= FNV_prime;
    };
    for (char c : first)
        mix(static_cast<unsigned char>(c));
    mix(0);
    for (char c : second)
        mix(static_cast<unsigned char>(c));
    return hash;
}

/*!
 * \brief findDuplicates
 * Partitions a batch of fingerprinted files into duplicate groups.
 *
 * Every unordered pair is scored with score_pair(). Pairs without a common
 * signal are skipped, and so are pairs whose signals contradict each other
 * (hash length or embedding dimension mismatch). A pair whose combined score
 * reaches `cfg.threshold`, or whose exact hashes are equal, is a candidate
 * edge.
 *
 * The pair set is split into `cfg.pairPartitions` partitions by pairKey().
 * Up to `cfg.parallelism` tasks score whole partitions and reduce each one to
 * a local spanning forest with its own UnionFind. A final sequential pass
 * unites the forest edges, strongest first, into the batch-wide UnionFind.
 * The edges that merge two sets there are the group's triggering edges and
 * the weakest of them is the group confidence. Applying edges strongest first
 * makes that value the bottleneck of a maximum spanning forest, which does
 * not depend on the partitioning.
 *
 * \param batch Files with their computed signals, in batch order.
 * \param cfg   Threshold, size limit and parallelism.
 * \param token Checked once per pair; cancellation throws BatchCancelledError.
 * \param stats Pair counters are written here.
 *
 * \return Groups of size >= 2 and the ungrouped batch positions.
 */
Clustering
findDuplicates(std::vector<FileSignals> const& batch,
    ClusterSettings const& cfg,
    CancellationToken const& token,
    BatchStats& stats)
{
    checkBatchSize(batch.size(), cfg.maxBatchSize);

    int const n = static_cast<int>(batch.size());
    std::size_t const nParts = static_cast<std::size_t>(std::max(1, cfg.pairPartitions));
    std::size_t const nWorkers = std::min<std::size_t>(static_cast<std::size_t>(std::max(1, cfg.parallelism)), nParts);

    spdlog::info("[cluster] start: files={}, pairs={}, threshold={:.3f}, partitions={}, workers={}",
        n, static_cast<std::size_t>(n) * (n > 0 ? n - 1 : 0) / 2, cfg.threshold, nParts, nWorkers);

    std::atomic<std::size_t> scored { 0 }, incomparable { 0 }, failed { 0 };

    // --- Score the pairs of the partitions owned by worker `w` and reduce each partition to its local forest ---
    auto work = [&](std::size_t w) -> std::vector<Edge> {
        std::vector<std::vector<Edge>> candidates(nParts);

        for (int i = 0; i < n; ++i) {
            auto const& fi = batch[i];
            for (int j = i + 1; j < n; ++j) {
                auto const& fj = batch[j];
                bool const swap = fj.file->id < fi.file->id;
                auto const& lo = swap ? fj.file->id : fi.file->id;
                auto const& hi = swap ? fi.file->id : fj.file->id;
                std::size_t const part = pairKey(lo, hi) % nParts;
                if (part % nWorkers != w)
                    continue;

                token.throwIfCancelled("pair scoring");

                std::optional<PairScore> s;
                try {
                    s = score_pair(fi.file->id, fi.fingerprints, fj.file->id, fj.fingerprints);
                } catch (LengthMismatchError const& e) {
                    spdlog::warn("[cluster] pair ({}, {}) excluded: {}", lo, hi, e.what());
                    ++failed;
                    continue;
                } catch (DimensionMismatchError const& e) {
                    spdlog::warn("[cluster] pair ({}, {}) excluded: {}", lo, hi, e.what());
                    ++failed;
                    continue;
                }

                if (!s) {
                    ++incomparable;
                    continue;
                }
                ++scored;

                if (s->combined >= cfg.threshold || isExactMatch(*s)) {
                    spdlog::debug("[cluster] candidate edge {} <-> {} ({:.4f})", lo, hi, s->combined);
                    candidates[part].push_back(Edge { i, j, std::move(*s) });
                }
            }
        }

        std::vector<Edge> local;
        for (std::size_t p = w; p < nParts; p += nWorkers) {
            if (candidates[p].empty())
                continue;
            UnionFind uf(n);
            auto forest = spanningForest(std::move(candidates[p]), uf);
            std::move(forest.begin(), forest.end(), std::back_inserter(local));
        }
        return local;
    };

    std::vector<std::future<std::vector<Edge>>> tasks;
    tasks.reserve(nWorkers);
    for (std::size_t w = 0; w < nWorkers; ++w)
        tasks.emplace_back(std::async(std::launch::async, work, w));

    for (auto& t : tasks)
        t.wait();
    std::vector<Edge> forestEdges;
    for (auto& t : tasks) {
        auto part = t.get();
        std::move(part.begin(), part.end(), std::back_inserter(forestEdges));
    }

    stats.pairsScored = scored;
    stats.pairsIncomparable = incomparable;
    stats.pairsFailed = failed;

    // --- Final sequential union pass over all local forests ---
    UnionFind uf(n);
    auto triggering = spanningForest(std::move(forestEdges), uf);

    spdlog::info("[cluster] scored={} incomparable={} failed={} triggering edges={}",
        stats.pairsScored, stats.pairsIncomparable, stats.pairsFailed, triggering.size());

    // --- Build connected components => groups / ungrouped ---
    Clustering out;
    auto comps = collectComponents(uf);
    std::vector<int> groupOfRoot(n, -1);
    for (auto& members : comps) {
        if (members.size() < 2) {
            out.ungrouped.push_back(members.front());
            continue;
        }
        ClusterGroup g;
        g.members = std::move(members);
        g.primary = g.members.front();
        for (int m : g.members) {
            if (batch[m].file->size > batch[g.primary].file->size)
                g.primary = m;
        }
        groupOfRoot[uf.find(g.primary)] = static_cast<int>(out.groups.size());
        out.groups.push_back(std::move(g));
    }
    std::sort(out.ungrouped.begin(), out.ungrouped.end());

    for (auto& e : triggering) {
        auto& g = out.groups[groupOfRoot[uf.find(e.a)]];
        g.confidence = g.edges.empty() ? e.score.combined : std::min(g.confidence, e.score.combined);
        g.edges.push_back(std::move(e.score));
    }

    spdlog::info("[cluster] duplicate groups formed={}, ungrouped={}", out.groups.size(), out.ungrouped.size());
    for (std::size_t i = 0; i < out.groups.size(); ++i) {
        std::string ids;
        for (int m : out.groups[i].members)
            ids += fmt::format("{} ", batch[m].file->id);
        spdlog::debug("[cluster] group #{} -> [{}] confidence={:.4f}", i, ids, out.groups[i].confidence);
    }

    return out;
}
