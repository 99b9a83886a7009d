#include "DedupeEngine.h"
#include "DedupeErrors.h"
#include "DuplicateDetector.h"
#include "FingerprintCollector.h"
#include "ResultAssembler.h"

#include <spdlog/spdlog.h>

#include <chrono>
#include <cmath>
#include <unordered_set>

DedupeEngine::DedupeEngine(EngineSettings cfg,
    IImageDecoder& decoder,
    IEmbeddingProvider* provider)
    : m_cfg(std::move(cfg))
    , m_decoder(decoder)
    , m_provider(provider)
{
}

void DedupeEngine::validate(BatchRequest const& request) const
{
    checkBatchSize(request.files.size(), m_cfg.maxBatchSize);

    if (request.threshold) {
        double t = *request.threshold;
        if (std::isnan(t) || t < 0.0 || t > 1.0)
            throw InvalidBatchError(fmt::format("threshold override {} outside [0, 1]", t));
    }

    std::unordered_set<std::string> seen;
    seen.reserve(request.files.size());
    for (std::size_t i = 0; i < request.files.size(); ++i) {
        auto const& f = request.files[i];
        if (f.id.empty())
            throw InvalidBatchError(fmt::format("file #{} has an empty identifier", i));
        if (!seen.insert(f.id).second)
            throw InvalidBatchError(fmt::format("duplicate file identifier '{}'", f.id));
        if (f.content && f.path)
            throw InvalidBatchError(fmt::format("file '{}' supplies both inline content and a path", f.id));
        if (f.content && f.content->size() > m_cfg.maxSampleBytes)
            throw InvalidBatchError(fmt::format("file '{}' inline sample of {} bytes exceeds {} bytes",
                f.id, f.content->size(), m_cfg.maxSampleBytes));
        if (f.path && f.path->empty())
            throw InvalidBatchError(fmt::format("file '{}' has an empty path", f.id));
    }
}

DedupeResult DedupeEngine::run(BatchRequest const& request) const
{
    if (m_cfg.timeoutMs > 0) {
        auto token = CancellationToken::withTimeout(std::chrono::milliseconds(m_cfg.timeoutMs));
        return run(request, token);
    }
    CancellationToken token;
    return run(request, token);
}

DedupeResult DedupeEngine::run(BatchRequest const& request, CancellationToken const& token) const
{
    auto const started = std::chrono::steady_clock::now();
    spdlog::info("[engine] batch '{}': {} files", request.batchId, request.files.size());

    try {
        validate(request);
    } catch (DedupeError const& e) {
        spdlog::error("[engine] batch '{}' rejected: {}", request.batchId, e.what());
        throw;
    }

    double const threshold = request.threshold.value_or(m_cfg.threshold);
    BatchStats stats;

    DedupeResult result;
    try {
        // --- Fingerprints ---
        FingerprintCollector collector(m_cfg, m_decoder, m_provider);
        auto sets = collector.collect(request.files, token, stats);

        std::vector<FileSignals> batch;
        batch.reserve(request.files.size());
        for (std::size_t i = 0; i < request.files.size(); ++i)
            batch.push_back(FileSignals { &request.files[i], std::move(sets[i]) });

        // --- Pair scoring + union-find ---
        ClusterSettings cs;
        cs.threshold = threshold;
        cs.maxBatchSize = m_cfg.maxBatchSize;
        cs.parallelism = m_cfg.parallelism;
        cs.pairPartitions = m_cfg.pairPartitions;
        auto clustering = findDuplicates(batch, cs, token, stats);

        result = assembleResult(request.batchId, batch, clustering, stats);
    } catch (BatchCancelledError const& e) {
        spdlog::warn("[engine] batch '{}' cancelled, discarding partial results: {}", request.batchId, e.what());
        throw;
    }

    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started).count();
    spdlog::info("[engine] batch '{}' done in {} ms: {} groups, {} ungrouped",
        request.batchId, ms, result.groups.size(), result.ungrouped.size());
    return result;
}
