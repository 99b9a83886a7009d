#include "FingerprintCollector.h"
#include "DedupeErrors.h"
#include "ExactHash.h"
#include "PerceptualHash.h"
#include "TextUtils.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <fstream>
#include <future>
#include <iterator>

FingerprintCollector::FingerprintCollector(EngineSettings const& cfg,
    IImageDecoder& decoder,
    IEmbeddingProvider* provider)
    : m_cfg(cfg)
    , m_decoder(decoder)
    , m_provider(provider)
{
}

std::vector<FingerprintSet> FingerprintCollector::collect(std::vector<FileDescriptor> const& files,
    CancellationToken const& token,
    BatchStats& stats) const
{
    spdlog::info("[collector] fingerprinting {} files (parallelism={})", files.size(), m_cfg.parallelism);

    auto local = runLocal(files, token);
    stats.filesFingerprinted = local.size();

    if (m_provider)
        attachEmbeddings(files, local, token, stats);
    else
        spdlog::debug("[collector] no embedding provider, using supplied embeddings only");

    std::vector<FingerprintSet> sets;
    sets.reserve(local.size());
    std::size_t silent = 0;
    for (auto& r : local) {
        silent += r.set.empty();
        sets.push_back(std::move(r.set));
    }
    if (silent > 0)
        spdlog::info("[collector] {} files have no usable signal and cannot be grouped", silent);
    return sets;
}

std::vector<FingerprintCollector::LocalResult>
FingerprintCollector::runLocal(std::vector<FileDescriptor> const& files,
    CancellationToken const& token) const
{
    std::vector<LocalResult> out(files.size());
    if (files.empty())
        return out;

    std::atomic<std::size_t> next { 0 };
    std::atomic<bool> abort { false };

    auto worker = [&]() {
        try {
            for (std::size_t i = next++; i < files.size() && !abort; i = next++) {
                token.throwIfCancelled("fingerprinting");
                out[i] = fingerprintLocal(files[i]);
            }
        } catch (...) {
            abort = true;
            throw;
        }
    };

    std::size_t const nWorkers = std::min<std::size_t>(static_cast<std::size_t>(m_cfg.parallelism), files.size());
    std::vector<std::future<void>> tasks;
    tasks.reserve(nWorkers);
    for (std::size_t w = 0; w < nWorkers; ++w)
        tasks.emplace_back(std::async(std::launch::async, worker));

    // join every worker before the first failure is rethrown
    for (auto& t : tasks)
        t.wait();
    for (auto& t : tasks)
        t.get();

    token.throwIfCancelled("fingerprinting");
    return out;
}

FingerprintCollector::LocalResult FingerprintCollector::fingerprintLocal(FileDescriptor const& f) const
{
    LocalResult r;
    r.set.exactHash = exactHashOf(f);
    r.set.perceptualHash = perceptualHashOf(f);

    if (f.embedding && !f.embedding->empty()) {
        r.set.embedding = f.embedding;
    } else if (m_provider) {
        if (f.mediaType == MediaType::Text)
            r.text = textOf(f);
        else if (f.mediaType == MediaType::Image)
            r.image = embeddingImageOf(f);
    }

    spdlog::debug("[collector] '{}': exact={} phash={} embedding={}",
        f.id, r.set.exactHash.has_value(), r.set.perceptualHash.value_or("-"),
        r.set.embedding ? "supplied" : (r.text || r.image ? "pending" : "none"));
    return r;
}

std::optional<std::string> FingerprintCollector::exactHashOf(FileDescriptor const& f) const
{
    try {
        if (f.content)
            return sha256_hex(*f.content);
        if (f.path)
            return sha256_hex_file(*f.path);
    } catch (IOError const& e) {
        spdlog::warn("[collector] '{}': no exact hash: {}", f.id, e.what());
    }
    return std::nullopt;
}

DecodedImage FingerprintCollector::decodeImage(FileDescriptor const& f, int size, PixelModel model) const
{
    if (f.content)
        return m_decoder.decode(*f.content, size, size, model);
    if (f.path)
        return m_decoder.decodeFile(*f.path, size, size, model);
    throw DecodeError("no image bytes");
}

std::optional<std::string> FingerprintCollector::perceptualHashOf(FileDescriptor const& f) const
{
    if (f.mediaType != MediaType::Image) {
        if (f.perceptualHash)
            spdlog::debug("[collector] '{}': ignoring perceptual hash on non-image file", f.id);
        return std::nullopt;
    }

    if (f.perceptualHash && !f.perceptualHash->empty()) {
        std::string h = *f.perceptualHash;
        std::transform(h.begin(), h.end(), h.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return h;
    }
    if (!m_cfg.perceptualHashing || (!f.content && !f.path))
        return std::nullopt;

    try {
        return compute_dhash(decodeImage(f, kPHashDecodeSize, PixelModel::Gray8));
    } catch (DecodeError const& e) {
        spdlog::warn("[collector] '{}': no perceptual hash: {}", f.id, e.what());
    } catch (IOError const& e) {
        spdlog::warn("[collector] '{}': no perceptual hash: {}", f.id, e.what());
    }
    return std::nullopt;
}

std::optional<std::string> FingerprintCollector::textOf(FileDescriptor const& f) const
{
    std::string raw;
    if (f.content) {
        raw.assign(f.content->begin(), f.content->end());
    } else if (f.path) {
        std::ifstream in(*f.path, std::ios::binary);
        if (!in) {
            spdlog::warn("[collector] '{}': cannot open '{}' for text", f.id, *f.path);
            return std::nullopt;
        }
        raw.resize(m_cfg.maxSampleBytes);
        in.read(raw.data(), static_cast<std::streamsize>(raw.size()));
        if (in.bad()) {
            spdlog::warn("[collector] '{}': read error on '{}'", f.id, *f.path);
            return std::nullopt;
        }
        raw.resize(static_cast<std::size_t>(in.gcount()));
    } else {
        return std::nullopt;
    }

    auto text = text_excerpt(raw, m_cfg.textExcerptChars);
    if (text.empty())
        return std::nullopt;
    return text;
}

std::optional<DecodedImage> FingerprintCollector::embeddingImageOf(FileDescriptor const& f) const
{
    if (!f.content && !f.path)
        return std::nullopt;
    try {
        return decodeImage(f, m_cfg.embeddingImageSize, PixelModel::Rgb24);
    } catch (DecodeError const& e) {
        spdlog::warn("[collector] '{}': no image for embedding: {}", f.id, e.what());
    } catch (IOError const& e) {
        spdlog::warn("[collector] '{}': no image for embedding: {}", f.id, e.what());
    }
    return std::nullopt;
}

void FingerprintCollector::attachEmbeddings(std::vector<FileDescriptor> const& files,
    std::vector<LocalResult>& local,
    CancellationToken const& token,
    BatchStats& stats) const
{
    std::vector<std::size_t> textIdx, imageIdx;
    for (std::size_t i = 0; i < local.size(); ++i) {
        if (local[i].text)
            textIdx.push_back(i);
        else if (local[i].image)
            imageIdx.push_back(i);
    }

    bool unavailable = false;

    // Runs `call` over `idx` in sub-batches and stores the returned vectors.
    auto run = [&](std::vector<std::size_t> const& idx, char const* kind, auto&& call) {
        std::size_t const step = m_cfg.embeddingBatchSize;
        for (std::size_t start = 0; start < idx.size() && !unavailable; start += step) {
            token.throwIfCancelled("embedding");
            std::size_t const end = std::min(start + step, idx.size());
            std::vector<std::size_t> chunk(idx.begin() + static_cast<std::ptrdiff_t>(start),
                idx.begin() + static_cast<std::ptrdiff_t>(end));

            try {
                auto vectors = call(chunk);
                if (vectors.size() != chunk.size()) {
                    spdlog::warn("[collector] {} embeddings: provider returned {} vectors for {} inputs, dropping sub-batch",
                        kind, vectors.size(), chunk.size());
                    ++stats.embeddingBatchesFailed;
                    continue;
                }
                for (std::size_t k = 0; k < chunk.size(); ++k) {
                    if (!vectors[k].empty())
                        local[chunk[k]].set.embedding = std::move(vectors[k]);
                }
            } catch (CollaboratorUnavailableError const& e) {
                spdlog::warn("[collector] embedding service unavailable, continuing with local signals: {}", e.what());
                ++stats.embeddingBatchesFailed;
                unavailable = true;
            } catch (std::exception const& e) {
                spdlog::warn("[collector] {} embedding sub-batch [{}, {}) failed: {}", kind, start, end, e.what());
                ++stats.embeddingBatchesFailed;
            }
        }
    };

    run(textIdx, "text", [&](std::vector<std::size_t> const& chunk) {
        std::vector<std::string> texts;
        texts.reserve(chunk.size());
        for (auto i : chunk)
            texts.push_back(*local[i].text);
        return m_provider->embedTexts(texts);
    });

    run(imageIdx, "image", [&](std::vector<std::size_t> const& chunk) {
        std::vector<DecodedImage> images;
        images.reserve(chunk.size());
        for (auto i : chunk)
            images.push_back(*local[i].image);
        return m_provider->embedImages(images);
    });

    std::size_t attached = 0;
    for (auto i : textIdx)
        attached += local[i].set.embedding.has_value();
    for (auto i : imageIdx)
        attached += local[i].set.embedding.has_value();
    spdlog::info("[collector] embeddings attached to {}/{} requested files ({} files in batch)",
        attached, textIdx.size() + imageIdx.size(), files.size());
}
