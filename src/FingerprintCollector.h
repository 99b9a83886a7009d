#pragma once

#include "CancellationToken.h"
#include "DedupeResult.h"
#include "EngineSettings.h"
#include "FileDescriptor.h"
#include "IEmbeddingProvider.h"
#include "ImageDecoder.h"

#include <optional>
#include <string>
#include <vector>

// Computes the FingerprintSet of every file in a batch.
//
// Exact and perceptual hashes are computed locally, `parallelism` files at a
// time. Embeddings come from the injected provider (optional) in sub-batches
// of `embeddingBatchSize`. Any per-file failure only removes that signal from
// that file; cancellation aborts the whole collection.
class FingerprintCollector {
public:
    FingerprintCollector(EngineSettings const& cfg,
        IImageDecoder& decoder,
        IEmbeddingProvider* provider = nullptr);

    // Result i belongs to files[i].
    std::vector<FingerprintSet> collect(std::vector<FileDescriptor> const& files,
        CancellationToken const& token,
        BatchStats& stats) const;

private:
    // embedding input prepared alongside the local hashes
    struct LocalResult {
        FingerprintSet set;
        std::optional<std::string> text;
        std::optional<DecodedImage> image;
    };

    EngineSettings const& m_cfg;
    IImageDecoder& m_decoder;
    IEmbeddingProvider* m_provider;

    LocalResult fingerprintLocal(FileDescriptor const& f) const;
    std::optional<std::string> exactHashOf(FileDescriptor const& f) const;
    std::optional<std::string> perceptualHashOf(FileDescriptor const& f) const;
    std::optional<std::string> textOf(FileDescriptor const& f) const;
    std::optional<DecodedImage> embeddingImageOf(FileDescriptor const& f) const;
    DecodedImage decodeImage(FileDescriptor const& f, int size, PixelModel model) const;

    std::vector<LocalResult> runLocal(std::vector<FileDescriptor> const& files,
        CancellationToken const& token) const;
    void attachEmbeddings(std::vector<FileDescriptor> const& files,
        std::vector<LocalResult>& local,
        CancellationToken const& token,
        BatchStats& stats) const;
};
