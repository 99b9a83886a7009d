#pragma once

#include "CancellationToken.h"
#include "DedupeResult.h"
#include "EngineSettings.h"
#include "FileDescriptor.h"
#include "IEmbeddingProvider.h"
#include "ImageDecoder.h"

// Stateless between calls: each run() owns all of its intermediate data.
class DedupeEngine {
public:
    DedupeEngine(EngineSettings cfg,
        IImageDecoder& decoder,
        IEmbeddingProvider* provider = nullptr);

    // Applies the configured timeoutMs as a deadline (none when 0).
    DedupeResult run(BatchRequest const& request) const;

    // Caller-controlled cancellation; timeoutMs is not applied.
    DedupeResult run(BatchRequest const& request, CancellationToken const& token) const;

    EngineSettings const& settings() const { return m_cfg; }

    // Throws BatchTooLargeError or InvalidBatchError; see run().
    void validate(BatchRequest const& request) const;

private:
    EngineSettings m_cfg;
    IImageDecoder& m_decoder;
    IEmbeddingProvider* m_provider;
};
