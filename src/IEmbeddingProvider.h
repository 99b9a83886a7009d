#pragma once

#include "FileDescriptor.h"
#include "ImageDecoder.h"

#include <string>
#include <vector>

// Feature-extraction collaborator. Returns one fixed-dimension vector per
// input, in input order. A failure covers the whole call and is reported by
// throwing; CollaboratorUnavailableError means the service cannot be reached
// at all.
class IEmbeddingProvider {
public:
    virtual ~IEmbeddingProvider() = 0;

    virtual std::vector<Embedding>
    embedTexts(std::vector<std::string> const& texts) = 0;

    virtual std::vector<Embedding>
    embedImages(std::vector<DecodedImage> const& images) = 0;
};

inline IEmbeddingProvider::~IEmbeddingProvider() = default;
