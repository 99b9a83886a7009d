#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

enum class MediaType { Binary,
    Image,
    Text };

using Embedding = std::vector<float>;

struct FileDescriptor {
    std::string id; // unique within a batch
    std::uint64_t size = 0;
    MediaType mediaType = MediaType::Binary;

    // exactly one of these supplies the bytes (or neither: no local signal)
    std::optional<std::vector<std::uint8_t>> content;
    std::optional<std::string> path;

    // signals already computed upstream
    std::optional<std::string> perceptualHash;
    std::optional<Embedding> embedding;
};

struct FingerprintSet {
    std::optional<std::string> exactHash;      // 64 lowercase hex chars
    std::optional<std::string> perceptualHash; // 16 lowercase hex chars, images only
    std::optional<Embedding> embedding;

    bool empty() const { return !exactHash && !perceptualHash && !embedding; }
};

// A descriptor together with the signals computed for it.
struct FileSignals {
    FileDescriptor const* file = nullptr;
    FingerprintSet fingerprints;
};

struct BatchRequest {
    std::string batchId;
    std::vector<FileDescriptor> files;
    std::optional<double> threshold;
};
