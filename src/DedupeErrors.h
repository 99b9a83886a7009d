#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

// Base of every error the engine raises on purpose.
class DedupeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Stream / file read failure. Local to one file.
class IOError : public DedupeError {
public:
    using DedupeError::DedupeError;
};

// Malformed or unsupported media. Local to one file.
class DecodeError : public DedupeError {
public:
    using DedupeError::DedupeError;
};

// Two perceptual hashes from different hash configurations.
class LengthMismatchError : public DedupeError {
public:
    LengthMismatchError(std::size_t a, std::size_t b)
        : DedupeError("hash length mismatch: " + std::to_string(a) + " vs " + std::to_string(b))
    {
    }
};

// Two embeddings of different dimension.
class DimensionMismatchError : public DedupeError {
public:
    DimensionMismatchError(std::size_t a, std::size_t b)
        : DedupeError("embedding dimension mismatch: " + std::to_string(a) + " vs " + std::to_string(b))
    {
    }
};

class BatchTooLargeError : public DedupeError {
public:
    BatchTooLargeError(std::size_t size, std::size_t limit)
        : DedupeError("batch of " + std::to_string(size) + " files exceeds limit of " + std::to_string(limit))
        , m_size(size)
        , m_limit(limit)
    {
    }

    std::size_t size() const noexcept { return m_size; }
    std::size_t limit() const noexcept { return m_limit; }

private:
    std::size_t m_size;
    std::size_t m_limit;
};

// Structurally malformed request (bad descriptor, bad threshold).
class InvalidBatchError : public DedupeError {
public:
    using DedupeError::DedupeError;
};

// Embedding service unreachable.
class CollaboratorUnavailableError : public DedupeError {
public:
    using DedupeError::DedupeError;
};

class BatchCancelledError : public DedupeError {
public:
    using DedupeError::DedupeError;
};
