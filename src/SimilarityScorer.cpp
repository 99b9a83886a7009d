#include "SimilarityScorer.h"
#include "DedupeErrors.h"
#include "PerceptualHash.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

double cosine_similarity(Embedding const& a, Embedding const& b)
{
    if (a.size() != b.size())
        throw DimensionMismatchError(a.size(), b.size());
    if (a.empty())
        throw std::invalid_argument("cosine_similarity: empty vectors");

    double dot = 0.0, magA = 0.0, magB = 0.0;
    for (std::size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * b[i];
        magA += static_cast<double>(a[i]) * a[i];
        magB += static_cast<double>(b[i]) * b[i];
    }
    if (magA == 0.0 || magB == 0.0)
        return 0.0;

    return std::clamp(dot / (std::sqrt(magA) * std::sqrt(magB)), -1.0, 1.0);
}

double embedding_similarity(Embedding const& a, Embedding const& b)
{
    return std::max(0.0, cosine_similarity(a, b));
}

double exact_similarity(std::string const& a, std::string const& b)
{
    return a == b ? 1.0 : 0.0;
}

double perceptual_similarity(std::string const& a, std::string const& b)
{
    return hamming_to_similarity(hamming_distance(a, b), a.size());
}

std::optional<PairScore> score_pair(std::string const& idA, FingerprintSet const& a,
    std::string const& idB, FingerprintSet const& b)
{
    PairScore s;
    bool const swap = idB < idA;
    s.first = swap ? idB : idA;
    s.second = swap ? idA : idB;

    if (a.exactHash && b.exactHash) {
        s.exact = exact_similarity(*a.exactHash, *b.exactHash);
        if (*s.exact == 1.0) {
            s.combined = 1.0;
            return s;
        }
    }
    if (a.perceptualHash && b.perceptualHash)
        s.perceptual = perceptual_similarity(*a.perceptualHash, *b.perceptualHash);
    if (a.embedding && b.embedding)
        s.embedding = embedding_similarity(*a.embedding, *b.embedding);

    if (!s.exact && !s.perceptual && !s.embedding)
        return std::nullopt;

    double combined = 0.0;
    for (auto const& v : { s.exact, s.perceptual, s.embedding }) {
        if (v)
            combined = std::max(combined, *v);
    }
    s.combined = combined;
    return s;
}
