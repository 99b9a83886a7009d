#pragma once

#include "DedupeResult.h"
#include "FileDescriptor.h"

#include <optional>
#include <string>

// Raw cosine in [-1, 1]; 0 when either vector has zero magnitude.
// Throws DimensionMismatchError on differing lengths.
double cosine_similarity(Embedding const& a, Embedding const& b);

// Cosine clamped to [0, 1].
double embedding_similarity(Embedding const& a, Embedding const& b);

double exact_similarity(std::string const& a, std::string const& b);

// Throws LengthMismatchError on differing hash lengths.
double perceptual_similarity(std::string const& a, std::string const& b);

/*!
 * \brief score_pair
 * Scores every signal present on both sides and derives the combined score.
 *
 * Equal exact hashes short-circuit to combined = 1.0 and nothing else is
 * evaluated. Otherwise combined is the maximum of the per-signal scores, so
 * perceptual hashes and embeddings count as alternative evidence.
 *
 * \return std::nullopt when no signal is present on both sides; the pair is
 *   then incomparable, which is not the same as dissimilar.
 *
 * Identifiers are stored lexicographically ordered regardless of argument
 * order. Mismatch errors from the perceptual or embedding metric propagate.
 */
std::optional<PairScore> score_pair(std::string const& idA, FingerprintSet const& a,
    std::string const& idB, FingerprintSet const& b);
