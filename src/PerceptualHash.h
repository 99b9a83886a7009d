#pragma once

#include "ImageDecoder.h"

#include <cstddef>
#include <cstdint>
#include <string>

// Gradient hash: luma, area-downsample to 9x8, one bit per horizontal
// neighbour comparison -> 64 bits -> 16 lowercase hex characters.
inline constexpr int kPHashGridW = 9;
inline constexpr int kPHashGridH = 8;
inline constexpr std::size_t kPHashHexLength = 16;

// Size the decoder is asked for before hashing.
inline constexpr int kPHashDecodeSize = 32;

// A cell must be brighter than its neighbour by more than this many luma
// levels to set its bit. Flat regions and one-level shifts hash to zeros.
inline constexpr double kPHashMinStep = 0.5;

// Throws DecodeError if `img` carries no usable pixels.
std::uint64_t compute_dhash_bits(DecodedImage const& img);
std::string compute_dhash(DecodedImage const& img);

std::string phash_to_hex(std::uint64_t bits);

// Number of differing character positions. Throws LengthMismatchError when
// the lengths differ.
std::size_t hamming_distance(std::string const& a, std::string const& b);

// 1 - distance / hashLength, clamped to [0, 1].
double hamming_to_similarity(std::size_t distance, std::size_t hashLength = kPHashHexLength);
