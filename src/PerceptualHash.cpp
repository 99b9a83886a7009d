#include "PerceptualHash.h"
#include "DedupeErrors.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <stdexcept>
#include <vector>

namespace {

// Source taps and coverage weights of one destination cell along one axis.
struct AreaTaps {
    std::vector<int> idx;
    std::vector<double> w;
    double norm = 1.0;
};

std::vector<AreaTaps> build_table(int src, int dst)
{
    std::vector<AreaTaps> tab(dst);
    double const scale = static_cast<double>(src) / dst;
    for (int d = 0; d < dst; ++d) {
        double const s0 = d * scale;
        double const s1 = (d + 1) * scale;
        int const first = static_cast<int>(std::floor(s0));
        int const last = std::min(static_cast<int>(std::ceil(s1)), src);

        auto& t = tab[d];
        for (int i = first; i < last; ++i) {
            double cover = std::min<double>(i + 1, s1) - std::max<double>(i, s0);
            if (cover <= 0.0)
                continue;
            t.idx.push_back(i);
            t.w.push_back(cover);
        }
        t.norm = s1 - s0;
    }
    return tab;
}

std::vector<double> to_luma(DecodedImage const& img)
{
    std::size_t const n = static_cast<std::size_t>(img.width) * img.height;
    std::vector<double> luma(n);
    std::uint8_t const* p = img.pixels.data();

    if (img.channels >= 3) {
        for (std::size_t i = 0; i < n; ++i, p += img.channels)
            luma[i] = 0.299 * p[0] + 0.587 * p[1] + 0.114 * p[2];
    } else {
        for (std::size_t i = 0; i < n; ++i, p += img.channels)
            luma[i] = p[0];
    }
    return luma;
}

} // namespace

std::uint64_t compute_dhash_bits(DecodedImage const& img)
{
    if (img.width <= 0 || img.height <= 0 || img.channels <= 0
        || img.pixels.size() < static_cast<std::size_t>(img.width) * img.height * img.channels)
        throw DecodeError("image has no usable pixel data");

    auto const luma = to_luma(img);
    auto const wx = build_table(img.width, kPHashGridW);
    auto const wy = build_table(img.height, kPHashGridH);

    // horizontal pass: every source row -> 9 columns
    std::vector<double> tmp(static_cast<std::size_t>(img.height) * kPHashGridW);
    for (int y = 0; y < img.height; ++y) {
        double const* row = luma.data() + static_cast<std::size_t>(y) * img.width;
        for (int d = 0; d < kPHashGridW; ++d) {
            double acc = 0.0;
            for (std::size_t k = 0; k < wx[d].idx.size(); ++k)
                acc += row[wx[d].idx[k]] * wx[d].w[k];
            tmp[static_cast<std::size_t>(y) * kPHashGridW + d] = acc / wx[d].norm;
        }
    }

    // vertical pass: 9 x height -> 9 x 8
    std::array<double, kPHashGridW * kPHashGridH> grid {};
    for (int d = 0; d < kPHashGridH; ++d) {
        for (int x = 0; x < kPHashGridW; ++x) {
            double acc = 0.0;
            for (std::size_t k = 0; k < wy[d].idx.size(); ++k)
                acc += tmp[static_cast<std::size_t>(wy[d].idx[k]) * kPHashGridW + x] * wy[d].w[k];
            grid[d * kPHashGridW + x] = acc / wy[d].norm;
        }
    }

    std::uint64_t hash = 0;
    int bit = 0;
    for (int y = 0; y < kPHashGridH; ++y) {
        for (int x = 0; x < kPHashGridW - 1; ++x, ++bit) {
            bool brighter = grid[y * kPHashGridW + x] > grid[y * kPHashGridW + x + 1] + kPHashMinStep;
            hash |= static_cast<std::uint64_t>(brighter) << (63 - bit);
        }
    }
    return hash;
}

std::string phash_to_hex(std::uint64_t bits)
{
    return fmt::format("{:016x}", bits);
}

std::string compute_dhash(DecodedImage const& img)
{
    auto h = phash_to_hex(compute_dhash_bits(img));
    spdlog::debug("[phash] {}x{}x{} -> {}", img.width, img.height, img.channels, h);
    return h;
}

std::size_t hamming_distance(std::string const& a, std::string const& b)
{
    if (a.size() != b.size())
        throw LengthMismatchError(a.size(), b.size());

    std::size_t distance = 0;
    for (std::size_t i = 0; i < a.size(); ++i)
        distance += (a[i] != b[i]);
    return distance;
}

double hamming_to_similarity(std::size_t distance, std::size_t hashLength)
{
    if (hashLength == 0)
        throw std::invalid_argument("hash length must be positive");
    double s = 1.0 - static_cast<double>(distance) / static_cast<double>(hashLength);
    return std::clamp(s, 0.0, 1.0);
}
