#pragma once

#include <cstdint>
#include <string>
#include <vector>

enum class PixelModel { Gray8,
    Rgb24 };

struct DecodedImage {
    int width = 0;
    int height = 0;
    int channels = 1; // 1 = gray, 3 = RGB, 4 = RGBA
    std::vector<std::uint8_t> pixels; // row-major, tightly packed
};

// Image decode collaborator: raw bytes or a path in, pixels at a requested
// fixed resolution and colour model out. Throws DecodeError on malformed or
// unsupported input and IOError when a path cannot be read.
class IImageDecoder {
public:
    virtual ~IImageDecoder() = 0;

    virtual DecodedImage decode(std::vector<std::uint8_t> const& bytes,
        int width, int height, PixelModel model)
        = 0;

    virtual DecodedImage decodeFile(std::string const& path,
        int width, int height, PixelModel model)
        = 0;
};

inline IImageDecoder::~IImageDecoder() = default;

// libavformat/libavcodec demux+decode of the first video frame, scaled with
// libswscale. Handles every still-image format the linked FFmpeg build knows
// (PNG, JPEG, GIF, WebP, BMP, PGM/PPM, ...).
class FfmpegImageDecoder : public IImageDecoder {
public:
    DecodedImage decode(std::vector<std::uint8_t> const& bytes,
        int width, int height, PixelModel model) override;

    DecodedImage decodeFile(std::string const& path,
        int width, int height, PixelModel model) override;
};
