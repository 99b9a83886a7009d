#include "ImageDecoder.h"
#include "DedupeErrors.h"

#include <spdlog/spdlog.h>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavformat/avio.h>
#include <libavutil/avutil.h>
#include <libavutil/error.h>
#include <libavutil/frame.h>
#include <libavutil/mem.h>
#include <libavutil/pixfmt.h>
#include <libswscale/swscale.h>
}

#include <algorithm>
#include <cstring>
#include <filesystem>
#include <memory>
#include <mutex>
#include <stdexcept>

static constexpr int kAvioBufSize = 32 * 1024;

namespace {

template<auto Fn>
struct CDeleter {
    template<class T>
    void operator()(T* p) const noexcept
    {
        if (p)
            Fn(&p);
    }
};

struct SwsDeleter {
    void operator()(SwsContext* p) const noexcept { sws_freeContext(p); }
};

// avio_context_free() does not release the I/O buffer, which may have been
// reallocated by libavformat since we handed it over.
struct AvioDeleter {
    void operator()(AVIOContext* p) const noexcept
    {
        if (p) {
            av_freep(&p->buffer);
            avio_context_free(&p);
        }
    }
};

using FmtPtr = std::unique_ptr<AVFormatContext, CDeleter<&avformat_close_input>>;
using CtxPtr = std::unique_ptr<AVCodecContext, CDeleter<&avcodec_free_context>>;
using FrmPtr = std::unique_ptr<AVFrame, CDeleter<&av_frame_free>>;
using PktPtr = std::unique_ptr<AVPacket, CDeleter<&av_packet_free>>;
using SwsPtr = std::unique_ptr<SwsContext, SwsDeleter>;
using AvioPtr = std::unique_ptr<AVIOContext, AvioDeleter>;

inline char const* err2str(int e)
{
    static thread_local char buf[AV_ERROR_MAX_STRING_SIZE];
    return av_make_error_string(buf, sizeof(buf), e);
}

void quiet_ffmpeg_once()
{
    static std::once_flag ffOnce;
    std::call_once(ffOnce, [] { av_log_set_level(AV_LOG_ERROR); });
}

// read/seek callbacks over a caller-owned byte range
struct MemoryReader {
    std::uint8_t const* data = nullptr;
    std::int64_t size = 0;
    std::int64_t pos = 0;
};

int memory_read(void* opaque, std::uint8_t* buf, int bufSize)
{
    auto* r = static_cast<MemoryReader*>(opaque);
    std::int64_t left = r->size - r->pos;
    if (left <= 0)
        return AVERROR_EOF;
    int n = static_cast<int>(std::min<std::int64_t>(left, bufSize));
    std::memcpy(buf, r->data + r->pos, static_cast<std::size_t>(n));
    r->pos += n;
    return n;
}

std::int64_t memory_seek(void* opaque, std::int64_t offset, int whence)
{
    auto* r = static_cast<MemoryReader*>(opaque);
    if (whence & AVSEEK_SIZE)
        return r->size;

    std::int64_t target;
    switch (whence & ~AVSEEK_FORCE) {
    case SEEK_SET:
        target = offset;
        break;
    case SEEK_CUR:
        target = r->pos + offset;
        break;
    case SEEK_END:
        target = r->size + offset;
        break;
    default:
        return AVERROR(EINVAL);
    }
    if (target < 0 || target > r->size)
        return AVERROR(EINVAL);
    r->pos = target;
    return target;
}

void check_geometry(int width, int height)
{
    if (width <= 0 || height <= 0)
        throw std::invalid_argument("requested decode size must be positive");
}

FrmPtr decode_first_frame(AVFormatContext* fmt, std::string const& what)
{
    if (int e = avformat_find_stream_info(fmt, nullptr); e < 0)
        throw DecodeError(what + ": stream info: " + err2str(e));

    int vstream = av_find_best_stream(fmt, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
    if (vstream < 0)
        throw DecodeError(what + ": no image stream");
    AVCodec const* codec = avcodec_find_decoder(fmt->streams[vstream]->codecpar->codec_id);
    if (!codec)
        throw DecodeError(what + ": no decoder for image stream");

    CtxPtr ctx(avcodec_alloc_context3(codec));
    if (!ctx)
        throw DecodeError(what + ": avcodec_alloc_context3 failed");
    if (int e = avcodec_parameters_to_context(ctx.get(), fmt->streams[vstream]->codecpar); e < 0)
        throw DecodeError(what + ": codec parameters: " + err2str(e));
    if (int e = avcodec_open2(ctx.get(), codec, nullptr); e < 0)
        throw DecodeError(what + ": avcodec_open2: " + err2str(e));

    PktPtr pkt(av_packet_alloc());
    FrmPtr frame(av_frame_alloc());
    if (!pkt || !frame)
        throw DecodeError(what + ": out of memory");

    auto receive = [&]() -> bool {
        int e = avcodec_receive_frame(ctx.get(), frame.get());
        if (e == 0)
            return true;
        if (e == AVERROR(EAGAIN) || e == AVERROR_EOF)
            return false;
        throw DecodeError(what + ": decode: " + err2str(e));
    };

    while (av_read_frame(fmt, pkt.get()) >= 0) {
        if (pkt->stream_index != vstream) {
            av_packet_unref(pkt.get());
            continue;
        }
        int e = avcodec_send_packet(ctx.get(), pkt.get());
        av_packet_unref(pkt.get());
        if (e < 0 && e != AVERROR(EAGAIN))
            throw DecodeError(what + ": send packet: " + err2str(e));
        if (receive())
            return frame;
    }

    // drain: single-packet images may only surface on flush
    if (int e = avcodec_send_packet(ctx.get(), nullptr); e < 0 && e != AVERROR_EOF)
        throw DecodeError(what + ": flush: " + err2str(e));
    if (receive())
        return frame;

    throw DecodeError(what + ": no decodable frame");
}

DecodedImage scale_frame(AVFrame const* src, int width, int height,
    PixelModel model, std::string const& what)
{
    if (src->width <= 0 || src->height <= 0 || src->format == AV_PIX_FMT_NONE)
        throw DecodeError(what + ": frame has no geometry");

    AVPixelFormat const dstFmt = (model == PixelModel::Gray8) ? AV_PIX_FMT_GRAY8 : AV_PIX_FMT_RGB24;
    int const channels = (model == PixelModel::Gray8) ? 1 : 3;

    SwsPtr sws(sws_getContext(src->width, src->height,
        static_cast<AVPixelFormat>(src->format),
        width, height, dstFmt,
        SWS_AREA, nullptr, nullptr, nullptr));
    if (!sws)
        throw DecodeError(what + ": unsupported pixel format");

    DecodedImage out;
    out.width = width;
    out.height = height;
    out.channels = channels;
    out.pixels.resize(static_cast<std::size_t>(width) * height * channels);

    std::uint8_t* dstData[4] = { out.pixels.data(), nullptr, nullptr, nullptr };
    int dstLines[4] = { width * channels, 0, 0, 0 };

    if (sws_scale(sws.get(), src->data, src->linesize, 0, src->height, dstData, dstLines) <= 0)
        throw DecodeError(what + ": sws_scale failed");
    return out;
}

} // namespace

DecodedImage FfmpegImageDecoder::decode(std::vector<std::uint8_t> const& bytes,
    int width, int height, PixelModel model)
{
    check_geometry(width, height);
    quiet_ffmpeg_once();

    if (bytes.empty())
        throw DecodeError("<buffer>: empty input");

    MemoryReader reader { bytes.data(), static_cast<std::int64_t>(bytes.size()), 0 };

    auto* ioBuf = static_cast<unsigned char*>(av_malloc(kAvioBufSize));
    if (!ioBuf)
        throw DecodeError("<buffer>: out of memory");
    AvioPtr avio(avio_alloc_context(ioBuf, kAvioBufSize, 0, &reader,
        &memory_read, nullptr, &memory_seek));
    if (!avio) {
        av_free(ioBuf);
        throw DecodeError("<buffer>: avio_alloc_context failed");
    }

    // declared after `avio` so it is closed first
    FmtPtr fmt;
    {
        AVFormatContext* raw = avformat_alloc_context();
        if (!raw)
            throw DecodeError("<buffer>: avformat_alloc_context failed");
        raw->pb = avio.get();
        raw->flags |= AVFMT_FLAG_CUSTOM_IO;
        // frees `raw` on failure
        if (int e = avformat_open_input(&raw, nullptr, nullptr, nullptr); e < 0)
            throw DecodeError(std::string("<buffer>: unrecognised image data: ") + err2str(e));
        fmt.reset(raw);
    }

    auto frame = decode_first_frame(fmt.get(), "<buffer>");
    spdlog::debug("[ffmpeg] decoded {} byte buffer ({}x{})", bytes.size(), frame->width, frame->height);
    return scale_frame(frame.get(), width, height, model, "<buffer>");
}

DecodedImage FfmpegImageDecoder::decodeFile(std::string const& path,
    int width, int height, PixelModel model)
{
    check_geometry(width, height);
    quiet_ffmpeg_once();

    std::error_code ec;
    if (path.empty() || !std::filesystem::is_regular_file(path, ec))
        throw IOError("image file '" + path + "' not found");

    FmtPtr fmt;
    {
        AVFormatContext* raw = nullptr;
        if (int e = avformat_open_input(&raw, path.c_str(), nullptr, nullptr); e < 0)
            throw DecodeError("'" + path + "': avformat_open_input: " + err2str(e));
        fmt.reset(raw);
    }

    auto frame = decode_first_frame(fmt.get(), "'" + path + "'");
    spdlog::debug("[ffmpeg] decoded '{}' ({}x{})", path, frame->width, frame->height);
    return scale_frame(frame.get(), width, height, model, "'" + path + "'");
}
