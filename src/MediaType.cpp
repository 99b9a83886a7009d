#include "MediaType.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <filesystem>
#include <initializer_list>

static constexpr std::array<std::string_view, 8> image_extensions = {
    "png", "jpg", "jpeg", "webp", "gif", "bmp", "tif", "tiff"
};

static constexpr std::array<std::string_view, 6> text_extensions = {
    "txt", "md", "csv", "json", "log", "xml"
};

namespace {

std::string lower(std::string_view s)
{
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool starts_with(std::vector<std::uint8_t> const& b, std::initializer_list<std::uint8_t> sig, std::size_t at = 0)
{
    if (b.size() < at + sig.size())
        return false;
    return std::equal(sig.begin(), sig.end(), b.begin() + static_cast<std::ptrdiff_t>(at));
}

std::optional<MediaType> from_magic(std::vector<std::uint8_t> const& b)
{
    if (starts_with(b, { 0x89, 0x50, 0x4E, 0x47 })
        || starts_with(b, { 0xFF, 0xD8, 0xFF })
        || starts_with(b, { 0x47, 0x49, 0x46, 0x38 })
        || (starts_with(b, { 0x52, 0x49, 0x46, 0x46 }) && starts_with(b, { 0x57, 0x45, 0x42, 0x50 }, 8)))
        return MediaType::Image;
    // %PDF: no perceptual or text path for it here
    if (starts_with(b, { 0x25, 0x50, 0x44, 0x46 }))
        return MediaType::Binary;
    return std::nullopt;
}

} // namespace

MediaType detect_media_type(std::vector<std::uint8_t> const& head, std::string const& filename)
{
    if (auto m = from_magic(head))
        return *m;

    std::string ext = std::filesystem::path(filename).extension().string();
    if (!ext.empty() && ext.front() == '.')
        ext.erase(0, 1);
    ext = lower(ext);

    if (std::find(image_extensions.begin(), image_extensions.end(), ext) != image_extensions.end())
        return MediaType::Image;
    if (std::find(text_extensions.begin(), text_extensions.end(), ext) != text_extensions.end())
        return MediaType::Text;
    return MediaType::Binary;
}

char const* to_string(MediaType t) noexcept
{
    switch (t) {
    case MediaType::Image:
        return "image";
    case MediaType::Text:
        return "text";
    case MediaType::Binary:
        break;
    }
    return "binary";
}

std::optional<MediaType> media_type_from_string(std::string_view s)
{
    auto l = lower(s);
    if (l == "image")
        return MediaType::Image;
    if (l == "text")
        return MediaType::Text;
    if (l == "binary" || l == "other")
        return MediaType::Binary;
    return std::nullopt;
}
