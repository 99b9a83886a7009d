#pragma once

#include "FileDescriptor.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Magic bytes first (PNG, JPEG, GIF, WebP, PDF), then the file extension.
// Anything unrecognised is Binary.
MediaType detect_media_type(std::vector<std::uint8_t> const& head, std::string const& filename);

char const* to_string(MediaType t) noexcept;
std::optional<MediaType> media_type_from_string(std::string_view s);
