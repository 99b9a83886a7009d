#pragma once

#include <cstddef>
#include <string>
#include <string_view>

// Collapses every run of ASCII whitespace into one space and trims both ends.
std::string clean_text(std::string_view text);

// clean_text() cut to at most `maxChars` bytes, with "..." appended when cut.
// Never splits a UTF-8 sequence.
std::string text_excerpt(std::string_view text, std::size_t maxChars);
