#include "TextUtils.h"

#include <cctype>

std::string clean_text(std::string_view text)
{
    std::string out;
    out.reserve(text.size());
    bool pendingSpace = false;
    for (char ch : text) {
        if (std::isspace(static_cast<unsigned char>(ch))) {
            pendingSpace = !out.empty();
            continue;
        }
        if (pendingSpace) {
            out.push_back(' ');
            pendingSpace = false;
        }
        out.push_back(ch);
    }
    return out;
}

std::string text_excerpt(std::string_view text, std::size_t maxChars)
{
    auto cleaned = clean_text(text);
    if (cleaned.size() <= maxChars)
        return cleaned;

    std::size_t cut = maxChars;
    // back off continuation bytes (10xxxxxx)
    while (cut > 0 && (static_cast<unsigned char>(cleaned[cut]) & 0xC0) == 0x80)
        --cut;
    cleaned.resize(cut);
    cleaned += "...";
    return cleaned;
}
