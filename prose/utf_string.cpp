#include "utf_string.hpp"
#include <utf8proc.h>

namespace prose {

bool is_trim_space(int32_t codepoint) {
    switch (codepoint) {
        case 0x09: case 0x0A: case 0x0B: case 0x0C: case 0x0D: case 0x20:
        case 0xFEFF:
            return true;
        default:
            break;
    }
    if (codepoint < 0x80) return false;
    utf8proc_category_t category = utf8proc_category(codepoint);
    return category == UTF8PROC_CATEGORY_ZS ||
           category == UTF8PROC_CATEGORY_ZL ||
           category == UTF8PROC_CATEGORY_ZP;
}

std::string utf8_trim(std::string_view text) {
    const utf8proc_uint8_t* bytes = (const utf8proc_uint8_t*)text.data();
    utf8proc_ssize_t len = (utf8proc_ssize_t)text.size();
    utf8proc_ssize_t pos = 0;
    utf8proc_ssize_t start = -1;   // first byte of the first non-space code point
    utf8proc_ssize_t end = 0;      // one past the last non-space code point

    while (pos < len) {
        utf8proc_int32_t codepoint = -1;
        utf8proc_ssize_t n = utf8proc_iterate(bytes + pos, len - pos, &codepoint);
        if (n <= 0) {
            // malformed byte: keep it as content
            if (start < 0) start = pos;
            end = pos + 1;
            pos += 1;
            continue;
        }
        if (!is_trim_space(codepoint)) {
            if (start < 0) start = pos;
            end = pos + n;
        }
        pos += n;
    }

    if (start < 0) return std::string();
    return std::string(text.substr((size_t)start, (size_t)(end - start)));
}

std::string utf8_truncate(std::string_view text, size_t max_bytes) {
    if (text.size() <= max_bytes) return std::string(text);

    size_t cut = max_bytes;
    // back off over continuation bytes to the start of the split sequence
    while (cut > 0 && ((unsigned char)text[cut] & 0xC0) == 0x80) {
        cut--;
    }
    return std::string(text.substr(0, cut));
}

} // namespace prose
