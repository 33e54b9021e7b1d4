#pragma once
#ifndef PROSE_UTF_STRING_HPP
#define PROSE_UTF_STRING_HPP

#include <string>
#include <string_view>
#include <cstdint>

namespace prose {

// True for the code points ECMAScript String.prototype.trim removes:
// ASCII tab/LF/VT/FF/CR/space, BOM, and the Zs, Zl, Zp categories.
bool is_trim_space(int32_t codepoint);

// Strip leading and trailing Unicode whitespace. Invalid UTF-8 bytes are
// treated as content and never removed.
std::string utf8_trim(std::string_view text);

// Cut `text` to at most `max_bytes`, backing off so no UTF-8 sequence is split
std::string utf8_truncate(std::string_view text, size_t max_bytes);

} // namespace prose

#endif // PROSE_UTF_STRING_HPP
