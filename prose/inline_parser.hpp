#pragma once
#ifndef PROSE_INLINE_PARSER_HPP
#define PROSE_INLINE_PARSER_HPP

#include "document.hpp"
#include <string_view>
#include <vector>

namespace prose {

// Piece of a line after one delimiter-pairing pass
struct Fragment {
    bool delimited;     // enclosed by a matched delimiter pair
    std::string text;
};

/**
 * Split text on successive occurrences of `delim`, which alternate between
 * opener and closer. Text between a pair becomes a delimited fragment;
 * empty pairs are dropped. An unmatched opener is dropped and the text
 * after it is kept as plain text. Fragments are never empty.
 */
std::vector<Fragment> pair_delimiters(std::string_view text, std::string_view delim);

/**
 * Parse bold (**) and italic (*) spans of one line.
 *
 * Two passes: bold pairing over the whole line, then italic pairing over
 * the plain fragments only. Bold content is never scanned for italics, so
 * "**a *b* c**" is one bold span with the asterisks kept. Every leaf span
 * carries `style`.
 */
InlineSequence inline_parse(std::string_view line, const StyleToken& style = StyleToken());

} // namespace prose

#endif // PROSE_INLINE_PARSER_HPP
