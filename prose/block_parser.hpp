#pragma once
#ifndef PROSE_BLOCK_PARSER_HPP
#define PROSE_BLOCK_PARSER_HPP

#include "document.hpp"
#include <string>
#include <string_view>

namespace prose {

// Line classification, in the order the parser tests it
enum class LineType {
    BLANK,
    SECTION_HEADER,
    HEADING,
    BULLET_ITEM,
    ORDERED_ITEM,
    PARAGRAPH
};

// Result of classifying one trimmed line
struct LineInfo {
    LineType type;
    int level;              // heading level 1-3
    std::string number;     // ordered item ordinal
    std::string_view body;  // text after the marker (points into the line)
};

// Lines ending in ':' that are not URLs or '#' headings
bool is_section_header(std::string_view line);

// 1-3 for "# ", "## ", "### " prefixes, 0 otherwise
int heading_level(std::string_view line);

// Classify a line already trimmed of surrounding whitespace
LineInfo classify_line(std::string_view line);

// Heading text without its "#" prefix and without a wrapping "**...**"
std::string heading_text(std::string_view line, int level);

/**
 * Parse normalized text into blocks, one line at a time.
 *
 * Consecutive list lines of one kind are grouped into a single LIST
 * block; a blank line directly under a heading or section header is
 * swallowed instead of producing a SPACER. Heading and section-header
 * text is kept verbatim as one TEXT span; paragraphs and list items are
 * inline-parsed. `style` is passed to every leaf span.
 */
Document parse_blocks(std::string_view normalized, const StyleToken& style = StyleToken());

} // namespace prose

#endif // PROSE_BLOCK_PARSER_HPP
