#pragma once
#ifndef PROSE_NORMALIZE_HPP
#define PROSE_NORMALIZE_HPP

#include <string>
#include <string_view>

namespace prose {

/**
 * Clean up language-model formatting noise before block parsing.
 *
 * Applied in order:
 *  1. strip a leading "Introduction:" / "Introduction" / "Intro:" / "Intro"
 *     token (case-insensitive) and the whitespace after it
 *  2. strip a matching pair of quotes wrapping the whole text
 *  3. strip quotes wrapping single lines, then short standalone quoted runs
 *  4. turn standalone "---" divider lines into blank lines
 *  5. make sure a blank line follows every line ending in ':'
 *
 * Total over all input. Single pass only: normalize(normalize(x)) is not
 * guaranteed to equal normalize(x); rule 5 adds a newline after a trailing
 * title on every run.
 */
std::string normalize(std::string_view raw);

// Individual passes, exposed for testing
void strip_intro_prefix(std::string* text);
void strip_outer_quotes(std::string* text);
void strip_line_quotes(std::string* text);
void strip_standalone_quoted(std::string* text, char quote);
void collapse_dividers(std::string* text);
void space_section_titles(std::string* text);

} // namespace prose

#endif // PROSE_NORMALIZE_HPP
