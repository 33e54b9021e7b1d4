#pragma once
#ifndef PROSE_PROSE_HPP
#define PROSE_PROSE_HPP

#include "document.hpp"
#include <string>

namespace prose {

// Formatter configuration
struct FormatOptions {
    StyleToken base_style;          // copied onto every leaf span
    size_t max_input_bytes = 0;     // 0 = unlimited; longer input is cut
                                    // on a UTF-8 boundary
};

/**
 * Format model-generated prose into a Document.
 *
 * Runs the normalizer once, then the block and inline parsers. Total: any
 * input yields a Document, never an error. A null or empty `raw_text`
 * yields an empty Document. Safe to call from several threads at once.
 */
Document format(const char* raw_text, const StyleToken& base_style = StyleToken());
Document format(const std::string& raw_text, const FormatOptions& options = FormatOptions());

} // namespace prose

#endif // PROSE_PROSE_HPP
