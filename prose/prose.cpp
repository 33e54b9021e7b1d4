#include "prose.hpp"
#include "normalize.hpp"
#include "block_parser.hpp"
#include "utf_string.hpp"
#include "../lib/log.h"

namespace prose {

Document format(const char* raw_text, const StyleToken& base_style) {
    if (!raw_text || !*raw_text) return Document();
    FormatOptions options;
    options.base_style = base_style;
    return format(std::string(raw_text), options);
}

Document format(const std::string& raw_text, const FormatOptions& options) {
    if (raw_text.empty()) return Document();

    std::string_view input(raw_text);
    std::string truncated;
    if (options.max_input_bytes > 0 && raw_text.size() > options.max_input_bytes) {
        log_warn("format: input of %zu bytes cut to %zu", raw_text.size(), options.max_input_bytes);
        truncated = utf8_truncate(raw_text, options.max_input_bytes);
        if (truncated.empty()) return Document();
        input = truncated;
    }
    return parse_blocks(normalize(input), options.base_style);
}

} // namespace prose
