#include "inline_parser.hpp"
#include "../lib/log.h"

namespace prose {

std::vector<Fragment> pair_delimiters(std::string_view text, std::string_view delim) {
    std::vector<Fragment> out;
    size_t cursor = 0;
    size_t open = std::string_view::npos;

    while (cursor < text.size()) {
        size_t next = text.find(delim, cursor);
        if (next == std::string_view::npos) {
            // trailing text; after an unmatched opener its delimiter stays dropped
            out.push_back(Fragment{false, std::string(text.substr(cursor))});
            break;
        }

        if (open == std::string_view::npos) {
            if (next > cursor) {
                out.push_back(Fragment{false, std::string(text.substr(cursor, next - cursor))});
            }
            open = next;
        } else {
            size_t content_start = open + delim.size();
            if (next > content_start) {
                out.push_back(Fragment{true, std::string(text.substr(content_start, next - content_start))});
            }
            open = std::string_view::npos;
        }
        cursor = next + delim.size();
    }

    if (open != std::string_view::npos) {
        log_debug("inline: unmatched '%.*s' at offset %zu dropped",
                  (int)delim.size(), delim.data(), open);
    }
    return out;
}

InlineSequence inline_parse(std::string_view line, const StyleToken& style) {
    InlineSequence spans;

    for (Fragment& bold_frag : pair_delimiters(line, "**")) {
        if (bold_frag.delimited) {
            spans.push_back(Span::makeBold({ Span::makeText(bold_frag.text, style) }));
            continue;
        }
        for (Fragment& frag : pair_delimiters(bold_frag.text, "*")) {
            spans.push_back(frag.delimited ? Span::makeItalic(frag.text, style)
                                           : Span::makeText(frag.text, style));
        }
    }
    return spans;
}

} // namespace prose
