#include "block_parser.hpp"
#include "inline_parser.hpp"
#include "utf_string.hpp"
#include "../lib/log.h"

#include <re2/re2.h>
#include <utility>

namespace prose {

int heading_level(std::string_view line) {
    if (line.compare(0, 2, "# ") == 0) return 1;
    if (line.compare(0, 3, "## ") == 0) return 2;
    if (line.compare(0, 4, "### ") == 0) return 3;
    return 0;
}

bool is_section_header(std::string_view line) {
    if (line.empty() || line.back() != ':') return false;
    if (line.find("://") != std::string_view::npos) return false;
    return heading_level(line) == 0;
}

std::string heading_text(std::string_view line, int level) {
    std::string_view text = line.substr((size_t)level + 1);
    // "# **Title**" is a plain heading, not a bold one
    if (text.size() >= 4 && text.compare(0, 2, "**") == 0 &&
        text.compare(text.size() - 2, 2, "**") == 0) {
        text = text.substr(2, text.size() - 4);
    }
    return std::string(text);
}

LineInfo classify_line(std::string_view line) {
    static const RE2 bullet_re("[*\\-•]\\s");
    static const RE2 ordered_re("(\\d+)\\.\\s");

    LineInfo info{LineType::PARAGRAPH, 0, std::string(), line};
    if (line.empty()) {
        info.type = LineType::BLANK;
        return info;
    }

    // section headers win over list items: "1. Overview:" is a header
    if (is_section_header(line)) {
        info.type = LineType::SECTION_HEADER;
        return info;
    }

    int level = heading_level(line);
    if (level > 0) {
        info.type = LineType::HEADING;
        info.level = level;
        info.body = line.substr((size_t)level + 1);
        return info;
    }

    re2::StringPiece input(line.data(), line.size());
    if (RE2::Consume(&input, bullet_re) && !input.empty()) {
        info.type = LineType::BULLET_ITEM;
        info.body = std::string_view(input.data(), input.size());
        return info;
    }

    input = re2::StringPiece(line.data(), line.size());
    std::string number;
    if (RE2::Consume(&input, ordered_re, &number) && !input.empty()) {
        info.type = LineType::ORDERED_ITEM;
        info.number = number;
        info.body = std::string_view(input.data(), input.size());
        return info;
    }

    return info;
}

// Header text is shown as written: no bold/italic pairing
static InlineSequence header_spans(const std::string& text, const StyleToken& style) {
    InlineSequence spans;
    if (!text.empty()) spans.push_back(Span::makeText(text, style));
    return spans;
}

Document parse_blocks(std::string_view normalized, const StyleToken& style) {
    Document doc;

    // per-call scanning state
    bool list_open = false;
    ListKind list_kind = ListKind::BULLET;
    std::vector<ListItem> list_items;
    bool last_line_was_header = false;
    // Sticky: once a section header is seen, every later paragraph in the
    // document is indented, related to that section or not (likely a quirk).
    bool in_section = false;

    auto flush_list = [&]() {
        if (list_open && !list_items.empty()) {
            doc.push_back(Block::makeList(list_kind, std::move(list_items)));
        }
        list_items.clear();
        list_open = false;
    };

    size_t line_count = 0;
    size_t start = 0;
    while (true) {
        size_t end = normalized.find('\n', start);
        bool last = end == std::string_view::npos;
        if (last) end = normalized.size();
        line_count++;

        std::string line = utf8_trim(normalized.substr(start, end - start));
        LineInfo info = classify_line(line);

        switch (info.type) {
            case LineType::BLANK:
                flush_list();
                if (last_line_was_header) {
                    // no double gap directly under a header
                    last_line_was_header = false;
                } else {
                    doc.push_back(Block::makeSpacer());
                }
                break;

            case LineType::SECTION_HEADER:
                flush_list();
                doc.push_back(Block::makeSectionHeader(header_spans(line, style)));
                last_line_was_header = true;
                in_section = true;
                break;

            case LineType::HEADING:
                flush_list();
                doc.push_back(Block::makeHeading(info.level,
                    header_spans(heading_text(line, info.level), style)));
                last_line_was_header = true;
                break;

            case LineType::BULLET_ITEM:
            case LineType::ORDERED_ITEM: {
                ListKind kind = info.type == LineType::ORDERED_ITEM ? ListKind::ORDERED : ListKind::BULLET;
                if (!list_open || list_kind != kind) {
                    flush_list();
                    list_open = true;
                    list_kind = kind;
                }
                list_items.push_back(ListItem{info.number, inline_parse(info.body, style)});
                last_line_was_header = false;
                break;
            }

            case LineType::PARAGRAPH:
                flush_list();
                doc.push_back(Block::makeParagraph(inline_parse(line, style), in_section));
                last_line_was_header = false;
                break;
        }

        if (last) break;
        start = end + 1;
    }
    flush_list();

    log_debug("parse_blocks: %zu lines -> %zu blocks", line_count, doc.size());
    return doc;
}

} // namespace prose
