#include "document.hpp"
#include <utility>

namespace prose {

Span Span::makeText(const std::string& text, const StyleToken& style) {
    Span span;
    span.kind = SpanKind::TEXT;
    span.text = text;
    span.style = style;
    return span;
}

Span Span::makeItalic(const std::string& text, const StyleToken& style) {
    Span span;
    span.kind = SpanKind::ITALIC;
    span.text = text;
    span.style = style;
    return span;
}

Span Span::makeBold(std::vector<Span> children) {
    Span span;
    span.kind = SpanKind::BOLD;
    span.children = std::move(children);
    return span;
}

bool Span::operator==(const Span& other) const {
    return kind == other.kind && text == other.text &&
           style == other.style && children == other.children;
}

Block Block::makeHeading(int level, InlineSequence text) {
    Block block(BlockKind::HEADING);
    block.level = level;
    block.spans = std::move(text);
    return block;
}

Block Block::makeSectionHeader(InlineSequence text) {
    Block block(BlockKind::SECTION_HEADER);
    block.spans = std::move(text);
    return block;
}

Block Block::makeParagraph(InlineSequence spans, bool indented) {
    Block block(BlockKind::PARAGRAPH);
    block.spans = std::move(spans);
    block.indented = indented;
    return block;
}

Block Block::makeList(ListKind kind, std::vector<ListItem> items) {
    Block block(BlockKind::LIST);
    block.list_kind = kind;
    block.items = std::move(items);
    return block;
}

Block Block::makeSpacer() {
    return Block(BlockKind::SPACER);
}

bool Block::operator==(const Block& other) const {
    if (kind != other.kind) return false;
    switch (kind) {
        case BlockKind::HEADING:
            return level == other.level && spans == other.spans;
        case BlockKind::SECTION_HEADER:
            return spans == other.spans;
        case BlockKind::PARAGRAPH:
            return indented == other.indented && spans == other.spans;
        case BlockKind::LIST:
            return list_kind == other.list_kind && items == other.items;
        case BlockKind::SPACER:
            return true;
    }
    return false;
}

std::string plain_text(const InlineSequence& spans) {
    std::string out;
    for (const Span& span : spans) {
        if (span.kind == SpanKind::BOLD) {
            out += plain_text(span.children);
        } else {
            out += span.text;
        }
    }
    return out;
}

const char* block_kind_name(BlockKind kind) {
    switch (kind) {
        case BlockKind::HEADING:        return "heading";
        case BlockKind::SECTION_HEADER: return "section_header";
        case BlockKind::PARAGRAPH:      return "paragraph";
        case BlockKind::LIST:           return "list";
        case BlockKind::SPACER:         return "spacer";
    }
    return "unknown";
}

const char* span_kind_name(SpanKind kind) {
    switch (kind) {
        case SpanKind::TEXT:   return "text";
        case SpanKind::BOLD:   return "bold";
        case SpanKind::ITALIC: return "italic";
    }
    return "unknown";
}

const char* list_kind_name(ListKind kind) {
    return kind == ListKind::ORDERED ? "ordered" : "bullet";
}

} // namespace prose
