#pragma once
#ifndef PROSE_DOCUMENT_HPP
#define PROSE_DOCUMENT_HPP

#include <string>
#include <vector>

namespace prose {

// Opaque style/theme token supplied by the caller. The formatter never
// interprets it; it is copied onto every leaf Text/Italic span so a
// renderer can apply default typography.
typedef std::string StyleToken;

// Inline span kinds
enum class SpanKind {
    TEXT,       // literal content
    BOLD,       // **...**, children are TEXT spans only
    ITALIC      // *...*, always a leaf
};

// Inline styled fragment. A closed tagged value: `text` is set for TEXT
// and ITALIC, `children` for BOLD.
struct Span {
    SpanKind kind = SpanKind::TEXT;
    std::string text;
    std::vector<Span> children;
    StyleToken style;

    static Span makeText(const std::string& text, const StyleToken& style);
    static Span makeItalic(const std::string& text, const StyleToken& style);
    static Span makeBold(std::vector<Span> children);

    bool operator==(const Span& other) const;
    bool operator!=(const Span& other) const { return !(*this == other); }
};

typedef std::vector<Span> InlineSequence;

enum class BlockKind {
    HEADING,
    SECTION_HEADER,
    PARAGRAPH,
    LIST,
    SPACER
};

enum class ListKind {
    BULLET,
    ORDERED
};

struct ListItem {
    std::string number;     // ordinal as written in the source, empty for bullets
    InlineSequence spans;

    bool operator==(const ListItem& other) const {
        return number == other.number && spans == other.spans;
    }
};

// Top-level structural unit. Fields not used by a kind stay at their
// defaults:
//   HEADING         level, spans
//   SECTION_HEADER  spans
//   PARAGRAPH       spans, indented
//   LIST            list_kind, items
//   SPACER          -
struct Block {
    BlockKind kind;
    int level;
    InlineSequence spans;
    bool indented;
    ListKind list_kind;
    std::vector<ListItem> items;

    static Block makeHeading(int level, InlineSequence text);
    static Block makeSectionHeader(InlineSequence text);
    static Block makeParagraph(InlineSequence spans, bool indented);
    static Block makeList(ListKind kind, std::vector<ListItem> items);
    static Block makeSpacer();

    bool operator==(const Block& other) const;
    bool operator!=(const Block& other) const { return !(*this == other); }

private:
    explicit Block(BlockKind k)
        : kind(k), level(0), indented(false), list_kind(ListKind::BULLET) {}
};

typedef std::vector<Block> Document;

// Concatenated visible text of a span sequence, styles ignored
std::string plain_text(const InlineSequence& spans);

const char* block_kind_name(BlockKind kind);
const char* span_kind_name(SpanKind kind);
const char* list_kind_name(ListKind kind);

} // namespace prose

#endif // PROSE_DOCUMENT_HPP
