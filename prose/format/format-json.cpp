#include "format.hpp"
#include <stdio.h>
#include <utf8proc.h>

namespace prose {

// Forward declarations
static void format_spans_json(std::string* out, const InlineSequence& spans);

void append_json_string(std::string* out, const std::string& text) {
    const utf8proc_uint8_t* bytes = (const utf8proc_uint8_t*)text.data();
    utf8proc_ssize_t len = (utf8proc_ssize_t)text.size();
    utf8proc_ssize_t pos = 0;

    out->push_back('"');
    while (pos < len) {
        utf8proc_int32_t codepoint = -1;
        utf8proc_ssize_t n = utf8proc_iterate(bytes + pos, len - pos, &codepoint);
        if (n <= 0) {
            // malformed byte becomes U+FFFD
            out->append("\\ufffd");
            pos += 1;
            continue;
        }
        if (n > 1) {
            out->append(text, (size_t)pos, (size_t)n);   // valid UTF-8 passes through
            pos += n;
            continue;
        }
        char c = (char)codepoint;
        switch (c) {
            case '"':  out->append("\\\""); break;
            case '\\': out->append("\\\\"); break;
            case '\n': out->append("\\n"); break;
            case '\r': out->append("\\r"); break;
            case '\t': out->append("\\t"); break;
            case '\b': out->append("\\b"); break;
            case '\f': out->append("\\f"); break;
            default:
                if ((unsigned char)c < 0x20) {
                    char esc[8];
                    snprintf(esc, sizeof(esc), "\\u%04x", (unsigned char)c);
                    out->append(esc);
                } else {
                    out->push_back(c);
                }
        }
        pos += 1;
    }
    out->push_back('"');
}

static void format_span_json(std::string* out, const Span& span) {
    out->append("{\"type\":\"");
    out->append(span_kind_name(span.kind));
    out->append("\"");
    if (span.kind == SpanKind::BOLD) {
        out->append(",\"spans\":");
        format_spans_json(out, span.children);
    } else {
        out->append(",\"text\":");
        append_json_string(out, span.text);
        out->append(",\"style\":");
        append_json_string(out, span.style);
    }
    out->push_back('}');
}

static void format_spans_json(std::string* out, const InlineSequence& spans) {
    out->push_back('[');
    for (size_t i = 0; i < spans.size(); i++) {
        if (i > 0) out->push_back(',');
        format_span_json(out, spans[i]);
    }
    out->push_back(']');
}

static void format_block_json(std::string* out, const Block& block) {
    out->append("{\"type\":\"");
    out->append(block_kind_name(block.kind));
    out->append("\"");

    switch (block.kind) {
        case BlockKind::HEADING:
            out->append(",\"level\":");
            out->append(std::to_string(block.level));
            out->append(",\"spans\":");
            format_spans_json(out, block.spans);
            break;
        case BlockKind::SECTION_HEADER:
            out->append(",\"spans\":");
            format_spans_json(out, block.spans);
            break;
        case BlockKind::PARAGRAPH:
            out->append(block.indented ? ",\"indented\":true" : ",\"indented\":false");
            out->append(",\"spans\":");
            format_spans_json(out, block.spans);
            break;
        case BlockKind::LIST:
            out->append(",\"list\":\"");
            out->append(list_kind_name(block.list_kind));
            out->append("\",\"items\":[");
            for (size_t i = 0; i < block.items.size(); i++) {
                if (i > 0) out->push_back(',');
                out->append("{\"number\":");
                append_json_string(out, block.items[i].number);
                out->append(",\"spans\":");
                format_spans_json(out, block.items[i].spans);
                out->push_back('}');
            }
            out->push_back(']');
            break;
        case BlockKind::SPACER:
            break;
    }
    out->push_back('}');
}

std::string format_document_json(const Document& doc) {
    std::string out;
    if (doc.empty()) {
        out.append("[]\n");
        return out;
    }
    out.append("[\n");
    for (size_t i = 0; i < doc.size(); i++) {
        out.append("  ");
        format_block_json(&out, doc[i]);
        if (i + 1 < doc.size()) out.push_back(',');
        out.push_back('\n');
    }
    out.append("]\n");
    return out;
}

} // namespace prose
