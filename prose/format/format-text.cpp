#include "format.hpp"

namespace prose {

static const char* BULLET_MARKER = "\xE2\x80\xA2 ";   // "• "
static const char* ITEM_INDENT = "  ";

std::string format_document_text(const Document& doc) {
    std::string out;
    for (const Block& block : doc) {
        switch (block.kind) {
            case BlockKind::HEADING:
            case BlockKind::SECTION_HEADER:
                out.append(plain_text(block.spans));
                out.push_back('\n');
                break;
            case BlockKind::PARAGRAPH:
                if (block.indented) out.append(ITEM_INDENT);
                out.append(plain_text(block.spans));
                out.push_back('\n');
                break;
            case BlockKind::LIST:
                for (const ListItem& item : block.items) {
                    out.append(ITEM_INDENT);
                    if (block.list_kind == ListKind::ORDERED) {
                        out.append(item.number);
                        out.append(". ");
                    } else {
                        out.append(BULLET_MARKER);
                    }
                    out.append(plain_text(item.spans));
                    out.push_back('\n');
                }
                break;
            case BlockKind::SPACER:
                out.push_back('\n');
                break;
        }
    }
    return out;
}

} // namespace prose
