#include "normalize.hpp"
#include "utf_string.hpp"
#include "../lib/log.h"

#include <re2/re2.h>
#include <utility>

namespace prose {

// Global replace with a pre-compiled pattern; a pattern that failed to
// compile leaves the text untouched.
static int replace_all(std::string* text, const RE2& re, const char* rewrite) {
    if (!re.ok()) {
        log_error("normalize: bad pattern '%s': %s", re.pattern().c_str(), re.error().c_str());
        return 0;
    }
    return RE2::GlobalReplace(text, re, rewrite);
}

static bool replace_first(std::string* text, const RE2& re, const char* rewrite) {
    if (!re.ok()) {
        log_error("normalize: bad pattern '%s': %s", re.pattern().c_str(), re.error().c_str());
        return false;
    }
    return RE2::Replace(text, re, rewrite);
}

void strip_intro_prefix(std::string* text) {
    // the token must end at a word boundary so "Introducing ..." survives
    static const RE2 intro_re("(?i)^(?:introduction|intro)(?::|\\b)\\s*");
    replace_first(text, intro_re, "");
}

void strip_outer_quotes(std::string* text) {
    std::string trimmed = utf8_trim(*text);
    if (trimmed.size() < 3) return;
    char first = trimmed.front();
    if ((first == '"' || first == '\'') && trimmed.back() == first) {
        *text = trimmed.substr(1, trimmed.size() - 2);
    }
}

void strip_line_quotes(std::string* text) {
    static const RE2 double_wrapped_re("(?m)^\"(.+)\"$");
    static const RE2 double_leading_re("(?m)^\"(.+)$");
    static const RE2 double_trailing_re("(?m)^(.+)\"$");
    static const RE2 single_wrapped_re("(?m)^'(.+)'$");

    replace_all(text, double_wrapped_re, "\\1");
    replace_all(text, double_leading_re, "\\1");
    replace_all(text, double_trailing_re, "\\1");
    replace_all(text, single_wrapped_re, "\\1");

    strip_standalone_quoted(text, '"');
    strip_standalone_quoted(text, '\'');
}

// Remove the quotes of a run that opens at the start of the text or of a
// line, holds no quote of the same kind, and closes at a line end. The run
// may span lines.
void strip_standalone_quoted(std::string* text, char quote) {
    const std::string& src = *text;
    const char opener[3] = { '\n', quote, '\0' };
    std::string out;
    size_t copied = 0;
    size_t pos = 0;
    bool changed = false;

    while (pos < src.size()) {
        size_t match_start;
        size_t open;
        if (pos == 0 && src[0] == quote) {
            match_start = 0;
            open = 0;
        } else {
            match_start = src.find(opener, pos);
            if (match_start == std::string::npos) break;
            open = match_start + 1;
        }

        size_t close = src.find(quote, open + 1);
        if (close == std::string::npos) break;  // no later candidate can close either

        bool has_content = close > open + 1;
        bool at_line_end = close + 1 == src.size() || src[close + 1] == '\n';
        if (!has_content || !at_line_end) {
            pos = match_start + 1;
            continue;
        }

        out.append(src, copied, open - copied);
        out.append(src, open + 1, close - open - 1);
        copied = close + 1;
        pos = close + 1;  // the newline after the closer may open the next run
        changed = true;
    }

    if (!changed) return;
    out.append(src, copied, std::string::npos);
    *text = std::move(out);
}

void collapse_dividers(std::string* text) {
    static const RE2 between_re("\n---\n");
    static const RE2 leading_re("^---\n");
    static const RE2 trailing_re("\n---$");
    static const RE2 padded_re("\n\\s*---\\s*\n");

    replace_all(text, between_re, "\n\n");
    replace_first(text, leading_re, "\n");
    replace_first(text, trailing_re, "\n");
    if (*text == "---") text->clear();
    replace_all(text, padded_re, "\n\n");

    // any "---" line still enclosed by newlines; each newline may serve
    // as the closer of one divider and the opener of the next
    size_t pos = 0;
    size_t found;
    while ((found = text->find("\n---\n", pos)) != std::string::npos) {
        text->erase(found + 1, 3);
        pos = found + 1;
    }
}

// A title line gets a blank line after it unless one already follows. The
// empty remainder after a final newline is not a blank line, so a trailing
// title gains one more newline on every run.
void space_section_titles(std::string* text) {
    std::string out;
    out.reserve(text->size() + 16);
    size_t start = 0;
    while (start <= text->size()) {
        size_t end = text->find('\n', start);
        bool last = end == std::string::npos;
        if (last) end = text->size();

        std::string_view line(text->data() + start, end - start);
        out.append(line);
        if (!last) out.push_back('\n');

        if (!line.empty() && line.back() == ':') {
            bool blank_follows = false;
            if (!last) {
                size_t next_end = text->find('\n', end + 1);
                if (next_end == std::string::npos) next_end = text->size();
                blank_follows = next_end < text->size() &&
                    utf8_trim(std::string_view(text->data() + end + 1, next_end - end - 1)).empty();
            }
            if (!blank_follows) out.push_back('\n');
        }
        if (last) break;
        start = end + 1;
    }
    *text = std::move(out);
}

std::string normalize(std::string_view raw) {
    std::string text(raw);

    strip_intro_prefix(&text);
    strip_outer_quotes(&text);
    strip_line_quotes(&text);
    collapse_dividers(&text);
    space_section_titles(&text);

    log_debug("normalize: %zu -> %zu bytes", raw.size(), text.size());
    return text;
}

} // namespace prose
