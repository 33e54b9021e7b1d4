#pragma once
#ifndef PROSE_FORMAT_HPP
#define PROSE_FORMAT_HPP

#include "../document.hpp"
#include <string>

namespace prose {

// JSON rendering of a document: an array with one object per block
std::string format_document_json(const Document& doc);

// Plain-text rendering: styles dropped, list markers and indentation kept
std::string format_document_text(const Document& doc);

// Escape a string for inclusion between JSON double quotes
void append_json_string(std::string* out, const std::string& text);

} // namespace prose

#endif // PROSE_FORMAT_HPP
