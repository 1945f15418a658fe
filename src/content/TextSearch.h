#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "ReaderEntities.h"

namespace quire {

namespace TextSearch {

// ASCII letters lower-cased, every other byte untouched, so offsets are preserved
std::string foldAscii(const std::string& text);

// Appends the non-overlapping matches of `query` in `text`, scanning left to right.
// Context is cut to at most contextLength bytes per side and never splits a UTF-8
// sequence. Stops once `out` holds `limit` results (0 = unlimited).
// Returns false if the limit was reached.
bool findAll(const std::string& text, const std::string& query, bool caseSensitive, size_t contextLength,
             size_t limit, int pageNumber, int chapterNumber, std::vector<SearchResult>* out);

// Whitespace separated words
size_t countWords(const std::string& text);

}  // namespace TextSearch

}  // namespace quire
