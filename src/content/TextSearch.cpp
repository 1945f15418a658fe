#include "TextSearch.h"

#include <utility>

namespace quire {

namespace {
bool isContinuation(const unsigned char c) { return (c & 0xC0) == 0x80; }

bool isSpace(const char c) { return c == ' ' || c == '\n' || c == '\t' || c == '\r' || c == '\f' || c == '\v'; }

// Moves forward to the next character start
size_t alignForward(const std::string& text, size_t pos, const size_t limit) {
  while (pos < limit && isContinuation(static_cast<unsigned char>(text[pos]))) pos++;
  return pos;
}

// Moves back so text[.., pos) ends on a whole character
size_t alignBackward(const std::string& text, size_t pos, const size_t floor) {
  while (pos > floor && pos < text.size() && isContinuation(static_cast<unsigned char>(text[pos]))) pos--;
  return pos;
}
}  // namespace

std::string TextSearch::foldAscii(const std::string& text) {
  std::string folded(text);
  for (char& c : folded) {
    if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
  }
  return folded;
}

bool TextSearch::findAll(const std::string& text, const std::string& query, const bool caseSensitive,
                         const size_t contextLength, const size_t limit, const int pageNumber,
                         const int chapterNumber, std::vector<SearchResult>* out) {
  if (query.empty() || text.size() < query.size()) return true;

  const std::string haystack = caseSensitive ? text : foldAscii(text);
  const std::string needle = caseSensitive ? query : foldAscii(query);

  size_t pos = haystack.find(needle);
  while (pos != std::string::npos) {
    if (limit > 0 && out->size() >= limit) return false;

    const size_t end = pos + needle.size();
    const size_t beforeStart = alignForward(text, pos > contextLength ? pos - contextLength : 0, pos);
    const size_t afterLimit = end + contextLength < text.size() ? end + contextLength : text.size();
    const size_t afterEnd = alignBackward(text, afterLimit, end);

    SearchResult r;
    r.pageNumber = pageNumber;
    r.chapterNumber = chapterNumber;
    r.characterPosition = pos;
    r.snippet = text.substr(pos, needle.size());
    r.contextBefore = text.substr(beforeStart, pos - beforeStart);
    r.contextAfter = text.substr(end, afterEnd - end);
    out->push_back(std::move(r));

    pos = haystack.find(needle, end);
  }
  return limit == 0 || out->size() < limit;
}

size_t TextSearch::countWords(const std::string& text) {
  size_t words = 0;
  bool inWord = false;
  for (const char c : text) {
    if (isSpace(c)) {
      inWord = false;
    } else if (!inWord) {
      inWord = true;
      words++;
    }
  }
  return words;
}

}  // namespace quire
