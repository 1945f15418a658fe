#include "EpubReaderService.h"

#include <Logging.h>

#define TAG "EPUB_SVC"

namespace quire {

namespace {
// First TOC title pointing at a 1-based page, depth first
const TableOfContentsEntry* findEntryForPage(const std::vector<TableOfContentsEntry>& entries, const int page) {
  for (const auto& entry : entries) {
    if (entry.page == page) return &entry;
    const TableOfContentsEntry* child = findEntryForPage(entry.children, page);
    if (child) return child;
  }
  return nullptr;
}
}  // namespace

ReaderFailure EpubReaderService::parseFailure(const std::string& path, const DecodeStatus& status) const {
  return ReaderFailure::epubParsingFailed(path, status.detail);
}

bool EpubReaderService::validatePosition(const ReadingPosition& position, ReaderFailure* failure) const {
  if (position.chapter == position.page - 1) return true;

  *failure = ReaderFailure::pageOutOfRange(position.page, totalPages(), Direction::Update);
  failure->message = "Chapter " + std::to_string(position.chapter) + " does not match page " +
                     std::to_string(position.page);
  return false;
}

void EpubReaderService::fallbackTableOfContents(std::vector<TableOfContentsEntry>* toc) const {
  LOG_DBG(TAG, "No navigation document, listing %d chapters", totalPages());
  toc->reserve(totalPages());
  for (int page = 1; page <= totalPages(); page++) {
    TableOfContentsEntry entry;
    entry.title = "Chapter " + std::to_string(page);
    entry.page = page;
    entry.level = 0;
    toc->push_back(std::move(entry));
  }
}

Result<ReadingPosition> EpubReaderService::goToChapter(const int chapterIndex) {
  return moveTo(chapterIndex + 1, Direction::GoTo);
}

Result<std::vector<ChapterInfo>> EpubReaderService::getChapters() {
  if (!isOpen()) return Err<std::vector<ChapterInfo>>(ReaderFailure::noBookOpen());

  std::vector<ChapterInfo> chapters;
  chapters.reserve(totalPages());
  for (int i = 0; i < totalPages(); i++) {
    ChapterInfo info;
    info.index = i;
    const TableOfContentsEntry* entry = findEntryForPage(content().tableOfContents, i + 1);
    info.title = entry ? entry->title : "Chapter " + std::to_string(i + 1);
    info.href = decoder().unitHref(i);
    chapters.push_back(std::move(info));
  }
  return Ok(std::move(chapters));
}

}  // namespace quire
