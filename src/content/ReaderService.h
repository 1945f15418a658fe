#pragma once

#include <string>
#include <vector>

#include "../core/Channel.h"
#include "../core/Result.h"
#include "../core/Types.h"
#include "ReaderEntities.h"

namespace quire {

// Reading capability for one document format. At most one book is open per
// service. Every operation other than isFormatSupported() fails with
// BookOpenFailure while nothing is open.
class ReaderService {
 public:
  virtual ~ReaderService() = default;

  virtual BookFormat format() const = 0;

  virtual Result<BookContent> openBook(const std::string& path, BookFormat format) = 0;
  // Succeeds when nothing is open
  virtual Result<bool> closeBook() = 0;
  virtual bool isOpen() const = 0;

  virtual Result<ReadingPosition> getCurrentPosition() = 0;
  virtual Result<void> updatePosition(const ReadingPosition& position) = 0;

  virtual Result<ReaderSettings> getSettings() = 0;
  virtual Result<void> updateSettings(const ReaderSettings& settings) = 0;

  // Pages are 1-based. For EPUB a page is a chapter.
  virtual Result<ReadingPosition> goToPage(int page) = 0;
  virtual Result<ReadingPosition> nextPage() = 0;
  virtual Result<ReadingPosition> previousPage() = 0;

  virtual Result<std::vector<SearchResult>> searchText(const std::string& query, bool caseSensitive) = 0;
  virtual Result<std::string> getPageText(int page) = 0;
  virtual Result<std::vector<TableOfContentsEntry>> getTableOfContents() = 0;
  virtual Result<BookMetadata> getBookMetadata() = 0;

  // page / totalPages, clamped to [0, 1]
  virtual Result<double> calculateProgress(const ReadingPosition& position) = 0;
  // Whole minutes for the units after position.page
  virtual Result<int> estimateRemainingTime(const ReadingPosition& position, int wordsPerMinute) = 0;

  // Header sniff of an arbitrary file. Doesn't need an open book.
  virtual Result<bool> isFormatSupported(const std::string& path) = 0;

  virtual Result<void> saveProgress(const std::string& bookId, const ReadingPosition& position) = 0;
  virtual Result<ReadingPosition> loadProgress(const std::string& bookId) = 0;

  // Streams of the current session; closed and empty while nothing is open
  virtual Stream<ReadingPosition> positionStream() = 0;
  virtual Stream<ReaderSettings> settingsStream() = 0;
  virtual Stream<double> loadingProgressStream() = 0;

  // Closes the book and every channel. Final.
  virtual void dispose() = 0;
};

}  // namespace quire
