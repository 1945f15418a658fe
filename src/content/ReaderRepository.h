#pragma once

#include <memory>
#include <new>
#include <stdexcept>
#include <string>
#include <vector>

#include "ReaderService.h"

namespace quire {

// Single entry point for reading. Holds at most one open book, routed to the
// service of its format:
//
//   Idle --openBook ok--> Open(service, format) --closeBook ok--> Idle
//
// While Idle every book operation fails with BookOpenFailure("No book is
// currently open") and the streams are closed and empty.
class ReaderRepository {
 public:
  ReaderRepository(std::unique_ptr<ReaderService> pdfService, std::unique_ptr<ReaderService> epubService);
  ~ReaderRepository();

  ReaderRepository(const ReaderRepository&) = delete;
  ReaderRepository& operator=(const ReaderRepository&) = delete;

  Result<BookContent> openBook(const std::string& path, BookFormat format);
  Result<bool> closeBook();

  Result<ReadingPosition> getCurrentPosition();
  Result<void> updatePosition(const ReadingPosition& position);
  Result<ReaderSettings> getSettings();
  Result<void> updateSettings(const ReaderSettings& settings);

  Result<ReadingPosition> goToPage(int page);
  Result<ReadingPosition> nextPage();
  Result<ReadingPosition> previousPage();

  Result<std::vector<SearchResult>> searchText(const std::string& query, bool caseSensitive = false);
  Result<std::string> getPageText(int page);
  Result<std::vector<TableOfContentsEntry>> getTableOfContents();
  Result<BookMetadata> getBookMetadata();

  Result<double> calculateProgress(const ReadingPosition& position);
  Result<int> estimateRemainingTime(const ReadingPosition& position, int wordsPerMinute = Defaults::WordsPerMinute);

  Result<void> saveProgress(const std::string& bookId, const ReadingPosition& position);
  Result<ReadingPosition> loadProgress(const std::string& bookId);

  // PDF probe first, then EPUB. Never changes state.
  Result<bool> isFormatSupported(const std::string& path);
  // Extension based, never touches the file system
  Result<BookFormat> detectFormat(const std::string& path) const;
  std::vector<BookFormat> getSupportedFormats() const { return {BookFormat::Pdf, BookFormat::Epub}; }

  // False while Idle
  bool currentFormat(BookFormat* out) const;
  bool hasActiveBook() const { return active_ != nullptr; }

  Stream<ReadingPosition> positionStream();
  Stream<ReaderSettings> settingsStream();
  Stream<double> loadingProgressStream();

  void dispose();

 private:
  std::unique_ptr<ReaderService> pdfService_;
  std::unique_ptr<ReaderService> epubService_;
  ReaderService* active_ = nullptr;
  BookFormat activeFormat_ = BookFormat::Txt;

  ReaderService* serviceForFormat(BookFormat format) const;

  // Runs `fn` against the active service, or fails while Idle. Exceptions that
  // escape a service become MemoryFailure or ReaderFileFailure.
  template <typename T, typename Fn>
  Result<T> guarded(const char* operation, Fn&& fn) {
    if (!active_) return Err<T>(ReaderFailure::noBookOpen());
    return shielded<T>(operation, fn);
  }

  template <typename T, typename Fn>
  Result<T> shielded(const char* operation, Fn&& fn) {
    try {
      return fn();
    } catch (const std::bad_alloc&) {
      return Err<T>(ReaderFailure::memoryLimitExceeded(operation, -1, -1));
    } catch (const std::exception& e) {
      return Err<T>(ReaderFailure::unexpected(e.what()));
    }
  }
};

}  // namespace quire
