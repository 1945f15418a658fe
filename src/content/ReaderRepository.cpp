#include "ReaderRepository.h"

#include <Logging.h>

#include "ContentTypes.h"
#include "FormatDetector.h"

#define TAG "REPO"

namespace quire {

ReaderRepository::ReaderRepository(std::unique_ptr<ReaderService> pdfService,
                                   std::unique_ptr<ReaderService> epubService)
    : pdfService_(std::move(pdfService)), epubService_(std::move(epubService)) {}

ReaderRepository::~ReaderRepository() { dispose(); }

ReaderService* ReaderRepository::serviceForFormat(const BookFormat format) const {
  switch (format) {
    case BookFormat::Pdf:
      return pdfService_.get();
    case BookFormat::Epub:
      return epubService_.get();
    case BookFormat::Txt:
      return nullptr;
  }
  return nullptr;
}

Result<BookContent> ReaderRepository::openBook(const std::string& path, const BookFormat format) {
  ReaderService* service = serviceForFormat(format);
  if (!service) {
    LOG_ERR(TAG, "No reader for %s", bookFormatDisplayName(format));
    return Err<BookContent>(ReaderFailure::unsupportedFormat(
        std::string("No service available for format: ") + bookFormatDisplayName(format), bookFormatExtension(format)));
  }

  return shielded<BookContent>("openBook", [&]() -> Result<BookContent> {
    if (active_) {
      const auto closed = active_->closeBook();
      if (!closed.ok()) {
        LOG_WRN(TAG, "Ignoring close failure of previous book: %s", closed.err.toString().c_str());
      }
    }
    active_ = nullptr;
    activeFormat_ = BookFormat::Txt;

    auto opened = service->openBook(path, format);
    if (!opened.ok()) {
      LOG_ERR(TAG, "Open failed: %s", opened.err.toString().c_str());
      return opened;
    }

    active_ = service;
    activeFormat_ = format;
    LOG_INF(TAG, "Active book: %s (%s)", path.c_str(), bookFormatDisplayName(format));
    return opened;
  });
}

Result<bool> ReaderRepository::closeBook() {
  if (!active_) return Ok(true);

  return shielded<bool>("closeBook", [this]() -> Result<bool> {
    auto closed = active_->closeBook();
    if (!closed.ok()) {
      // Stays Open; the service has already dropped its session, so a retry succeeds
      LOG_ERR(TAG, "Close failed: %s", closed.err.toString().c_str());
      return closed;
    }
    active_ = nullptr;
    activeFormat_ = BookFormat::Txt;
    LOG_INF(TAG, "Idle");
    return closed;
  });
}

Result<ReadingPosition> ReaderRepository::getCurrentPosition() {
  return guarded<ReadingPosition>("getCurrentPosition", [this]() { return active_->getCurrentPosition(); });
}

Result<void> ReaderRepository::updatePosition(const ReadingPosition& position) {
  return guarded<void>("updatePosition", [&]() { return active_->updatePosition(position); });
}

Result<ReaderSettings> ReaderRepository::getSettings() {
  return guarded<ReaderSettings>("getSettings", [this]() { return active_->getSettings(); });
}

Result<void> ReaderRepository::updateSettings(const ReaderSettings& settings) {
  return guarded<void>("updateSettings", [&]() { return active_->updateSettings(settings); });
}

Result<ReadingPosition> ReaderRepository::goToPage(const int page) {
  return guarded<ReadingPosition>("goToPage", [&]() { return active_->goToPage(page); });
}

Result<ReadingPosition> ReaderRepository::nextPage() {
  return guarded<ReadingPosition>("nextPage", [this]() { return active_->nextPage(); });
}

Result<ReadingPosition> ReaderRepository::previousPage() {
  return guarded<ReadingPosition>("previousPage", [this]() { return active_->previousPage(); });
}

Result<std::vector<SearchResult>> ReaderRepository::searchText(const std::string& query, const bool caseSensitive) {
  return guarded<std::vector<SearchResult>>("searchText",
                                            [&]() { return active_->searchText(query, caseSensitive); });
}

Result<std::string> ReaderRepository::getPageText(const int page) {
  return guarded<std::string>("getPageText", [&]() { return active_->getPageText(page); });
}

Result<std::vector<TableOfContentsEntry>> ReaderRepository::getTableOfContents() {
  return guarded<std::vector<TableOfContentsEntry>>("getTableOfContents",
                                                    [this]() { return active_->getTableOfContents(); });
}

Result<BookMetadata> ReaderRepository::getBookMetadata() {
  return guarded<BookMetadata>("getBookMetadata", [this]() { return active_->getBookMetadata(); });
}

Result<double> ReaderRepository::calculateProgress(const ReadingPosition& position) {
  return guarded<double>("calculateProgress", [&]() { return active_->calculateProgress(position); });
}

Result<int> ReaderRepository::estimateRemainingTime(const ReadingPosition& position, const int wordsPerMinute) {
  return guarded<int>("estimateRemainingTime",
                      [&]() { return active_->estimateRemainingTime(position, wordsPerMinute); });
}

Result<void> ReaderRepository::saveProgress(const std::string& bookId, const ReadingPosition& position) {
  return guarded<void>("saveProgress", [&]() { return active_->saveProgress(bookId, position); });
}

Result<ReadingPosition> ReaderRepository::loadProgress(const std::string& bookId) {
  return guarded<ReadingPosition>("loadProgress", [&]() { return active_->loadProgress(bookId); });
}

Result<bool> ReaderRepository::isFormatSupported(const std::string& path) {
  return shielded<bool>("isFormatSupported", [&]() -> Result<bool> {
    for (ReaderService* service : {pdfService_.get(), epubService_.get()}) {
      if (!service) continue;
      const auto probed = service->isFormatSupported(path);
      if (!probed.ok()) {
        LOG_DBG(TAG, "Probe failed for %s: %s", path.c_str(), probed.err.toString().c_str());
        continue;
      }
      if (probed.value) return Ok(true);
    }
    return Ok(false);
  });
}

Result<BookFormat> ReaderRepository::detectFormat(const std::string& path) const {
  return FormatDetector::detectFormat(path);
}

bool ReaderRepository::currentFormat(BookFormat* out) const {
  if (!active_) {
    *out = BookFormat::Txt;
    return false;
  }
  *out = activeFormat_;
  return true;
}

Stream<ReadingPosition> ReaderRepository::positionStream() {
  if (!active_) return Stream<ReadingPosition>::empty();
  return active_->positionStream();
}

Stream<ReaderSettings> ReaderRepository::settingsStream() {
  if (!active_) return Stream<ReaderSettings>::empty();
  return active_->settingsStream();
}

Stream<double> ReaderRepository::loadingProgressStream() {
  if (!active_) return Stream<double>::empty();
  return active_->loadingProgressStream();
}

void ReaderRepository::dispose() {
  if (pdfService_) pdfService_->dispose();
  if (epubService_) epubService_->dispose();
  active_ = nullptr;
  activeFormat_ = BookFormat::Txt;
}

}  // namespace quire
