#include "DecoderReaderService.h"

#include <FsHelpers.h>
#include <Logging.h>

#include <algorithm>
#include <chrono>
#include <utility>

#include "ContentTypes.h"
#include "TextSearch.h"

#define TAG "READER"

namespace quire {

namespace {
int64_t nowMs() {
  using namespace std::chrono;
  return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

// Turns the flat depth-tagged list into a tree. An entry deeper than its
// predecessor becomes that predecessor's child.
void nestEntries(const std::vector<DecodedTocEntry>& flat, size_t& i, const int depth, const int totalPages,
                 std::vector<TableOfContentsEntry>* out) {
  while (i < flat.size()) {
    const DecodedTocEntry& e = flat[i];
    if (e.depth < depth) return;

    if (e.depth > depth && !out->empty()) {
      nestEntries(flat, i, e.depth, totalPages, &out->back().children);
      continue;
    }

    TableOfContentsEntry entry;
    entry.title = e.title;
    entry.page = std::min(std::max(e.unit + 1, 1), totalPages);
    entry.level = depth;
    out->push_back(std::move(entry));
    i++;
  }
}
}  // namespace

DecoderReaderService::DecoderReaderService(const BookFormat format, std::unique_ptr<DocumentDecoder> decoder,
                                           EngineConfig config, std::shared_ptr<ProgressStore> store)
    : format_(format),
      decoder_(std::move(decoder)),
      config_(std::move(config)),
      store_(std::move(store)),
      settings_(config_.readerDefaults) {}

DecoderReaderService::~DecoderReaderService() {
  if (!decoder_ || !decoder_->isOpen()) return;
  const DecodeStatus status = decoder_->close();
  if (!status.ok()) LOG_WRN(TAG, "Close on teardown failed: %s", status.detail.c_str());
}

ReaderFailure DecoderReaderService::openFailure(const std::string& path, const DecodeStatus& status) const {
  switch (status.code) {
    case DecodeError::FileNotFound:
      return ReaderFailure::fileNotFound(path);
    case DecodeError::IoError:
      return ReaderFailure::bookOpen("Cannot read file", path, status.detail);
    case DecodeError::CorruptHeader:
      return ReaderFailure::bookOpen("Invalid file header", path, status.detail);
    case DecodeError::TooLarge:
      return ReaderFailure::memoryLimitExceeded("open", -1, static_cast<int64_t>(config_.maxEntryBytes));
    case DecodeError::Ok:
    case DecodeError::ParseFailed:
    case DecodeError::Encrypted:
    case DecodeError::NoContent:
    case DecodeError::OutOfRange:
      break;
  }
  return parseFailure(path, status);
}

void DecoderReaderService::indexUnits(Channel<double>& loading, int64_t* totalCharacters) {
  const int units = decoder_->unitCount();
  unitWords_.assign(units, 0);
  *totalCharacters = 0;

  std::string text;
  for (int i = 0; i < units; i++) {
    const DecodeStatus status = decoder_->unitText(i, &text);
    if (status.ok()) {
      unitWords_[i] = TextSearch::countWords(text);
      *totalCharacters += static_cast<int64_t>(text.size());
    } else {
      LOG_WRN(TAG, "Unit %d unreadable (%s), estimating", i, decodeErrorToString(status.code));
      unitWords_[i] = wordsForUnreadableUnit();
    }
    loading.emit(0.2 + 0.7 * static_cast<double>(i + 1) / units);
  }
}

std::vector<TableOfContentsEntry> DecoderReaderService::buildTableOfContents() {
  std::vector<DecodedTocEntry> flat;
  const DecodeStatus status = decoder_->tableOfContents(&flat);
  if (!status.ok()) {
    LOG_WRN(TAG, "No table of contents: %s", status.detail.c_str());
    flat.clear();
  }

  // Targets that don't resolve to a unit are dropped; their children move up
  flat.erase(std::remove_if(flat.begin(), flat.end(), [](const DecodedTocEntry& e) { return e.unit < 0; }),
             flat.end());

  std::vector<TableOfContentsEntry> toc;
  size_t i = 0;
  nestEntries(flat, i, 0, totalPages(), &toc);

  if (toc.empty()) fallbackTableOfContents(&toc);
  return toc;
}

Result<BookContent> DecoderReaderService::openBook(const std::string& path, const BookFormat format) {
  if (format != format_) {
    return Err<BookContent>(ReaderFailure::unsupportedFormat(
        std::string(bookFormatDisplayName(format_)) + " reader cannot open " + bookFormatDisplayName(format),
        bookFormatExtension(format)));
  }

  if (open_) {
    const auto closed = closeBook();
    if (!closed.ok()) LOG_WRN(TAG, "Previous book did not close cleanly: %s", closed.err.toString().c_str());
  }

  const unsigned long started = logMillis();
  auto loading = std::make_shared<Channel<double>>(true);
  loadingChannel_ = loading;
  loading->emit(0.05);

  const DecodeStatus status = decoder_->open(path);
  if (!status.ok()) {
    LOG_ERR(TAG, "Cannot open %s: %s (%s)", path.c_str(), decodeErrorToString(status.code), status.detail.c_str());
    loading->close();
    loadingChannel_.reset();
    return Err<BookContent>(openFailure(path, status));
  }
  loading->emit(0.2);

  if (decoder_->unitCount() <= 0) {
    LOG_ERR(TAG, "%s has no pages", path.c_str());
    abandonOpen(*loading);
    return Err<BookContent>(parseFailure(path, DecodeStatus::failure(DecodeError::NoContent, "document has no pages")));
  }

  // The decoder is open from here on; nothing below may leave it open on the way out
  try {
    BookContent content;
    content.documentId = makeDocumentId(format_, path);
    content.filePath = path;
    content.format = format_;
    content.totalPages = decoder_->unitCount();
    indexUnits(*loading, &content.totalCharacters);
    content.estimatedReadingTime = estimateReadingMinutes(content.totalCharacters);
    content_ = content;
    content_.tableOfContents = buildTableOfContents();

    const DecodedMetadata meta = decoder_->metadata();
    BookMetadata& bm = content_.metadata;
    bm.title = meta.title.empty() ? FsHelpers::fileName(path) : meta.title;
    bm.author = meta.author;
    bm.subject = meta.subject;
    bm.language = meta.language;
    bm.identifier = meta.identifier;
    bm.creator = meta.creator;
    bm.producer = meta.producer;
    bm.format = format_;
    bm.pageCount = content_.totalPages;
    bm.totalCharacters = content_.totalCharacters;
  } catch (...) {
    abandonOpen(*loading);
    throw;
  }

  position_ = ReadingPosition::initial();
  settings_ = config_.readerDefaults;
  positionChannel_ = std::make_shared<Channel<ReadingPosition>>();
  settingsChannel_ = std::make_shared<Channel<ReaderSettings>>();
  open_ = true;

  loading->emit(1.0);
  loading->close();

  LOG_INF(TAG, "Opened %s: %s, %d pages", bookFormatDisplayName(format_), path.c_str(), content_.totalPages);
  LOG_DBG(TAG, "Open took %lu ms", logMillis() - started);
  return Ok(content_);
}

void DecoderReaderService::abandonOpen(Channel<double>& loading) {
  const DecodeStatus closed = decoder_->close();
  if (!closed.ok()) LOG_WRN(TAG, "Close after failed open reported: %s", closed.detail.c_str());
  loading.close();
  loadingChannel_.reset();
  content_ = BookContent();
  unitWords_.clear();
}

void DecoderReaderService::resetSession() {
  open_ = false;
  if (positionChannel_) positionChannel_->close();
  if (settingsChannel_) settingsChannel_->close();
  if (loadingChannel_) loadingChannel_->close();
  positionChannel_.reset();
  settingsChannel_.reset();
  loadingChannel_.reset();

  content_ = BookContent();
  unitWords_.clear();
  position_ = ReadingPosition::initial();
  settings_ = config_.readerDefaults;
}

Result<bool> DecoderReaderService::closeBook() {
  if (!open_) return Ok(true);

  const std::string path = content_.filePath;
  const DecodeStatus status = decoder_->close();
  resetSession();

  if (!status.ok()) {
    LOG_ERR(TAG, "Close of %s reported: %s", path.c_str(), status.detail.c_str());
    return Err<bool>(ReaderFailure::readerFile("Failed to close book", path, "close", status.detail));
  }
  LOG_INF(TAG, "Closed %s", path.c_str());
  return Ok(true);
}

Result<ReadingPosition> DecoderReaderService::getCurrentPosition() {
  if (!open_) return Err<ReadingPosition>(ReaderFailure::noBookOpen());
  return Ok(position_);
}

Result<void> DecoderReaderService::updatePosition(const ReadingPosition& position) {
  if (!open_) return ErrVoid(ReaderFailure::noBookOpen());
  if (position.page < 1 || position.page > totalPages()) {
    return ErrVoid(ReaderFailure::pageOutOfRange(position.page, totalPages(), Direction::Update));
  }

  ReaderFailure failure;
  if (!validatePosition(position, &failure)) return ErrVoid(failure);

  position_ = position;
  position_.lastUpdatedMs = nowMs();
  position_.progressPercentage = progressFor(position.page);
  positionChannel_->emit(position_);
  return Ok();
}

Result<ReaderSettings> DecoderReaderService::getSettings() {
  if (!open_) return Err<ReaderSettings>(ReaderFailure::noBookOpen());
  return Ok(settings_);
}

Result<void> DecoderReaderService::updateSettings(const ReaderSettings& settings) {
  if (!open_) return ErrVoid(ReaderFailure::noBookOpen());

  const Result<void> valid = settings.validate();
  if (!valid.ok()) {
    LOG_WRN(TAG, "Rejected settings: %s", valid.err.toString().c_str());
    return valid;
  }

  settings_ = settings;
  settingsChannel_->emit(settings_);
  return Ok();
}

ReadingPosition DecoderReaderService::makePosition(const int page) const {
  ReadingPosition pos;
  pos.page = page;
  pos.chapter = chapterForPage(page);
  pos.progressPercentage = progressFor(page);
  pos.lastUpdatedMs = nowMs();
  return pos;
}

double DecoderReaderService::progressFor(const int page) const {
  if (totalPages() <= 0) return 0.0;
  const double progress = static_cast<double>(page) / totalPages();
  return std::min(std::max(progress, 0.0), 1.0);
}

Result<ReadingPosition> DecoderReaderService::moveTo(const int page, const char* direction) {
  if (!open_) return Err<ReadingPosition>(ReaderFailure::noBookOpen());
  if (page < 1 || page > totalPages()) {
    return Err<ReadingPosition>(ReaderFailure::pageOutOfRange(page, totalPages(), direction));
  }

  position_ = makePosition(page);
  positionChannel_->emit(position_);
  return Ok(position_);
}

Result<ReadingPosition> DecoderReaderService::goToPage(const int page) { return moveTo(page, Direction::GoTo); }

Result<ReadingPosition> DecoderReaderService::nextPage() {
  if (!open_) return Err<ReadingPosition>(ReaderFailure::noBookOpen());
  return moveTo(position_.page + 1, Direction::Next);
}

Result<ReadingPosition> DecoderReaderService::previousPage() {
  if (!open_) return Err<ReadingPosition>(ReaderFailure::noBookOpen());
  return moveTo(position_.page - 1, Direction::Previous);
}

Result<std::vector<SearchResult>> DecoderReaderService::searchText(const std::string& query,
                                                                    const bool caseSensitive) {
  if (!open_) return Err<std::vector<SearchResult>>(ReaderFailure::noBookOpen());

  std::vector<SearchResult> results;
  if (query.empty()) return Ok(std::move(results));

  std::string text;
  for (int i = 0; i < totalPages(); i++) {
    const DecodeStatus status = decoder_->unitText(i, &text);
    if (!status.ok()) {
      LOG_ERR(TAG, "Search aborted on unit %d: %s", i, status.detail.c_str());
      return Err<std::vector<SearchResult>>(ReaderFailure::searchFailed(query, status.detail));
    }

    const int page = i + 1;
    if (!TextSearch::findAll(text, query, caseSensitive, config_.searchContextLength, config_.searchMaxResults, page,
                             chapterForPage(page), &results)) {
      LOG_DBG(TAG, "Search stopped at %zu results", results.size());
      break;
    }
  }
  return Ok(std::move(results));
}

Result<std::string> DecoderReaderService::getPageText(const int page) {
  if (!open_) return Err<std::string>(ReaderFailure::noBookOpen());
  if (page < 1 || page > totalPages()) {
    return Err<std::string>(ReaderFailure::pageOutOfRange(page, totalPages(), Direction::GoTo));
  }

  std::string text;
  const DecodeStatus status = decoder_->unitText(page - 1, &text);
  if (!status.ok()) {
    LOG_ERR(TAG, "Text of page %d unavailable: %s", page, status.detail.c_str());
    return Err<std::string>(
        ReaderFailure::contentExtractionFailed("text", "page " + std::to_string(page), status.detail));
  }
  return Ok(std::move(text));
}

Result<std::vector<TableOfContentsEntry>> DecoderReaderService::getTableOfContents() {
  if (!open_) return Err<std::vector<TableOfContentsEntry>>(ReaderFailure::noBookOpen());
  return Ok(content_.tableOfContents);
}

Result<BookMetadata> DecoderReaderService::getBookMetadata() {
  if (!open_) return Err<BookMetadata>(ReaderFailure::noBookOpen());
  return Ok(content_.metadata);
}

Result<double> DecoderReaderService::calculateProgress(const ReadingPosition& position) {
  if (!open_) return Err<double>(ReaderFailure::noBookOpen());
  return Ok(progressFor(position.page));
}

Result<int> DecoderReaderService::estimateRemainingTime(const ReadingPosition& position, int wordsPerMinute) {
  if (!open_) return Err<int>(ReaderFailure::noBookOpen());
  if (wordsPerMinute <= 0) {
    LOG_ERR(TAG, "Invalid reading speed %d wpm, using %d", wordsPerMinute, config_.wordsPerMinute);
    wordsPerMinute = config_.wordsPerMinute;
  }

  // Units after the current one; page is 1-based so it is also the next unit's index
  const int first = std::min(std::max(position.page, 0), totalPages());
  size_t words = 0;
  for (int i = first; i < totalPages(); i++) words += unitWords_[i];

  const size_t wpm = static_cast<size_t>(wordsPerMinute);
  return Ok(static_cast<int>((words + wpm - 1) / wpm));
}

Result<bool> DecoderReaderService::isFormatSupported(const std::string& path) { return Ok(decoder_->probe(path)); }

Result<void> DecoderReaderService::saveProgress(const std::string& bookId, const ReadingPosition& position) {
  if (!open_) return ErrVoid(ReaderFailure::noBookOpen());
  if (bookId.empty()) return ErrVoid(ReaderFailure::saveProgressFailed(bookId, "empty book id"));

  const StoreStatus status = store_->save(bookId, position);
  if (status != StoreStatus::Ok) {
    LOG_ERR(TAG, "Saving progress of %s failed: %s", bookId.c_str(), storeStatusToString(status));
    return ErrVoid(ReaderFailure::saveProgressFailed(bookId, storeStatusToString(status)));
  }
  return Ok();
}

Result<ReadingPosition> DecoderReaderService::loadProgress(const std::string& bookId) {
  if (!open_) return Err<ReadingPosition>(ReaderFailure::noBookOpen());
  if (bookId.empty()) return Err<ReadingPosition>(ReaderFailure::loadProgressFailed(bookId, "empty book id"));

  ReadingPosition pos;
  const StoreStatus status = store_->load(bookId, &pos);
  if (status == StoreStatus::NotFound) return Ok(ReadingPosition::initial());
  if (status != StoreStatus::Ok) {
    LOG_ERR(TAG, "Loading progress of %s failed: %s", bookId.c_str(), storeStatusToString(status));
    return Err<ReadingPosition>(ReaderFailure::loadProgressFailed(bookId, storeStatusToString(status)));
  }

  if (pos.page < 1 || pos.page > totalPages()) {
    const int clamped = std::min(std::max(pos.page, 1), totalPages());
    LOG_WRN(TAG, "Saved page %d outside 1..%d, using %d", pos.page, totalPages(), clamped);
    pos.page = clamped;
    pos.chapter = chapterForPage(clamped);
    pos.progressPercentage = progressFor(clamped);
  }
  return Ok(pos);
}

Stream<ReadingPosition> DecoderReaderService::positionStream() {
  if (!open_) return Stream<ReadingPosition>::empty();
  return Stream<ReadingPosition>(positionChannel_);
}

Stream<ReaderSettings> DecoderReaderService::settingsStream() {
  if (!open_) return Stream<ReaderSettings>::empty();
  return Stream<ReaderSettings>(settingsChannel_);
}

Stream<double> DecoderReaderService::loadingProgressStream() {
  if (!open_) return Stream<double>::empty();
  return Stream<double>(loadingChannel_);
}

void DecoderReaderService::dispose() {
  if (disposed_) return;
  const auto closed = closeBook();
  if (!closed.ok()) LOG_WRN(TAG, "Dispose: %s", closed.err.toString().c_str());
  if (decoder_->isOpen()) {
    const DecodeStatus status = decoder_->close();
    if (!status.ok()) LOG_WRN(TAG, "Dispose: decoder close reported %s", status.detail.c_str());
  }
  disposed_ = true;
}

}  // namespace quire
