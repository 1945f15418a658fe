#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "../core/EngineConfig.h"
#include "../decoder/DocumentDecoder.h"
#include "ProgressStore.h"
#include "ReaderService.h"

namespace quire {

// Session state shared by the format services: the open decoder, the page index
// built at open, position, settings and the session's channels. Subclasses map
// decoder errors to their own failure kinds and add format extras.
class DecoderReaderService : public ReaderService {
 public:
  DecoderReaderService(BookFormat format, std::unique_ptr<DocumentDecoder> decoder, EngineConfig config,
                       std::shared_ptr<ProgressStore> store);
  ~DecoderReaderService() override;

  DecoderReaderService(const DecoderReaderService&) = delete;
  DecoderReaderService& operator=(const DecoderReaderService&) = delete;

  BookFormat format() const override { return format_; }

  Result<BookContent> openBook(const std::string& path, BookFormat format) override;
  Result<bool> closeBook() override;
  bool isOpen() const override { return open_; }

  Result<ReadingPosition> getCurrentPosition() override;
  Result<void> updatePosition(const ReadingPosition& position) override;

  Result<ReaderSettings> getSettings() override;
  Result<void> updateSettings(const ReaderSettings& settings) override;

  Result<ReadingPosition> goToPage(int page) override;
  Result<ReadingPosition> nextPage() override;
  Result<ReadingPosition> previousPage() override;

  Result<std::vector<SearchResult>> searchText(const std::string& query, bool caseSensitive) override;
  Result<std::string> getPageText(int page) override;
  Result<std::vector<TableOfContentsEntry>> getTableOfContents() override;
  Result<BookMetadata> getBookMetadata() override;

  Result<double> calculateProgress(const ReadingPosition& position) override;
  Result<int> estimateRemainingTime(const ReadingPosition& position, int wordsPerMinute) override;

  Result<bool> isFormatSupported(const std::string& path) override;

  Result<void> saveProgress(const std::string& bookId, const ReadingPosition& position) override;
  Result<ReadingPosition> loadProgress(const std::string& bookId) override;

  Stream<ReadingPosition> positionStream() override;
  Stream<ReaderSettings> settingsStream() override;
  Stream<double> loadingProgressStream() override;

  void dispose() override;

 protected:
  // Failure for a document the decoder couldn't parse (ParseFailed, Encrypted, NoContent)
  virtual ReaderFailure parseFailure(const std::string& path, const DecodeStatus& status) const = 0;
  // Extra position checks on top of the page range
  virtual bool validatePosition(const ReadingPosition& /*position*/, ReaderFailure* /*failure*/) const {
    return true;
  }
  // 0-based chapter recorded for a 1-based page
  virtual int chapterForPage(int page) const = 0;
  // Called when the document has no table of contents
  virtual void fallbackTableOfContents(std::vector<TableOfContentsEntry>* /*toc*/) const {}
  // Words assumed for a unit whose text can't be read
  virtual size_t wordsForUnreadableUnit() const = 0;

  DocumentDecoder& decoder() { return *decoder_; }
  int totalPages() const { return content_.totalPages; }
  const BookContent& content() const { return content_; }
  const EngineConfig& config() const { return config_; }

  // Bounds-checked move to a 1-based page, emitted on the position stream
  Result<ReadingPosition> moveTo(int page, const char* direction);

 private:
  BookFormat format_;
  std::unique_ptr<DocumentDecoder> decoder_;
  EngineConfig config_;
  std::shared_ptr<ProgressStore> store_;

  bool open_ = false;
  bool disposed_ = false;
  BookContent content_;
  std::vector<size_t> unitWords_;
  ReadingPosition position_;
  ReaderSettings settings_;

  std::shared_ptr<Channel<ReadingPosition>> positionChannel_;
  std::shared_ptr<Channel<ReaderSettings>> settingsChannel_;
  std::shared_ptr<Channel<double>> loadingChannel_;

  ReaderFailure openFailure(const std::string& path, const DecodeStatus& status) const;
  void indexUnits(Channel<double>& loading, int64_t* totalCharacters);
  std::vector<TableOfContentsEntry> buildTableOfContents();
  ReadingPosition makePosition(int page) const;
  double progressFor(int page) const;
  // Releases the decoder and drops the half-built session of an open that failed
  void abandonOpen(Channel<double>& loading);
  void resetSession();
};

}  // namespace quire
