#pragma once

#include <vector>

#include "DecoderReaderService.h"

namespace quire {

// Chaptered documents: one unit per spine item. A position's page is the
// 1-based chapter number and its chapter is page - 1.
class EpubReaderService : public DecoderReaderService {
 public:
  EpubReaderService(std::unique_ptr<DocumentDecoder> decoder, EngineConfig config, std::shared_ptr<ProgressStore> store)
      : DecoderReaderService(BookFormat::Epub, std::move(decoder), std::move(config), std::move(store)) {}

  // 0-based chapter index
  Result<ReadingPosition> goToChapter(int chapterIndex);
  Result<std::vector<ChapterInfo>> getChapters();

 protected:
  ReaderFailure parseFailure(const std::string& path, const DecodeStatus& status) const override;
  bool validatePosition(const ReadingPosition& position, ReaderFailure* failure) const override;
  int chapterForPage(const int page) const override { return page - 1; }
  void fallbackTableOfContents(std::vector<TableOfContentsEntry>* toc) const override;
  size_t wordsForUnreadableUnit() const override { return 0; }
};

}  // namespace quire
