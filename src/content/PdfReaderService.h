#pragma once

#include "DecoderReaderService.h"

namespace quire {

// Paginated documents: one unit per PDF page, chapter is always 0
class PdfReaderService : public DecoderReaderService {
 public:
  PdfReaderService(std::unique_ptr<DocumentDecoder> decoder, EngineConfig config, std::shared_ptr<ProgressStore> store)
      : DecoderReaderService(BookFormat::Pdf, std::move(decoder), std::move(config), std::move(store)) {}

  // Page bounds in points
  Result<PageDimensions> getPageSize(int page);

 protected:
  ReaderFailure parseFailure(const std::string& path, const DecodeStatus& status) const override;
  int chapterForPage(int /*page*/) const override { return 0; }
  size_t wordsForUnreadableUnit() const override { return Defaults::WordsPerUnreadablePage; }
};

}  // namespace quire
