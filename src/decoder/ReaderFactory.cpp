#include "ReaderFactory.h"

#include "../content/EpubReaderService.h"
#include "../content/FileProgressStore.h"
#include "../content/PdfReaderService.h"
#include "EpubDecoder.h"
#include "PdfDecoder.h"

namespace quire {

std::unique_ptr<ReaderRepository> createDefaultRepository(const EngineConfig& config,
                                                          std::shared_ptr<ProgressStore> store) {
  if (!store) store = std::make_shared<FileProgressStore>(config.progressDirectory);

  std::unique_ptr<ReaderService> pdf(
      new PdfReaderService(std::unique_ptr<DocumentDecoder>(new PdfDecoder()), config, store));
  std::unique_ptr<ReaderService> epub(
      new EpubReaderService(std::unique_ptr<DocumentDecoder>(new EpubDecoder(config.maxEntryBytes)), config, store));
  return std::unique_ptr<ReaderRepository>(new ReaderRepository(std::move(pdf), std::move(epub)));
}

}  // namespace quire
