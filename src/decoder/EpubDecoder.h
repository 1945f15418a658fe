#pragma once

#include <Epub.h>

#include <memory>
#include <string>
#include <vector>

#include "DocumentDecoder.h"

namespace quire {

// EPUB through lib/Epub. Every chapter's text is extracted at open and kept,
// so later text requests never touch the archive.
class EpubDecoder : public DocumentDecoder {
 public:
  explicit EpubDecoder(size_t maxEntryBytes = Epub::DEFAULT_MAX_ITEM_SIZE) : maxEntryBytes(maxEntryBytes) {}
  ~EpubDecoder() override;

  DecodeStatus open(const std::string& path) override;
  DecodeStatus close() override;
  bool isOpen() const override { return epub != nullptr; }
  bool probe(const std::string& path) const override;

  int unitCount() const override { return static_cast<int>(chapterText.size()); }
  DecodeStatus unitText(int index, std::string* out) override;
  DecodeStatus tableOfContents(std::vector<DecodedTocEntry>* out) override;
  DecodedMetadata metadata() const override;
  std::string unitHref(int index) const override;

 private:
  size_t maxEntryBytes;
  std::unique_ptr<Epub> epub;
  std::vector<std::string> chapterText;
  // Per chapter: Ok or the reason its text couldn't be extracted
  std::vector<DecodeError> chapterStatus;
};

}  // namespace quire
