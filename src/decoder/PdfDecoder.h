#pragma once

#include <PdfDocument.h>

#include <string>
#include <vector>

#include "DocumentDecoder.h"

namespace quire {

// PDF through MuPDF. Page text is extracted on demand.
class PdfDecoder : public DocumentDecoder {
 public:
  DecodeStatus open(const std::string& path) override;
  DecodeStatus close() override;
  bool isOpen() const override { return doc.isOpen(); }
  bool probe(const std::string& path) const override;

  int unitCount() const override { return doc.pageCount(); }
  DecodeStatus unitText(int index, std::string* out) override;
  DecodeStatus tableOfContents(std::vector<DecodedTocEntry>* out) override;
  DecodedMetadata metadata() const override { return meta; }
  DecodeStatus unitSize(int index, double* width, double* height) override;

 private:
  PdfDocument doc;
  DecodedMetadata meta;
};

}  // namespace quire
