#include "PdfDecoder.h"

#include <FsHelpers.h>
#include <Logging.h>

#include "../content/FormatSniffer.h"

#define TAG "PDFDEC"

namespace quire {

namespace {
DecodeStatus fromPdfError(const PdfDocument& doc) {
  DecodeError code = DecodeError::ParseFailed;
  switch (doc.lastError()) {
    case PdfError::None:
      return DecodeStatus::success();
    case PdfError::ContextFailed:
      code = DecodeError::IoError;
      break;
    case PdfError::OpenFailed:
    case PdfError::PageFailed:
      code = DecodeError::ParseFailed;
      break;
    case PdfError::Encrypted:
      code = DecodeError::Encrypted;
      break;
    case PdfError::OutOfRange:
      code = DecodeError::OutOfRange;
      break;
  }
  return DecodeStatus::failure(code, doc.lastMessage());
}
}  // namespace

bool PdfDecoder::probe(const std::string& path) const { return FormatSniffer::looksLikePdf(path); }

DecodeStatus PdfDecoder::open(const std::string& path) {
  if (doc.isOpen()) close();

  if (!FsHelpers::fileExists(path)) {
    return DecodeStatus::failure(DecodeError::FileNotFound, path);
  }
  if (!FormatSniffer::looksLikePdf(path)) {
    return DecodeStatus::failure(DecodeError::CorruptHeader, "missing %PDF- signature");
  }

  if (!doc.open(path)) {
    return fromPdfError(doc);
  }

  meta = DecodedMetadata();
  meta.title = doc.metadata("info:Title");
  meta.author = doc.metadata("info:Author");
  meta.subject = doc.metadata("info:Subject");
  meta.creator = doc.metadata("info:Creator");
  meta.producer = doc.metadata("info:Producer");
  return DecodeStatus::success();
}

DecodeStatus PdfDecoder::close() {
  doc.close();
  meta = DecodedMetadata();
  return DecodeStatus::success();
}

DecodeStatus PdfDecoder::unitText(const int index, std::string* out) {
  if (!doc.pageText(index, out)) return fromPdfError(doc);
  return DecodeStatus::success();
}

DecodeStatus PdfDecoder::tableOfContents(std::vector<DecodedTocEntry>* out) {
  out->clear();
  std::vector<PdfDocument::OutlineItem> items;
  if (!doc.outline(&items)) {
    // A broken outline doesn't make the document unreadable
    LOG_WRN(TAG, "Outline unavailable: %s", doc.lastMessage().c_str());
    return DecodeStatus::success();
  }

  out->reserve(items.size());
  for (const auto& item : items) {
    out->push_back({item.title, item.page, item.depth});
  }
  return DecodeStatus::success();
}

DecodeStatus PdfDecoder::unitSize(const int index, double* width, double* height) {
  PdfDocument::PageSize size{};
  if (!doc.pageSize(index, &size)) return fromPdfError(doc);
  *width = size.width;
  *height = size.height;
  return DecodeStatus::success();
}

}  // namespace quire
