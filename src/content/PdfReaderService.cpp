#include "PdfReaderService.h"

#include <Logging.h>

#define TAG "PDF_SVC"

namespace quire {

ReaderFailure PdfReaderService::parseFailure(const std::string& path, const DecodeStatus& status) const {
  if (status.code == DecodeError::Encrypted) {
    return ReaderFailure::pdfEncrypted(path);
  }
  return ReaderFailure::pdfParsingFailed(path, status.detail);
}

Result<PageDimensions> PdfReaderService::getPageSize(const int page) {
  if (!isOpen()) return Err<PageDimensions>(ReaderFailure::noBookOpen());
  if (page < 1 || page > totalPages()) {
    return Err<PageDimensions>(ReaderFailure::pageOutOfRange(page, totalPages(), Direction::GoTo));
  }

  PageDimensions dims;
  const DecodeStatus status = decoder().unitSize(page - 1, &dims.width, &dims.height);
  if (!status.ok()) {
    LOG_ERR(TAG, "Cannot measure page %d: %s", page, status.detail.c_str());
    return Err<PageDimensions>(ReaderFailure::pdfRenderingFailed(page, totalPages(), status.detail));
  }
  dims.aspectRatio = dims.height > 0.0 ? dims.width / dims.height : 0.0;
  return Ok(dims);
}

}  // namespace quire
