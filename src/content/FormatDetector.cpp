#include "FormatDetector.h"

#include <FsHelpers.h>
#include <Logging.h>

#define TAG "DETECT"

namespace quire {

Result<BookFormat> FormatDetector::detectFormat(const std::string& path) {
  if (FsHelpers::isPdfFile(path)) return Ok(BookFormat::Pdf);
  if (FsHelpers::isEpubFile(path)) return Ok(BookFormat::Epub);

  const std::string ext = FsHelpers::lowercaseExtension(path);
  LOG_DBG(TAG, "Unsupported extension '%s' for %s", ext.c_str(), path.c_str());
  return Err<BookFormat>(ReaderFailure::unsupportedFormat("Unsupported file format: " + ext, ext));
}

}  // namespace quire
