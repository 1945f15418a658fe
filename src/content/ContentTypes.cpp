#include "ContentTypes.h"

#include <strings.h>

namespace quire {

const char* bookFormatDisplayName(const BookFormat format) {
  switch (format) {
    case BookFormat::Pdf:
      return "PDF";
    case BookFormat::Epub:
      return "EPUB";
    case BookFormat::Txt:
      return "TXT";
  }
  return "UNKNOWN";
}

const char* bookFormatExtension(const BookFormat format) {
  switch (format) {
    case BookFormat::Pdf:
      return ".pdf";
    case BookFormat::Epub:
      return ".epub";
    case BookFormat::Txt:
      return ".txt";
  }
  return "";
}

bool bookFormatFromExtension(const char* ext, BookFormat* out) {
  if (!ext) return false;

  if (strcasecmp(ext, ".pdf") == 0) {
    *out = BookFormat::Pdf;
    return true;
  }
  if (strcasecmp(ext, ".epub") == 0) {
    *out = BookFormat::Epub;
    return true;
  }
  if (strcasecmp(ext, ".txt") == 0) {
    *out = BookFormat::Txt;
    return true;
  }
  return false;
}

bool bookFormatFromMimeType(const std::string& mimeType, BookFormat* out) {
  if (mimeType == "application/pdf") {
    *out = BookFormat::Pdf;
    return true;
  }
  if (mimeType == "application/epub+zip") {
    *out = BookFormat::Epub;
    return true;
  }
  if (mimeType == "text/plain") {
    *out = BookFormat::Txt;
    return true;
  }
  return false;
}

}  // namespace quire
