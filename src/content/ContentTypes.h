#pragma once

#include <string>

#include "../core/Types.h"

namespace quire {

// "PDF", "EPUB", "TXT"
const char* bookFormatDisplayName(BookFormat format);
// ".pdf", ".epub", ".txt"
const char* bookFormatExtension(BookFormat format);

// Case-insensitive, dot included (".PDF" -> Pdf). False if unknown.
bool bookFormatFromExtension(const char* ext, BookFormat* out);
bool bookFormatFromMimeType(const std::string& mimeType, BookFormat* out);

}  // namespace quire
