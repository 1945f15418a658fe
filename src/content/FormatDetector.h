#pragma once

#include <string>

#include "../core/Result.h"
#include "../core/Types.h"

namespace quire {

namespace FormatDetector {

// Maps a path's extension to a readable format, case-insensitively. Pure: the
// file system is never touched. Anything but .pdf and .epub fails with
// UnsupportedFormatFailure carrying the lower-cased extension.
Result<BookFormat> detectFormat(const std::string& path);

}  // namespace FormatDetector

}  // namespace quire
