#pragma once

#include <cstddef>
#include <string>

#include "../content/ReaderEntities.h"
#include "Result.h"
#include "Types.h"

namespace quire {

// Engine configuration read from an INI file:
//
//   [logging]   level
//   [reader]    theme, font_size, line_height, font_family, reading_direction,
//               page_transition, page_margin, show_page_numbers, show_progress
//   [reading]   words_per_minute
//   [search]    context_length, max_results (0 = unlimited)
//   [progress]  directory
//   [limits]    max_entry_bytes
//
// Invalid values keep the default and log a warning.
struct EngineConfig {
  int logLevel = 2;
  std::string theme = "default";
  ReaderSettings readerDefaults;
  int wordsPerMinute = Defaults::WordsPerMinute;
  size_t searchContextLength = Defaults::SearchContext;
  size_t searchMaxResults = 0;
  std::string progressDirectory = "./.quire/progress";
  size_t maxEntryBytes = Defaults::MaxEntryBytes;

  Result<void> loadFile(const char* path);
  bool loadString(const char* content);

  // Pushes logLevel into the logger
  void applyLogging() const;

 private:
  bool apply(const char* section, const char* key, const char* value);
  void applyTheme(const char* value);
};

}  // namespace quire
