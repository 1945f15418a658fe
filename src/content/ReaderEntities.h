#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "../core/Result.h"
#include "../core/Types.h"

namespace quire {

// Where the reader is inside the open document.
// page is 1-based for both formats; for EPUB it is the chapter number and chapter == page - 1.
struct ReadingPosition {
  int page = 1;
  int chapter = 0;
  int64_t characterOffset = 0;
  double scrollOffset = 0.0;
  double progressPercentage = 0.0;  // [0, 1]
  int64_t lastUpdatedMs = 0;        // ms since epoch

  static ReadingPosition initial() { return ReadingPosition{}; }

  bool operator==(const ReadingPosition& other) const {
    return page == other.page && chapter == other.chapter && characterOffset == other.characterOffset &&
           scrollOffset == other.scrollOffset && progressPercentage == other.progressPercentage &&
           lastUpdatedMs == other.lastUpdatedMs;
  }
  bool operator!=(const ReadingPosition& other) const { return !(*this == other); }
};

enum class ReadingDirection : uint8_t { LeftToRight, RightToLeft, TopToBottom };
enum class PageTransition : uint8_t { Slide, Fade, Curl, None };

const char* readingDirectionName(ReadingDirection direction);
const char* pageTransitionName(PageTransition transition);
bool readingDirectionFromName(const char* name, ReadingDirection* out);
bool pageTransitionFromName(const char* name, PageTransition* out);

struct ReaderSettings {
  static constexpr double MIN_FONT_SIZE = 0.5;
  static constexpr double MAX_FONT_SIZE = 3.0;
  static constexpr double MIN_LINE_HEIGHT = 1.0;
  static constexpr double MAX_LINE_HEIGHT = 2.5;
  static constexpr double MAX_PAGE_MARGIN = 200.0;

  double fontSize = 1.0;
  double lineHeight = 1.4;
  std::string fontFamily = "System";
  std::string textColor = "#000000";
  std::string backgroundColor = "#FFFFFF";
  ReadingDirection readingDirection = ReadingDirection::LeftToRight;
  PageTransition pageTransition = PageTransition::Slide;
  bool showPageNumbers = true;
  bool showProgress = true;
  bool fullScreenMode = false;
  bool keepScreenOn = true;
  double pageMargin = 16.0;
  bool autoBrightness = false;
  double brightness = 1.0;

  static ReaderSettings defaults() { return ReaderSettings{}; }
  static ReaderSettings dark();
  static ReaderSettings sepia();

  // SettingsFailure naming the first out-of-range field
  Result<void> validate() const;

  bool operator==(const ReaderSettings& other) const;
  bool operator!=(const ReaderSettings& other) const { return !(*this == other); }
};

// "#RRGGBB"
bool isValidColor(const std::string& color);

struct TableOfContentsEntry {
  std::string title;
  int page = 1;   // 1-based target
  int level = 0;  // 0 = top level
  std::vector<TableOfContentsEntry> children;
};

struct BookMetadata {
  std::string title;
  std::string author;
  std::string subject;
  std::string language;
  std::string identifier;
  std::string creator;
  std::string producer;
  BookFormat format = BookFormat::Pdf;
  int pageCount = 0;
  int64_t totalCharacters = 0;
};

struct BookContent {
  std::string documentId;
  std::string filePath;
  BookFormat format = BookFormat::Pdf;
  int totalPages = 0;
  int64_t totalCharacters = 0;
  int estimatedReadingTime = 0;  // minutes
  std::vector<TableOfContentsEntry> tableOfContents;
  BookMetadata metadata;
};

struct SearchResult {
  int pageNumber = 1;     // 1-based
  int chapterNumber = 0;  // 0-based
  size_t characterPosition = 0;
  std::string snippet;
  std::string contextBefore;
  std::string contextAfter;
};

struct ChapterInfo {
  int index = 0;
  std::string title;
  std::string href;
};

// PDF points
struct PageDimensions {
  double width = 0.0;
  double height = 0.0;
  double aspectRatio = 0.0;
};

// "pdf_<hash>" / "epub_<hash>"
std::string makeDocumentId(BookFormat format, const std::string& path);

// Reading time in minutes for a character count
int estimateReadingMinutes(int64_t totalCharacters);

}  // namespace quire
