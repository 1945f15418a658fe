#include "ReaderEntities.h"

#include <cctype>
#include <cstdio>
#include <cstring>
#include <functional>

namespace quire {

namespace {
std::string formatDouble(const double value) {
  char buf[32];
  snprintf(buf, sizeof(buf), "%g", value);
  return buf;
}
}  // namespace

const char* readingDirectionName(const ReadingDirection direction) {
  switch (direction) {
    case ReadingDirection::LeftToRight:
      return "ltr";
    case ReadingDirection::RightToLeft:
      return "rtl";
    case ReadingDirection::TopToBottom:
      return "ttb";
  }
  return "ltr";
}

const char* pageTransitionName(const PageTransition transition) {
  switch (transition) {
    case PageTransition::Slide:
      return "slide";
    case PageTransition::Fade:
      return "fade";
    case PageTransition::Curl:
      return "curl";
    case PageTransition::None:
      return "none";
  }
  return "slide";
}

bool readingDirectionFromName(const char* name, ReadingDirection* out) {
  if (strcmp(name, "ltr") == 0) {
    *out = ReadingDirection::LeftToRight;
  } else if (strcmp(name, "rtl") == 0) {
    *out = ReadingDirection::RightToLeft;
  } else if (strcmp(name, "ttb") == 0) {
    *out = ReadingDirection::TopToBottom;
  } else {
    return false;
  }
  return true;
}

bool pageTransitionFromName(const char* name, PageTransition* out) {
  if (strcmp(name, "slide") == 0) {
    *out = PageTransition::Slide;
  } else if (strcmp(name, "fade") == 0) {
    *out = PageTransition::Fade;
  } else if (strcmp(name, "curl") == 0) {
    *out = PageTransition::Curl;
  } else if (strcmp(name, "none") == 0) {
    *out = PageTransition::None;
  } else {
    return false;
  }
  return true;
}

ReaderSettings ReaderSettings::dark() {
  ReaderSettings s;
  s.textColor = "#FFFFFF";
  s.backgroundColor = "#121212";
  s.brightness = 0.3;
  return s;
}

ReaderSettings ReaderSettings::sepia() {
  ReaderSettings s;
  s.textColor = "#5C4B37";
  s.backgroundColor = "#F4F1EA";
  return s;
}

Result<void> ReaderSettings::validate() const {
  if (fontSize < MIN_FONT_SIZE || fontSize > MAX_FONT_SIZE) {
    return ErrVoid(ReaderFailure::invalidSetting("fontSize", formatDouble(fontSize)));
  }
  if (lineHeight < MIN_LINE_HEIGHT || lineHeight > MAX_LINE_HEIGHT) {
    return ErrVoid(ReaderFailure::invalidSetting("lineHeight", formatDouble(lineHeight)));
  }
  if (pageMargin < 0.0 || pageMargin > MAX_PAGE_MARGIN) {
    return ErrVoid(ReaderFailure::invalidSetting("pageMargin", formatDouble(pageMargin)));
  }
  if (brightness < 0.0 || brightness > 1.0) {
    return ErrVoid(ReaderFailure::invalidSetting("brightness", formatDouble(brightness)));
  }
  if (fontFamily.empty()) {
    return ErrVoid(ReaderFailure::invalidSetting("fontFamily", fontFamily));
  }
  if (!isValidColor(textColor)) {
    return ErrVoid(ReaderFailure::invalidSetting("textColor", textColor));
  }
  if (!isValidColor(backgroundColor)) {
    return ErrVoid(ReaderFailure::invalidSetting("backgroundColor", backgroundColor));
  }
  return Ok();
}

bool ReaderSettings::operator==(const ReaderSettings& other) const {
  return fontSize == other.fontSize && lineHeight == other.lineHeight && fontFamily == other.fontFamily &&
         textColor == other.textColor && backgroundColor == other.backgroundColor &&
         readingDirection == other.readingDirection && pageTransition == other.pageTransition &&
         showPageNumbers == other.showPageNumbers && showProgress == other.showProgress &&
         fullScreenMode == other.fullScreenMode && keepScreenOn == other.keepScreenOn &&
         pageMargin == other.pageMargin && autoBrightness == other.autoBrightness && brightness == other.brightness;
}

bool isValidColor(const std::string& color) {
  if (color.size() != 7 || color[0] != '#') return false;
  for (size_t i = 1; i < color.size(); i++) {
    if (!isxdigit(static_cast<unsigned char>(color[i]))) return false;
  }
  return true;
}

std::string makeDocumentId(const BookFormat format, const std::string& path) {
  const char* prefix = format == BookFormat::Epub ? "epub_" : format == BookFormat::Pdf ? "pdf_" : "txt_";
  return prefix + std::to_string(std::hash<std::string>{}(path));
}

int estimateReadingMinutes(const int64_t totalCharacters) {
  if (totalCharacters <= 0) return 0;
  return static_cast<int>((totalCharacters + Defaults::CharsPerMinute - 1) / Defaults::CharsPerMinute);
}

}  // namespace quire
