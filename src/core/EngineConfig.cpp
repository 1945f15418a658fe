#include "EngineConfig.h"

#include <IniParser.h>
#include <Logging.h>

#include <climits>
#include <cmath>
#include <cstring>

#define TAG "CFG"

namespace quire {

namespace {
bool parseRangedDouble(const char* key, const char* value, const double lo, const double hi, double* out) {
  const double parsed = IniParser::parseDouble(value, NAN);
  if (std::isnan(parsed) || parsed < lo || parsed > hi) {
    LOG_WRN(TAG, "Invalid %s '%s', keeping %g", key, value, *out);
    return false;
  }
  *out = parsed;
  return true;
}

bool parseRangedInt(const char* key, const char* value, const int lo, const int hi, int* out) {
  const int parsed = IniParser::parseInt(value, INT_MIN);
  if (parsed == INT_MIN || parsed < lo || parsed > hi) {
    LOG_WRN(TAG, "Invalid %s '%s', keeping %d", key, value, *out);
    return false;
  }
  *out = parsed;
  return true;
}
}  // namespace

Result<void> EngineConfig::loadFile(const char* path) {
  const bool parsed =
      IniParser::parseFile(path, [this](const char* section, const char* key, const char* value) {
        return apply(section, key, value);
      });
  if (!parsed) {
    LOG_ERR(TAG, "Cannot read config %s", path);
    return ErrVoid(ReaderFailure::readerFile("Cannot read configuration file", path, "config"));
  }
  LOG_INF(TAG, "Loaded %s", path);
  return Ok();
}

bool EngineConfig::loadString(const char* content) {
  return IniParser::parseString(content, [this](const char* section, const char* key, const char* value) {
    return apply(section, key, value);
  });
}

void EngineConfig::applyLogging() const { logSetLevel(logLevel); }

void EngineConfig::applyTheme(const char* value) {
  ReaderSettings preset;
  if (strcmp(value, "dark") == 0) {
    preset = ReaderSettings::dark();
  } else if (strcmp(value, "sepia") == 0) {
    preset = ReaderSettings::sepia();
  } else if (strcmp(value, "default") != 0) {
    LOG_WRN(TAG, "Unknown theme '%s', keeping %s", value, theme.c_str());
    return;
  }

  theme = value;
  readerDefaults.textColor = preset.textColor;
  readerDefaults.backgroundColor = preset.backgroundColor;
  readerDefaults.brightness = preset.brightness;
}

bool EngineConfig::apply(const char* section, const char* key, const char* value) {
  ReaderSettings& rs = readerDefaults;

  // [logging]
  if (strcmp(section, "logging") == 0 && strcmp(key, "level") == 0) {
    parseRangedInt(key, value, 0, 3, &logLevel);
  }
  // [reader]
  else if (strcmp(section, "reader") == 0) {
    if (strcmp(key, "theme") == 0) {
      applyTheme(value);
    } else if (strcmp(key, "font_size") == 0) {
      parseRangedDouble(key, value, ReaderSettings::MIN_FONT_SIZE, ReaderSettings::MAX_FONT_SIZE, &rs.fontSize);
    } else if (strcmp(key, "line_height") == 0) {
      parseRangedDouble(key, value, ReaderSettings::MIN_LINE_HEIGHT, ReaderSettings::MAX_LINE_HEIGHT, &rs.lineHeight);
    } else if (strcmp(key, "font_family") == 0) {
      if (*value) {
        rs.fontFamily = value;
      } else {
        LOG_WRN(TAG, "Empty font_family, keeping %s", rs.fontFamily.c_str());
      }
    } else if (strcmp(key, "reading_direction") == 0) {
      if (!readingDirectionFromName(value, &rs.readingDirection)) {
        LOG_WRN(TAG, "Invalid reading_direction '%s'", value);
      }
    } else if (strcmp(key, "page_transition") == 0) {
      if (!pageTransitionFromName(value, &rs.pageTransition)) {
        LOG_WRN(TAG, "Invalid page_transition '%s'", value);
      }
    } else if (strcmp(key, "page_margin") == 0) {
      parseRangedDouble(key, value, 0.0, ReaderSettings::MAX_PAGE_MARGIN, &rs.pageMargin);
    } else if (strcmp(key, "show_page_numbers") == 0) {
      rs.showPageNumbers = IniParser::parseBool(value, rs.showPageNumbers);
    } else if (strcmp(key, "show_progress") == 0) {
      rs.showProgress = IniParser::parseBool(value, rs.showProgress);
    } else {
      LOG_DBG(TAG, "Ignoring [%s] %s", section, key);
    }
  }
  // [reading]
  else if (strcmp(section, "reading") == 0 && strcmp(key, "words_per_minute") == 0) {
    parseRangedInt(key, value, 1, 10000, &wordsPerMinute);
  }
  // [search]
  else if (strcmp(section, "search") == 0) {
    int parsed = 0;
    if (strcmp(key, "context_length") == 0) {
      parsed = static_cast<int>(searchContextLength);
      if (parseRangedInt(key, value, 0, 4096, &parsed)) searchContextLength = static_cast<size_t>(parsed);
    } else if (strcmp(key, "max_results") == 0) {
      parsed = static_cast<int>(searchMaxResults);
      if (parseRangedInt(key, value, 0, INT_MAX - 1, &parsed)) searchMaxResults = static_cast<size_t>(parsed);
    } else {
      LOG_DBG(TAG, "Ignoring [%s] %s", section, key);
    }
  }
  // [progress]
  else if (strcmp(section, "progress") == 0 && strcmp(key, "directory") == 0) {
    if (*value) {
      progressDirectory = value;
    } else {
      LOG_WRN(TAG, "Empty progress directory, keeping %s", progressDirectory.c_str());
    }
  }
  // [limits]
  else if (strcmp(section, "limits") == 0 && strcmp(key, "max_entry_bytes") == 0) {
    int parsed = static_cast<int>(maxEntryBytes);
    if (parseRangedInt(key, value, 1, INT_MAX - 1, &parsed)) maxEntryBytes = static_cast<size_t>(parsed);
  } else {
    LOG_DBG(TAG, "Ignoring [%s] %s", section, key);
  }

  return true;
}

}  // namespace quire
