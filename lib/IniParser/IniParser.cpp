#include "IniParser.h"

#include <strings.h>

#include <cstdio>
#include <cstdlib>
#include <cstring>

bool IniParser::parseFile(const char* path, const Callback& callback) {
  if (!path) return false;

  FILE* file = fopen(path, "r");
  if (!file) return false;

  std::string content;
  char buf[512];
  size_t read;
  while ((read = fread(buf, 1, sizeof(buf), file)) > 0) {
    content.append(buf, read);
  }
  fclose(file);

  return parseString(content.c_str(), callback);
}

bool IniParser::parseString(const char* content, const Callback& callback) {
  if (!content) return false;

  std::string section;
  const char* lineStart = content;
  while (*lineStart) {
    const char* lineEnd = lineStart;
    while (*lineEnd && *lineEnd != '\n') lineEnd++;

    if (!parseLine(std::string(lineStart, lineEnd), section, callback)) {
      return true;  // callback asked to stop
    }

    lineStart = *lineEnd ? lineEnd + 1 : lineEnd;
  }
  return true;
}

bool IniParser::parseLine(const std::string& rawLine, std::string& currentSection, const Callback& callback) {
  const std::string line = trimWhitespace(rawLine);
  if (line.empty() || line[0] == '#' || line[0] == ';') {
    return true;
  }

  if (line[0] == '[') {
    const size_t close = line.find(']');
    if (close != std::string::npos) {
      currentSection = trimWhitespace(line.substr(1, close - 1));
    }
    return true;
  }

  const size_t eq = line.find('=');
  if (eq == std::string::npos) {
    return true;  // Not a key/value line
  }

  const std::string key = trimWhitespace(line.substr(0, eq));
  std::string value = trimWhitespace(line.substr(eq + 1));
  if (value.size() >= 2 && ((value.front() == '"' && value.back() == '"') ||
                            (value.front() == '\'' && value.back() == '\''))) {
    value = value.substr(1, value.size() - 2);
  }

  if (key.empty()) return true;
  return callback(currentSection.c_str(), key.c_str(), value.c_str());
}

std::string IniParser::trimWhitespace(const std::string& str) {
  const char* ws = " \t\r\n";
  const size_t first = str.find_first_not_of(ws);
  if (first == std::string::npos) return "";
  const size_t last = str.find_last_not_of(ws);
  return str.substr(first, last - first + 1);
}

bool IniParser::parseBool(const char* value, const bool defaultValue) {
  if (!value) return defaultValue;
  if (strcasecmp(value, "true") == 0 || strcasecmp(value, "yes") == 0 || strcmp(value, "1") == 0 ||
      strcasecmp(value, "on") == 0) {
    return true;
  }
  if (strcasecmp(value, "false") == 0 || strcasecmp(value, "no") == 0 || strcmp(value, "0") == 0 ||
      strcasecmp(value, "off") == 0) {
    return false;
  }
  return defaultValue;
}

int IniParser::parseInt(const char* value, const int defaultValue) {
  if (!value || !*value) return defaultValue;
  char* end = nullptr;
  const long parsed = strtol(value, &end, 10);
  if (!end || *end != '\0') return defaultValue;
  return static_cast<int>(parsed);
}

double IniParser::parseDouble(const char* value, const double defaultValue) {
  if (!value || !*value) return defaultValue;
  char* end = nullptr;
  const double parsed = strtod(value, &end);
  if (!end || *end != '\0') return defaultValue;
  return parsed;
}
