#pragma once

#include <functional>
#include <string>

/**
 * Small INI parser used for engine configuration.
 *
 * Parses INI format:
 *   [section]
 *   key = value
 *   # comment
 *   ; comment
 *
 * Keys and values are trimmed. Quoted values have their quotes removed.
 */
class IniParser {
 public:
  /**
   * Callback for each key-value pair found.
   * @param section Current section name (empty if before first section)
   * @param key The key name
   * @param value The value (trimmed of whitespace)
   * @return true to continue parsing, false to stop
   */
  using Callback = std::function<bool(const char* section, const char* key, const char* value)>;

  /**
   * Parse an INI file from disk.
   * @param path Path to the INI file
   * @param callback Function called for each key-value pair
   * @return false if the file can't be opened, true otherwise
   */
  static bool parseFile(const char* path, const Callback& callback);

  /**
   * Parse an INI string in memory.
   * @param content The INI content string
   * @param callback Function called for each key-value pair
   * @return true if parsed successfully
   */
  static bool parseString(const char* content, const Callback& callback);

  /**
   * Helper to parse boolean values.
   * Accepts: true/false, yes/no, 1/0, on/off
   */
  static bool parseBool(const char* value, bool defaultValue = false);

  /**
   * Helper to parse integer values. Trailing garbage yields the default.
   */
  static int parseInt(const char* value, int defaultValue = 0);

  /**
   * Helper to parse floating point values. Trailing garbage yields the default.
   */
  static double parseDouble(const char* value, double defaultValue = 0.0);

 private:
  static std::string trimWhitespace(const std::string& str);
  static bool parseLine(const std::string& line, std::string& currentSection, const Callback& callback);
};
