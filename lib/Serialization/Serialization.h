#pragma once
#include <cstdint>
#include <iostream>
#include <string>

namespace serialization {
// Upper bound for any length-prefixed string; anything larger means a corrupt file
constexpr uint32_t MAX_STRING_LENGTH = 65536;

template <typename T>
static void writePod(std::ostream& os, const T& value) {
  os.write(reinterpret_cast<const char*>(&value), sizeof(T));
}

template <typename T>
[[nodiscard]] static bool readPodChecked(std::istream& is, T& value) {
  is.read(reinterpret_cast<char*>(&value), sizeof(T));
  return is.good() && is.gcount() == static_cast<std::streamsize>(sizeof(T));
}

static void writeString(std::ostream& os, const std::string& s) {
  const uint32_t len = s.size();
  writePod(os, len);
  os.write(s.data(), len);
}

[[nodiscard]] static bool readString(std::istream& is, std::string& s) {
  uint32_t len;
  if (!readPodChecked(is, len)) {
    s.clear();
    return false;
  }
  if (len > MAX_STRING_LENGTH) {
    s.clear();
    is.setstate(std::ios::failbit);
    return false;
  }
  s.resize(len);
  if (len > 0) is.read(&s[0], len);
  return is.good();
}
}  // namespace serialization
