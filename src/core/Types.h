#pragma once

#include <cstddef>
#include <cstdint>

namespace quire {

// Document formats the engine knows about. Txt is recognised but has no reader.
enum class BookFormat : uint8_t {
  Pdf,
  Epub,
  Txt,
};

// Navigation direction recorded on NavigationFailure
namespace Direction {
constexpr const char* GoTo = "goto";
constexpr const char* Next = "next";
constexpr const char* Previous = "previous";
constexpr const char* Update = "update";
}  // namespace Direction

// Engine-wide defaults, overridable through EngineConfig
namespace Defaults {
constexpr int WordsPerMinute = 250;
constexpr int CharsPerMinute = 1250;
constexpr int WordsPerUnreadablePage = 250;
constexpr size_t SearchContext = 50;
constexpr size_t MaxEntryBytes = 32 * 1024 * 1024;
constexpr size_t SniffBytes = 1024;
}  // namespace Defaults

}  // namespace quire
