#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace quire {

// Closed set of failure categories. None marks a successful Result.
enum class FailureKind : uint8_t {
  None = 0,
  BookOpen,
  UnsupportedFormat,
  ReaderFile,
  PdfReader,
  EpubReader,
  Navigation,
  Search,
  ContentExtraction,
  Settings,
  Progress,
  Memory,
};

// "NavigationFailure", "BookOpenFailure", ...
const char* failureKindName(FailureKind kind);

// A failure with the structured context of its kind. Fields that don't apply to
// the kind stay unset: -1 for numbers, empty for strings.
struct ReaderFailure {
  FailureKind kind = FailureKind::None;
  std::string message;

  // BookOpen, ReaderFile
  std::string filePath;
  std::string details;
  // UnsupportedFormat
  std::string fileExtension;
  std::vector<std::string> supportedFormats;
  // ReaderFile, Progress, Memory
  std::string operation;
  // PdfReader
  int pageNumber = -1;
  int totalPages = -1;
  std::string errorCode;
  // EpubReader
  int chapterIndex = -1;
  int totalChapters = -1;
  std::string epubDetails;
  // Navigation (totalPages is shared with PdfReader)
  int requestedPage = -1;
  std::string direction;
  // Search
  std::string query;
  std::string scope;
  // ContentExtraction
  std::string contentType;
  std::string sourceLocation;
  // Settings
  std::string settingName;
  std::string attemptedValue;
  // Progress
  std::string bookId;
  // Memory
  int64_t memoryUsage = -1;
  int64_t memoryLimit = -1;

  std::string toString() const;

  static ReaderFailure bookOpen(const std::string& message, const std::string& filePath = "",
                                const std::string& details = "");
  static ReaderFailure noBookOpen();
  static ReaderFailure fileNotFound(const std::string& filePath);

  static ReaderFailure unsupportedFormat(const std::string& message, const std::string& fileExtension);

  static ReaderFailure readerFile(const std::string& message, const std::string& filePath,
                                  const std::string& operation, const std::string& details = "");
  // Anything thrown that isn't part of the taxonomy
  static ReaderFailure unexpected(const std::string& what);

  static ReaderFailure pdfParsingFailed(const std::string& filePath, const std::string& details);
  static ReaderFailure pdfEncrypted(const std::string& filePath);
  static ReaderFailure pdfRenderingFailed(int pageNumber, int totalPages, const std::string& details);

  static ReaderFailure epubParsingFailed(const std::string& filePath, const std::string& details,
                                         int chapterIndex = -1, int totalChapters = -1);

  static ReaderFailure pageOutOfRange(int requestedPage, int totalPages, const std::string& direction);

  static ReaderFailure searchFailed(const std::string& query, const std::string& details);

  static ReaderFailure contentExtractionFailed(const std::string& contentType, const std::string& sourceLocation,
                                               const std::string& details);

  static ReaderFailure invalidSetting(const std::string& settingName, const std::string& attemptedValue);

  static ReaderFailure saveProgressFailed(const std::string& bookId, const std::string& details);
  static ReaderFailure loadProgressFailed(const std::string& bookId, const std::string& details);

  static ReaderFailure memoryLimitExceeded(const std::string& operation, int64_t memoryUsage, int64_t memoryLimit);
};

}  // namespace quire
