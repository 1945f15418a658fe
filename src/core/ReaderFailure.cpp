#include "ReaderFailure.h"

#include <sstream>

namespace quire {

const char* failureKindName(const FailureKind kind) {
  switch (kind) {
    case FailureKind::None:
      return "None";
    case FailureKind::BookOpen:
      return "BookOpenFailure";
    case FailureKind::UnsupportedFormat:
      return "UnsupportedFormatFailure";
    case FailureKind::ReaderFile:
      return "ReaderFileFailure";
    case FailureKind::PdfReader:
      return "PdfReaderFailure";
    case FailureKind::EpubReader:
      return "EpubReaderFailure";
    case FailureKind::Navigation:
      return "NavigationFailure";
    case FailureKind::Search:
      return "SearchFailure";
    case FailureKind::ContentExtraction:
      return "ContentExtractionFailure";
    case FailureKind::Settings:
      return "SettingsFailure";
    case FailureKind::Progress:
      return "ProgressFailure";
    case FailureKind::Memory:
      return "MemoryFailure";
  }
  return "UnknownFailure";
}

std::string ReaderFailure::toString() const {
  std::ostringstream os;
  os << failureKindName(kind) << ": " << message;

  switch (kind) {
    case FailureKind::BookOpen:
    case FailureKind::ReaderFile:
      if (!filePath.empty()) os << " (file: " << filePath << ")";
      break;
    case FailureKind::UnsupportedFormat:
      if (!fileExtension.empty()) os << " (extension: " << fileExtension << ")";
      break;
    case FailureKind::PdfReader:
      if (!errorCode.empty()) os << " (code: " << errorCode << ")";
      break;
    case FailureKind::EpubReader:
      if (chapterIndex >= 0) os << " (chapter: " << chapterIndex << ")";
      break;
    case FailureKind::Navigation:
      os << " (requested: " << requestedPage << ")";
      break;
    case FailureKind::Search:
      os << " (query: \"" << query << "\")";
      break;
    case FailureKind::ContentExtraction:
      os << " (" << contentType << " at " << sourceLocation << ")";
      break;
    case FailureKind::Settings:
      os << " (" << settingName << " = " << attemptedValue << ")";
      break;
    case FailureKind::Progress:
      os << " (operation: " << operation << ")";
      break;
    case FailureKind::Memory:
      if (memoryLimit >= 0) os << " (" << memoryUsage << " of " << memoryLimit << " bytes)";
      break;
    case FailureKind::None:
      break;
  }

  if (!details.empty() && kind != FailureKind::Progress) os << " - " << details;
  return os.str();
}

ReaderFailure ReaderFailure::bookOpen(const std::string& message, const std::string& filePath,
                                      const std::string& details) {
  ReaderFailure f;
  f.kind = FailureKind::BookOpen;
  f.message = message;
  f.filePath = filePath;
  f.details = details;
  return f;
}

ReaderFailure ReaderFailure::noBookOpen() { return bookOpen("No book is currently open"); }

ReaderFailure ReaderFailure::fileNotFound(const std::string& filePath) {
  return bookOpen("File not found", filePath, "The specified file does not exist");
}

ReaderFailure ReaderFailure::unsupportedFormat(const std::string& message, const std::string& fileExtension) {
  ReaderFailure f;
  f.kind = FailureKind::UnsupportedFormat;
  f.message = message;
  f.fileExtension = fileExtension;
  f.supportedFormats = {"pdf", "epub"};
  return f;
}

ReaderFailure ReaderFailure::readerFile(const std::string& message, const std::string& filePath,
                                        const std::string& operation, const std::string& details) {
  ReaderFailure f;
  f.kind = FailureKind::ReaderFile;
  f.message = message;
  f.filePath = filePath;
  f.operation = operation;
  f.details = details;
  return f;
}

ReaderFailure ReaderFailure::unexpected(const std::string& what) {
  return readerFile("Unexpected error: " + what, "", "general");
}

ReaderFailure ReaderFailure::pdfParsingFailed(const std::string& filePath, const std::string& details) {
  ReaderFailure f;
  f.kind = FailureKind::PdfReader;
  f.message = "Failed to parse PDF";
  f.filePath = filePath;
  f.details = details;
  f.errorCode = "PARSE_ERROR";
  return f;
}

ReaderFailure ReaderFailure::pdfEncrypted(const std::string& filePath) {
  ReaderFailure f = pdfParsingFailed(filePath, "Document requires a password");
  f.message = "PDF is password protected";
  f.errorCode = "ENCRYPTED";
  return f;
}

ReaderFailure ReaderFailure::pdfRenderingFailed(const int pageNumber, const int totalPages,
                                                const std::string& details) {
  ReaderFailure f;
  f.kind = FailureKind::PdfReader;
  f.message = "Failed to render PDF page";
  f.pageNumber = pageNumber;
  f.totalPages = totalPages;
  f.details = details;
  f.errorCode = "RENDER_ERROR";
  return f;
}

ReaderFailure ReaderFailure::epubParsingFailed(const std::string& filePath, const std::string& details,
                                               const int chapterIndex, const int totalChapters) {
  ReaderFailure f;
  f.kind = FailureKind::EpubReader;
  f.message = "Failed to parse EPUB";
  f.filePath = filePath;
  f.epubDetails = details;
  f.chapterIndex = chapterIndex;
  f.totalChapters = totalChapters;
  return f;
}

ReaderFailure ReaderFailure::pageOutOfRange(const int requestedPage, const int totalPages,
                                            const std::string& direction) {
  ReaderFailure f;
  f.kind = FailureKind::Navigation;
  f.message = "Page number out of range";
  f.requestedPage = requestedPage;
  f.totalPages = totalPages;
  f.direction = direction;
  return f;
}

ReaderFailure ReaderFailure::searchFailed(const std::string& query, const std::string& details) {
  ReaderFailure f;
  f.kind = FailureKind::Search;
  f.message = "Search failed";
  f.query = query;
  f.scope = "entire book";
  f.details = details;
  return f;
}

ReaderFailure ReaderFailure::contentExtractionFailed(const std::string& contentType,
                                                     const std::string& sourceLocation, const std::string& details) {
  ReaderFailure f;
  f.kind = FailureKind::ContentExtraction;
  f.message = "Failed to extract " + contentType;
  f.contentType = contentType;
  f.sourceLocation = sourceLocation;
  f.details = details;
  return f;
}

ReaderFailure ReaderFailure::invalidSetting(const std::string& settingName, const std::string& attemptedValue) {
  ReaderFailure f;
  f.kind = FailureKind::Settings;
  f.message = "Invalid value for setting " + settingName;
  f.settingName = settingName;
  f.attemptedValue = attemptedValue;
  return f;
}

ReaderFailure ReaderFailure::saveProgressFailed(const std::string& bookId, const std::string& details) {
  ReaderFailure f;
  f.kind = FailureKind::Progress;
  f.message = "Failed to save progress for book " + bookId + ": " + details;
  f.operation = "save";
  f.bookId = bookId;
  f.details = details;
  return f;
}

ReaderFailure ReaderFailure::loadProgressFailed(const std::string& bookId, const std::string& details) {
  ReaderFailure f;
  f.kind = FailureKind::Progress;
  f.message = "Failed to load progress for book " + bookId + ": " + details;
  f.operation = "load";
  f.bookId = bookId;
  f.details = details;
  return f;
}

ReaderFailure ReaderFailure::memoryLimitExceeded(const std::string& operation, const int64_t memoryUsage,
                                                 const int64_t memoryLimit) {
  ReaderFailure f;
  f.kind = FailureKind::Memory;
  f.message = "Memory limit exceeded";
  f.operation = operation;
  f.memoryUsage = memoryUsage;
  f.memoryLimit = memoryLimit;
  return f;
}

}  // namespace quire
