#pragma once

#include <cstdint>
#include <string>
#include <vector>

struct fz_context;
struct fz_document;

enum class PdfError : uint8_t {
  None = 0,
  ContextFailed,
  OpenFailed,  // file missing, unreadable or not a PDF
  Encrypted,   // needs a password
  PageFailed,  // a page could not be loaded or read
  OutOfRange,
};

const char* pdfErrorToString(PdfError err);

// Thin RAII wrapper around a MuPDF context and document.
// Page numbers are 0-based here; the reader layer works 1-based.
class PdfDocument {
 public:
  struct OutlineItem {
    std::string title;
    int page;   // 0-based, -1 if the link doesn't resolve to a page
    int depth;  // 0 = top level
  };

  struct PageSize {
    float width;
    float height;
  };

  PdfDocument() = default;
  ~PdfDocument();

  PdfDocument(const PdfDocument&) = delete;
  PdfDocument& operator=(const PdfDocument&) = delete;

  bool open(const std::string& path);
  void close();
  bool isOpen() const { return doc != nullptr; }

  int pageCount() const { return pages; }

  // UTF-8 text of one page in reading order, lines separated by '\n'
  bool pageText(int page, std::string* out);
  bool pageSize(int page, PageSize* out);
  bool outline(std::vector<OutlineItem>* out);

  // Info dictionary lookup, e.g. "info:Title". Empty if absent.
  std::string metadata(const char* key);

  PdfError lastError() const { return lastError_; }
  const std::string& lastMessage() const { return lastMessage_; }

 private:
  fz_context* ctx = nullptr;
  fz_document* doc = nullptr;
  int pages = 0;
  PdfError lastError_ = PdfError::None;
  std::string lastMessage_;

  bool fail(PdfError err, const char* message);
};
