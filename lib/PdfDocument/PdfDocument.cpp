#include "PdfDocument.h"

#include <Logging.h>
#include <mupdf/fitz.h>

#define TAG "PDF"

namespace {
void walkOutline(fz_context* ctx, fz_document* doc, fz_outline* node, const int depth,
                 std::vector<PdfDocument::OutlineItem>* out) {
  for (; node; node = node->next) {
    int page = -1;
    fz_var(page);
    fz_try(ctx) { page = fz_page_number_from_location(ctx, doc, node->page); }
    fz_catch(ctx) { page = -1; }

    out->push_back({node->title ? node->title : "", page, depth});
    if (node->down) {
      walkOutline(ctx, doc, node->down, depth + 1, out);
    }
  }
}
}  // namespace

const char* pdfErrorToString(const PdfError err) {
  switch (err) {
    case PdfError::None:
      return "no error";
    case PdfError::ContextFailed:
      return "cannot create MuPDF context";
    case PdfError::OpenFailed:
      return "cannot open document";
    case PdfError::Encrypted:
      return "document is password protected";
    case PdfError::PageFailed:
      return "cannot read page";
    case PdfError::OutOfRange:
      return "page out of range";
  }
  return "unknown";
}

PdfDocument::~PdfDocument() { close(); }

bool PdfDocument::fail(const PdfError err, const char* message) {
  lastError_ = err;
  lastMessage_ = message ? message : pdfErrorToString(err);
  return false;
}

bool PdfDocument::open(const std::string& path) {
  close();

  ctx = fz_new_context(nullptr, nullptr, FZ_STORE_DEFAULT);
  if (!ctx) {
    LOG_ERR(TAG, "Failed to create MuPDF context");
    return fail(PdfError::ContextFailed, nullptr);
  }

  bool opened = false;
  fz_var(opened);
  fz_try(ctx) {
    fz_register_document_handlers(ctx);
    doc = fz_open_document(ctx, path.c_str());
    opened = true;
  }
  fz_catch(ctx) {
    LOG_ERR(TAG, "Cannot open %s: %s", path.c_str(), fz_caught_message(ctx));
    fail(PdfError::OpenFailed, fz_caught_message(ctx));
  }
  if (!opened) {
    close();
    return false;
  }

  if (fz_needs_password(ctx, doc)) {
    LOG_ERR(TAG, "%s is password protected", path.c_str());
    close();
    return fail(PdfError::Encrypted, nullptr);
  }

  fz_try(ctx) { pages = fz_count_pages(ctx, doc); }
  fz_catch(ctx) {
    LOG_ERR(TAG, "Cannot count pages: %s", fz_caught_message(ctx));
    fail(PdfError::OpenFailed, fz_caught_message(ctx));
    pages = -1;
  }
  if (pages < 0) {
    close();
    return false;
  }

  lastError_ = PdfError::None;
  lastMessage_.clear();
  LOG_DBG(TAG, "Opened %s, %d pages", path.c_str(), pages);
  return true;
}

void PdfDocument::close() {
  if (doc) {
    fz_drop_document(ctx, doc);
    doc = nullptr;
  }
  if (ctx) {
    fz_drop_context(ctx);
    ctx = nullptr;
  }
  pages = 0;
}

bool PdfDocument::pageText(const int page, std::string* out) {
  out->clear();
  if (!doc) return fail(PdfError::OpenFailed, nullptr);
  if (page < 0 || page >= pages) return fail(PdfError::OutOfRange, nullptr);

  fz_stext_page* text = nullptr;
  fz_buffer* buffer = nullptr;
  bool ok = false;

  fz_var(ok);
  fz_var(text);
  fz_var(buffer);
  fz_try(ctx) {
    text = fz_new_stext_page_from_page_number(ctx, doc, page, nullptr);
    buffer = fz_new_buffer_from_stext_page(ctx, text);
    unsigned char* data = nullptr;
    const size_t len = fz_buffer_storage(ctx, buffer, &data);
    out->assign(reinterpret_cast<const char*>(data), len);
    ok = true;
  }
  fz_always(ctx) {
    fz_drop_buffer(ctx, buffer);
    fz_drop_stext_page(ctx, text);
  }
  fz_catch(ctx) {
    LOG_ERR(TAG, "Cannot extract text of page %d: %s", page, fz_caught_message(ctx));
    fail(PdfError::PageFailed, fz_caught_message(ctx));
  }
  return ok;
}

bool PdfDocument::pageSize(const int page, PageSize* out) {
  if (!doc) return fail(PdfError::OpenFailed, nullptr);
  if (page < 0 || page >= pages) return fail(PdfError::OutOfRange, nullptr);

  fz_page* loaded = nullptr;
  bool ok = false;

  fz_var(ok);
  fz_var(loaded);
  fz_try(ctx) {
    loaded = fz_load_page(ctx, doc, page);
    const fz_rect bounds = fz_bound_page(ctx, loaded);
    out->width = bounds.x1 - bounds.x0;
    out->height = bounds.y1 - bounds.y0;
    ok = true;
  }
  fz_always(ctx) { fz_drop_page(ctx, loaded); }
  fz_catch(ctx) {
    LOG_ERR(TAG, "Cannot load page %d: %s", page, fz_caught_message(ctx));
    fail(PdfError::PageFailed, fz_caught_message(ctx));
  }
  return ok;
}

bool PdfDocument::outline(std::vector<OutlineItem>* out) {
  out->clear();
  if (!doc) return fail(PdfError::OpenFailed, nullptr);

  fz_outline* root = nullptr;
  bool ok = false;

  fz_var(ok);
  fz_var(root);
  fz_try(ctx) {
    root = fz_load_outline(ctx, doc);
    walkOutline(ctx, doc, root, 0, out);
    ok = true;
  }
  fz_always(ctx) { fz_drop_outline(ctx, root); }
  fz_catch(ctx) {
    LOG_WRN(TAG, "Cannot load outline: %s", fz_caught_message(ctx));
    fail(PdfError::PageFailed, fz_caught_message(ctx));
  }
  return ok;
}

std::string PdfDocument::metadata(const char* key) {
  if (!doc) return "";

  char buf[512];
  int len = -1;
  fz_var(len);
  fz_try(ctx) { len = fz_lookup_metadata(ctx, doc, key, buf, sizeof(buf)); }
  fz_catch(ctx) { len = -1; }

  if (len <= 0) return "";
  return std::string(buf);
}
