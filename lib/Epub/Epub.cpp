#include "Epub.h"

#include <FsHelpers.h>
#include <Logging.h>
#include <ZipFile.h>

#include "Epub/parsers/ContainerParser.h"
#include "Epub/parsers/ContentOpfParser.h"
#include "Epub/parsers/TocNavParser.h"
#include "Epub/parsers/TocNcxParser.h"
#include "Epub/parsers/XhtmlTextParser.h"

#define TAG "EBP"

namespace {
constexpr char CONTAINER_PATH[] = "META-INF/container.xml";

std::string trimmed(const std::string& s) {
  const char* ws = " \t\r\n";
  const size_t first = s.find_first_not_of(ws);
  if (first == std::string::npos) return "";
  return s.substr(first, s.find_last_not_of(ws) - first + 1);
}

int hexValue(const char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

// Manifest hrefs are URLs, archive entries are not: "Text/chapter%201.xhtml"
std::string percentDecode(const std::string& href) {
  std::string out;
  out.reserve(href.size());
  for (size_t i = 0; i < href.size(); i++) {
    if (href[i] == '%' && i + 2 < href.size()) {
      const int hi = hexValue(href[i + 1]);
      const int lo = hexValue(href[i + 2]);
      if (hi >= 0 && lo >= 0) {
        out += static_cast<char>((hi << 4) | lo);
        i += 2;
        continue;
      }
    }
    out += href[i];
  }
  return out;
}
}  // namespace

const char* epubErrorToString(const EpubError err) {
  switch (err) {
    case EpubError::None:
      return "no error";
    case EpubError::OpenFailed:
      return "cannot open file";
    case EpubError::NotAZip:
      return "not a zip archive";
    case EpubError::MissingContainer:
      return "missing META-INF/container.xml";
    case EpubError::MissingPackage:
      return "missing package document";
    case EpubError::BadPackage:
      return "malformed package document";
    case EpubError::EmptySpine:
      return "spine has no readable items";
    case EpubError::ItemMissing:
      return "item missing from archive";
    case EpubError::TooLarge:
      return "item too large";
    case EpubError::ParseFailed:
      return "malformed content";
  }
  return "unknown";
}

Epub::Epub(std::string filepath, const size_t maxItemSize) : filepath(std::move(filepath)), maxItemSize(maxItemSize) {}

Epub::~Epub() { close(); }

bool Epub::fail(const EpubError err) {
  lastError_ = err;
  return false;
}

EpubError Epub::itemError() const {
  switch (zip ? zip->lastError() : ZipError::OpenFailed) {
    case ZipError::OpenFailed:
      return EpubError::OpenFailed;
    case ZipError::NotAZip:
      return EpubError::NotAZip;
    case ZipError::EntryNotFound:
      return EpubError::ItemMissing;
    case ZipError::TooLarge:
      return EpubError::TooLarge;
    default:
      return EpubError::ParseFailed;
  }
}

bool Epub::findContentOpfFile(std::string* contentOpfFile) {
  size_t containerSize;

  if (!getItemSize(CONTAINER_PATH, &containerSize)) {
    LOG_ERR(TAG, "Could not find or size META-INF/container.xml");
    return fail(EpubError::MissingContainer);
  }

  ContainerParser containerParser(containerSize);
  if (!containerParser.setup()) {
    return fail(EpubError::ParseFailed);
  }

  if (!readItemContentsToStream(CONTAINER_PATH, containerParser, 512)) {
    LOG_ERR(TAG, "Could not read META-INF/container.xml");
    return fail(EpubError::MissingContainer);
  }

  if (containerParser.fullPath.empty()) {
    LOG_ERR(TAG, "Could not find valid rootfile in container.xml");
    return fail(EpubError::MissingContainer);
  }

  *contentOpfFile = std::move(containerParser.fullPath);
  return true;
}

bool Epub::parseContentOpf() {
  std::string contentOpfFilePath;
  if (!findContentOpfFile(&contentOpfFilePath)) {
    return false;
  }

  contentBasePath = FsHelpers::parentDir(contentOpfFilePath);
  LOG_DBG(TAG, "Parsing content.opf: %s", contentOpfFilePath.c_str());

  size_t contentOpfSize;
  if (!getItemSize(contentOpfFilePath, &contentOpfSize)) {
    LOG_ERR(TAG, "Could not find package document %s", contentOpfFilePath.c_str());
    return fail(EpubError::MissingPackage);
  }

  ContentOpfParser opfParser(contentBasePath, contentOpfSize, &index);
  if (!opfParser.setup()) {
    return fail(EpubError::ParseFailed);
  }

  if (!readItemContentsToStream(contentOpfFilePath, opfParser, 1024) || opfParser.failed()) {
    LOG_ERR(TAG, "Could not parse content.opf");
    return fail(opfParser.failed() ? EpubError::BadPackage : itemError());
  }

  metadata.title = trimmed(opfParser.title);
  metadata.author = trimmed(opfParser.author);
  metadata.language = trimmed(opfParser.language);
  metadata.identifier = trimmed(opfParser.identifier);
  metadata.publisher = trimmed(opfParser.publisher);
  metadata.subject = trimmed(opfParser.subject);
  tocNcxItem = opfParser.tocNcxPath;
  tocNavItem = opfParser.tocNavPath;

  LOG_DBG(TAG, "Successfully parsed content.opf, %d spine items", getSpineItemsCount());
  return true;
}

bool Epub::parseTocNcxFile() {
  // the ncx file should have been specified in the content.opf file
  if (tocNcxItem.empty()) {
    LOG_DBG(TAG, "No ncx file specified");
    return false;
  }

  size_t ncxSize;
  if (!getItemSize(tocNcxItem, &ncxSize)) {
    LOG_WRN(TAG, "NCX %s listed but missing", tocNcxItem.c_str());
    return false;
  }

  // NCX hrefs are relative to the NCX itself
  const std::string ncxBasePath = FsHelpers::parentDir(tocNcxItem);
  TocNcxParser ncxParser(ncxBasePath, ncxSize, &index);
  if (!ncxParser.setup()) {
    return false;
  }

  if (!readItemContentsToStream(tocNcxItem, ncxParser, 1024) || ncxParser.failed()) {
    LOG_WRN(TAG, "Could not process toc ncx data");
    index.clearToc();
    return false;
  }

  LOG_DBG(TAG, "Parsed %d TOC items from ncx", getTocItemsCount());
  return true;
}

bool Epub::parseTocNavFile() {
  // the nav file should have been specified in the content.opf file (EPUB 3)
  if (tocNavItem.empty()) {
    LOG_DBG(TAG, "No nav file specified");
    return false;
  }

  size_t navSize;
  if (!getItemSize(tocNavItem, &navSize)) {
    LOG_WRN(TAG, "Nav document %s listed but missing", tocNavItem.c_str());
    return false;
  }

  // The nav document may live in a different folder than the OPF and its hrefs are relative to itself
  const std::string navBasePath = FsHelpers::parentDir(tocNavItem);
  TocNavParser navParser(navBasePath, navSize, &index);
  if (!navParser.setup()) {
    return false;
  }

  if (!readItemContentsToStream(tocNavItem, navParser, 1024) || navParser.failed()) {
    LOG_WRN(TAG, "Could not process toc nav data");
    index.clearToc();
    return false;
  }

  LOG_DBG(TAG, "Parsed %d TOC items from nav", getTocItemsCount());
  return true;
}

bool Epub::load() {
  close();
  lastError_ = EpubError::None;
  index.clear();
  metadata = Metadata();
  LOG_DBG(TAG, "Loading ePub: %s", filepath.c_str());

  zip.reset(new ZipFile(filepath));
  if (!zip->open()) {
    zip.reset();
    return fail(EpubError::OpenFailed);
  }
  if (!zip->loadAllFileStatSlims()) {
    zip.reset();
    return fail(EpubError::NotAZip);
  }

  if (!parseContentOpf()) {
    LOG_ERR(TAG, "Could not parse content.opf: %s", epubErrorToString(lastError_));
    zip.reset();
    return false;
  }

  if (index.spine().empty()) {
    LOG_ERR(TAG, "Spine is empty");
    zip.reset();
    return fail(EpubError::EmptySpine);
  }

  // EPUB 3 nav first, NCX as fallback. A book without either still opens.
  if (!parseTocNavFile() || getTocItemsCount() == 0) {
    index.clearToc();
    parseTocNcxFile();
  }

  LOG_INF(TAG, "Loaded ePub: %s (%d spine items, %d toc entries)", filepath.c_str(), getSpineItemsCount(),
          getTocItemsCount());
  return true;
}

void Epub::close() {
  if (zip) {
    zip->close();
    zip.reset();
  }
}

bool Epub::getItemSize(const std::string& itemHref, size_t* size) {
  if (!zip) return fail(EpubError::OpenFailed);
  if (zip->getInflatedFileSize(itemHref.c_str(), size)) return true;
  const std::string decoded = percentDecode(itemHref);
  return decoded != itemHref && zip->getInflatedFileSize(decoded.c_str(), size);
}

bool Epub::readItemContentsToStream(const std::string& itemHref, ByteSink& out, const size_t chunkSize) {
  if (!zip) return fail(EpubError::OpenFailed);

  size_t ignored;
  const std::string path = zip->getInflatedFileSize(itemHref.c_str(), &ignored) ? itemHref : percentDecode(itemHref);
  if (!zip->readFileToStream(path.c_str(), out, chunkSize)) {
    return fail(itemError());
  }
  return true;
}

bool Epub::readItemContentsToString(const std::string& itemHref, std::string* out) {
  if (!zip) return fail(EpubError::OpenFailed);

  size_t ignored;
  const std::string path = zip->getInflatedFileSize(itemHref.c_str(), &ignored) ? itemHref : percentDecode(itemHref);
  if (!zip->readFileToString(path.c_str(), out, maxItemSize)) {
    return fail(itemError());
  }
  return true;
}

bool Epub::extractSpineItemText(const int spineIndex, std::string* out) {
  out->clear();
  if (spineIndex < 0 || spineIndex >= getSpineItemsCount()) {
    return fail(EpubError::ItemMissing);
  }

  const std::string& href = getSpineItem(spineIndex).href;
  size_t itemSize;
  if (!getItemSize(href, &itemSize)) {
    LOG_ERR(TAG, "Spine item %d (%s) missing from archive", spineIndex, href.c_str());
    return fail(EpubError::ItemMissing);
  }
  if (itemSize > maxItemSize) {
    LOG_ERR(TAG, "Spine item %d is %zu bytes, limit is %zu", spineIndex, itemSize, maxItemSize);
    return fail(EpubError::TooLarge);
  }

  XhtmlTextParser textParser(*out, itemSize, maxItemSize);
  if (!textParser.setup()) {
    return fail(EpubError::ParseFailed);
  }

  if (!readItemContentsToStream(href, textParser, 1024) || textParser.failed()) {
    LOG_ERR(TAG, "Could not extract text of spine item %d (%s)", spineIndex, href.c_str());
    return fail(textParser.failed() ? EpubError::ParseFailed : lastError_);
  }

  textParser.finish();
  return true;
}
