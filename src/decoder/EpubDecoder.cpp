#include "EpubDecoder.h"

#include <FsHelpers.h>
#include <Logging.h>

#include "../content/FormatSniffer.h"

#define TAG "EPUBDEC"

namespace quire {

namespace {
DecodeError mapEpubError(const EpubError err) {
  switch (err) {
    case EpubError::None:
      return DecodeError::Ok;
    case EpubError::OpenFailed:
      return DecodeError::IoError;
    case EpubError::NotAZip:
      return DecodeError::CorruptHeader;
    case EpubError::TooLarge:
      return DecodeError::TooLarge;
    case EpubError::MissingContainer:
    case EpubError::MissingPackage:
    case EpubError::BadPackage:
    case EpubError::EmptySpine:
    case EpubError::ItemMissing:
    case EpubError::ParseFailed:
      return DecodeError::ParseFailed;
  }
  return DecodeError::ParseFailed;
}
}  // namespace

EpubDecoder::~EpubDecoder() {
  if (epub) epub->close();
}

bool EpubDecoder::probe(const std::string& path) const { return FormatSniffer::looksLikeEpub(path); }

DecodeStatus EpubDecoder::open(const std::string& path) {
  if (epub) close();

  if (!FsHelpers::fileExists(path)) {
    return DecodeStatus::failure(DecodeError::FileNotFound, path);
  }

  uint8_t magic[4];
  const long got = FsHelpers::readHeader(path, magic, sizeof(magic));
  if (got < 0) {
    return DecodeStatus::failure(DecodeError::IoError, "cannot read " + path);
  }
  if (got < static_cast<long>(sizeof(magic)) || magic[0] != 'P' || magic[1] != 'K') {
    return DecodeStatus::failure(DecodeError::CorruptHeader, "not a zip archive");
  }

  std::unique_ptr<Epub> book(new Epub(path, maxEntryBytes));
  if (!book->load()) {
    const EpubError err = book->lastError();
    LOG_ERR(TAG, "Cannot load %s: %s", path.c_str(), epubErrorToString(err));
    return DecodeStatus::failure(mapEpubError(err), epubErrorToString(err));
  }

  const int chapters = book->getSpineItemsCount();
  std::vector<std::string> texts(chapters);
  std::vector<DecodeError> status(chapters, DecodeError::Ok);
  int failedCount = 0;

  for (int i = 0; i < chapters; i++) {
    if (book->extractSpineItemText(i, &texts[i])) continue;

    const EpubError err = book->lastError();
    if (err == EpubError::TooLarge) {
      LOG_ERR(TAG, "Chapter %d exceeds %zu bytes", i, maxEntryBytes);
      book->close();
      return DecodeStatus::failure(DecodeError::TooLarge, "chapter " + std::to_string(i) + " exceeds entry limit");
    }
    LOG_ERR(TAG, "Chapter %d unreadable: %s", i, epubErrorToString(err));
    texts[i].clear();
    status[i] = mapEpubError(err);
    failedCount++;
  }

  if (failedCount == chapters) {
    book->close();
    return DecodeStatus::failure(DecodeError::NoContent, "no readable chapter");
  }

  epub = std::move(book);
  chapterText = std::move(texts);
  chapterStatus = std::move(status);
  LOG_DBG(TAG, "Extracted %d chapters (%d failed)", chapters, failedCount);
  return DecodeStatus::success();
}

DecodeStatus EpubDecoder::close() {
  if (epub) {
    epub->close();
    epub.reset();
  }
  chapterText.clear();
  chapterStatus.clear();
  return DecodeStatus::success();
}

DecodeStatus EpubDecoder::unitText(const int index, std::string* out) {
  if (!epub) return DecodeStatus::failure(DecodeError::NoContent, "no document");
  if (index < 0 || index >= unitCount()) {
    return DecodeStatus::failure(DecodeError::OutOfRange, "chapter " + std::to_string(index));
  }
  if (chapterStatus[index] != DecodeError::Ok) {
    return DecodeStatus::failure(DecodeError::ParseFailed, "chapter " + std::to_string(index) + " is unreadable");
  }
  *out = chapterText[index];
  return DecodeStatus::success();
}

DecodeStatus EpubDecoder::tableOfContents(std::vector<DecodedTocEntry>* out) {
  out->clear();
  if (!epub) return DecodeStatus::failure(DecodeError::NoContent, "no document");

  for (int i = 0; i < epub->getTocItemsCount(); i++) {
    const BookIndex::TocEntry& entry = epub->getTocItem(i);
    if (entry.spineIndex < 0) {
      LOG_DBG(TAG, "Skipping TOC entry '%s', target not in spine", entry.title.c_str());
      continue;
    }
    out->push_back({entry.title, entry.spineIndex, entry.depth > 0 ? entry.depth - 1 : 0});
  }
  return DecodeStatus::success();
}

DecodedMetadata EpubDecoder::metadata() const {
  DecodedMetadata meta;
  if (!epub) return meta;

  const Epub::Metadata& m = epub->getMetadata();
  meta.title = m.title;
  meta.author = m.author;
  meta.subject = m.subject;
  meta.language = m.language;
  meta.identifier = m.identifier;
  meta.creator = m.author;
  meta.producer = m.publisher;
  return meta;
}

std::string EpubDecoder::unitHref(const int index) const {
  if (!epub || index < 0 || index >= epub->getSpineItemsCount()) return "";
  return epub->getSpineItem(index).href;
}

}  // namespace quire
