#include "FormatSniffer.h"

#include <FsHelpers.h>
#include <Logging.h>

#include <cstdint>
#include <cstring>

#include "../core/Types.h"

#define TAG "SNIFF"

namespace quire {

namespace {
constexpr char kPdfMagic[] = "%PDF-";
constexpr uint8_t kZipLocalMagic[] = {'P', 'K', 0x03, 0x04};
constexpr char kMimetypeName[] = "mimetype";
constexpr char kEpubMime[] = "application/epub+zip";
constexpr size_t kLocalHeaderSize = 30;

uint16_t le16(const uint8_t* p) { return static_cast<uint16_t>(p[0] | (p[1] << 8)); }
}  // namespace

bool FormatSniffer::looksLikePdf(const std::string& path) {
  uint8_t header[Defaults::SniffBytes];
  const long got = FsHelpers::readHeader(path, header, sizeof(header));
  if (got < 0) {
    LOG_DBG(TAG, "Cannot read %s", path.c_str());
    return false;
  }

  const size_t magicLen = sizeof(kPdfMagic) - 1;
  const size_t len = static_cast<size_t>(got);
  for (size_t i = 0; i + magicLen <= len; i++) {
    if (memcmp(header + i, kPdfMagic, magicLen) == 0) return true;
  }
  return false;
}

bool FormatSniffer::looksLikeEpub(const std::string& path) {
  uint8_t header[Defaults::SniffBytes];
  const long got = FsHelpers::readHeader(path, header, sizeof(header));
  if (got < static_cast<long>(kLocalHeaderSize)) {
    LOG_DBG(TAG, "Cannot read a zip header from %s", path.c_str());
    return false;
  }
  if (memcmp(header, kZipLocalMagic, sizeof(kZipLocalMagic)) != 0) return false;

  // EPUB OCF: first entry is an uncompressed "mimetype"
  const uint16_t method = le16(header + 8);
  const uint16_t nameLen = le16(header + 26);
  const uint16_t extraLen = le16(header + 28);
  const size_t dataOffset = kLocalHeaderSize + nameLen + extraLen;
  const size_t mimeLen = sizeof(kEpubMime) - 1;

  if (method == 0 && nameLen == sizeof(kMimetypeName) - 1 &&
      memcmp(header + kLocalHeaderSize, kMimetypeName, nameLen) == 0 &&
      dataOffset + mimeLen <= static_cast<size_t>(got) && memcmp(header + dataOffset, kEpubMime, mimeLen) == 0) {
    return true;
  }

  return FsHelpers::isEpubFile(path);
}

}  // namespace quire
