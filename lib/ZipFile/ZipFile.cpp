#include "ZipFile.h"

#include <InflateReader.h>
#include <Logging.h>

#include <cstddef>
#include <cstring>
#include <memory>

#define TAG "ZIP"

namespace {
constexpr uint16_t ZIP_METHOD_STORED = 0;
constexpr uint16_t ZIP_METHOD_DEFLATED = 8;
constexpr uint32_t CENTRAL_DIR_SIG = 0x02014b50;
constexpr uint32_t LOCAL_HEADER_SIG = 0x04034b50;
constexpr size_t CENTRAL_HEADER_SIZE = 46;
constexpr size_t LOCAL_HEADER_SIZE = 30;
constexpr size_t EOCD_MIN_SIZE = 22;

uint16_t le16(const uint8_t* p) { return static_cast<uint16_t>(p[0] | (p[1] << 8)); }

uint32_t le32(const uint8_t* p) {
  return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) | (static_cast<uint32_t>(p[2]) << 16) |
         (static_cast<uint32_t>(p[3]) << 24);
}

// Walks the central directory, calling fn(name, stat) for each entry until it returns false
template <typename Fn>
bool walkCentralDirectory(FILE* file, const uint32_t offset, Fn fn) {
  if (fseek(file, static_cast<long>(offset), SEEK_SET) != 0) return false;

  uint8_t header[CENTRAL_HEADER_SIZE];
  std::string itemName;
  while (fread(header, 1, CENTRAL_HEADER_SIZE, file) == CENTRAL_HEADER_SIZE) {
    if (le32(header) != CENTRAL_DIR_SIG) break;  // End of list

    ZipFile::FileStatSlim fileStat = {};
    fileStat.method = le16(header + 10);
    fileStat.compressedSize = le32(header + 20);
    fileStat.uncompressedSize = le32(header + 24);
    const uint16_t nameLen = le16(header + 28);
    const uint16_t extraLen = le16(header + 30);
    const uint16_t commentLen = le16(header + 32);
    fileStat.localHeaderOffset = le32(header + 42);

    itemName.resize(nameLen);
    if (nameLen > 0 && fread(&itemName[0], 1, nameLen, file) != nameLen) return false;

    if (!fn(itemName, fileStat)) return true;

    // Skip the rest of this entry (extra field + comment)
    if (fseek(file, extraLen + commentLen, SEEK_CUR) != 0) return false;
  }
  return true;
}
}  // namespace

const char* zipErrorToString(const ZipError err) {
  switch (err) {
    case ZipError::None:
      return "no error";
    case ZipError::OpenFailed:
      return "cannot open archive";
    case ZipError::NotAZip:
      return "not a zip archive";
    case ZipError::EntryNotFound:
      return "entry not found";
    case ZipError::BadLocalHeader:
      return "bad local file header";
    case ZipError::UnsupportedMethod:
      return "unsupported compression method";
    case ZipError::TooLarge:
      return "entry too large";
    case ZipError::ReadFailed:
      return "read failed";
    case ZipError::InflateFailed:
      return "decompression failed";
    case ZipError::SinkRejected:
      return "output rejected";
  }
  return "unknown";
}

ZipFile::~ZipFile() { close(); }

bool ZipFile::fail(const ZipError err) {
  lastError_ = err;
  return false;
}

bool ZipFile::open() {
  if (file) return true;
  file = fopen(filePath.c_str(), "rb");
  if (!file) {
    LOG_DBG(TAG, "Cannot open %s", filePath.c_str());
    return fail(ZipError::OpenFailed);
  }
  return true;
}

void ZipFile::close() {
  if (file) {
    fclose(file);
    file = nullptr;
  }
}

bool ZipFile::loadAllFileStatSlims() {
  const bool wasOpen = isOpen();
  if (!wasOpen && !open()) {
    return false;
  }

  if (!loadZipDetails()) {
    if (!wasOpen) close();
    return false;
  }

  fileStatSlimCache.clear();
  fileStatSlimCache.reserve(zipDetails.totalEntries);
  entryNames.clear();
  entryNames.reserve(zipDetails.totalEntries);

  const bool walked = walkCentralDirectory(file, zipDetails.centralDirOffset,
                                           [this](const std::string& name, const FileStatSlim& stat) {
                                             if (fileStatSlimCache.emplace(name, stat).second) {
                                               entryNames.push_back(name);
                                             }
                                             return true;
                                           });

  if (!wasOpen) close();
  if (!walked) {
    LOG_ERR(TAG, "Central directory is truncated");
    return fail(ZipError::NotAZip);
  }
  return true;
}

bool ZipFile::loadFileStatSlim(const char* filename, FileStatSlim* fileStat) {
  if (!fileStatSlimCache.empty()) {
    const auto it = fileStatSlimCache.find(filename);
    if (it != fileStatSlimCache.end()) {
      *fileStat = it->second;
      return true;
    }
    return fail(ZipError::EntryNotFound);
  }

  const bool wasOpen = isOpen();
  if (!wasOpen && !open()) {
    return false;
  }

  if (!loadZipDetails()) {
    if (!wasOpen) close();
    return false;
  }

  bool found = false;
  walkCentralDirectory(file, zipDetails.centralDirOffset, [&](const std::string& name, const FileStatSlim& stat) {
    if (name == filename) {
      *fileStat = stat;
      found = true;
      return false;
    }
    return true;
  });

  if (!wasOpen) close();
  return found ? true : fail(ZipError::EntryNotFound);
}

long ZipFile::getDataOffset(const FileStatSlim& fileStat) {
  uint8_t pLocalHeader[LOCAL_HEADER_SIZE];
  if (fseek(file, static_cast<long>(fileStat.localHeaderOffset), SEEK_SET) != 0 ||
      fread(pLocalHeader, 1, LOCAL_HEADER_SIZE, file) != LOCAL_HEADER_SIZE) {
    LOG_ERR(TAG, "Something went wrong reading the local header");
    fail(ZipError::ReadFailed);
    return -1;
  }

  if (le32(pLocalHeader) != LOCAL_HEADER_SIG) {
    LOG_ERR(TAG, "Not a valid zip file header");
    fail(ZipError::BadLocalHeader);
    return -1;
  }

  const uint16_t filenameLength = le16(pLocalHeader + 26);
  const uint16_t extraOffset = le16(pLocalHeader + 28);
  return static_cast<long>(fileStat.localHeaderOffset + LOCAL_HEADER_SIZE + filenameLength + extraOffset);
}

bool ZipFile::loadZipDetails() {
  if (zipDetails.isSet) {
    return true;
  }

  if (fseek(file, 0, SEEK_END) != 0) {
    return fail(ZipError::ReadFailed);
  }
  const long fileSize = ftell(file);
  if (fileSize < static_cast<long>(EOCD_MIN_SIZE)) {
    LOG_ERR(TAG, "File too small to be a valid zip");
    return fail(ZipError::NotAZip);
  }

  // We scan the last 1KB (or the whole file if smaller) for the EOCD signature
  const long scanRange = fileSize > 1024 ? 1024 : fileSize;
  std::unique_ptr<uint8_t[]> buffer(new uint8_t[scanRange]);

  if (fseek(file, fileSize - scanRange, SEEK_SET) != 0 ||
      fread(buffer.get(), 1, scanRange, file) != static_cast<size_t>(scanRange)) {
    return fail(ZipError::ReadFailed);
  }

  // Scan backwards for the signature
  long foundOffset = -1;
  for (long i = scanRange - static_cast<long>(EOCD_MIN_SIZE); i >= 0; i--) {
    constexpr uint8_t signature[4] = {0x50, 0x4b, 0x05, 0x06};  // Little-endian EOCD signature
    if (memcmp(&buffer[i], signature, 4) == 0) {
      foundOffset = i;
      break;
    }
  }

  if (foundOffset == -1) {
    LOG_ERR(TAG, "EOCD signature not found in zip file");
    return fail(ZipError::NotAZip);
  }

  // Offset 10: total number of entries, offset 16: start of the central directory
  zipDetails.totalEntries = le16(&buffer[foundOffset + 10]);
  zipDetails.centralDirOffset = le32(&buffer[foundOffset + 16]);
  if (static_cast<long>(zipDetails.centralDirOffset) >= fileSize) {
    LOG_ERR(TAG, "Central directory offset %u is past the end of the file", zipDetails.centralDirOffset);
    return fail(ZipError::NotAZip);
  }
  zipDetails.isSet = true;
  return true;
}

uint16_t ZipFile::getTotalEntries() {
  if (!zipDetails.isSet) {
    const bool wasOpen = isOpen();
    if (!wasOpen && !open()) return 0;
    loadZipDetails();
    if (!wasOpen) close();
  }
  return zipDetails.totalEntries;
}

bool ZipFile::getInflatedFileSize(const char* filename, size_t* size) {
  FileStatSlim fileStat = {};
  if (!loadFileStatSlim(filename, &fileStat)) {
    return false;
  }

  *size = static_cast<size_t>(fileStat.uncompressedSize);
  return true;
}

bool ZipFile::readFileToString(const char* filename, std::string* out, const size_t maxSize) {
  size_t inflatedSize = 0;
  if (!getInflatedFileSize(filename, &inflatedSize)) {
    return false;
  }
  if (inflatedSize > maxSize) {
    LOG_ERR(TAG, "%s inflates to %zu bytes, limit is %zu", filename, inflatedSize, maxSize);
    return fail(ZipError::TooLarge);
  }

  out->clear();
  out->reserve(inflatedSize);
  StringSink sink(*out, maxSize);
  return readFileToStream(filename, sink, 4096);
}

bool ZipFile::readFileToStream(const char* filename, ByteSink& out, const size_t chunkSize) {
  const bool wasOpen = isOpen();
  if (!wasOpen && !open()) {
    return false;
  }

  FileStatSlim fileStat = {};
  if (!loadFileStatSlim(filename, &fileStat)) {
    if (!wasOpen) close();
    return false;
  }

  const long fileOffset = getDataOffset(fileStat);
  if (fileOffset < 0 || fseek(file, fileOffset, SEEK_SET) != 0) {
    if (!wasOpen) close();
    return false;
  }

  const auto deflatedDataSize = fileStat.compressedSize;
  const auto inflatedDataSize = fileStat.uncompressedSize;

  if (fileStat.method == ZIP_METHOD_STORED) {
    std::unique_ptr<uint8_t[]> buffer(new uint8_t[chunkSize]);

    size_t remaining = inflatedDataSize;
    while (remaining > 0) {
      const size_t dataRead = fread(buffer.get(), 1, remaining < chunkSize ? remaining : chunkSize, file);
      if (dataRead == 0) {
        LOG_ERR(TAG, "Could not read more bytes");
        if (!wasOpen) close();
        return fail(ZipError::ReadFailed);
      }

      if (out.write(buffer.get(), dataRead) != dataRead) {
        LOG_ERR(TAG, "Failed to write all output bytes to stream");
        if (!wasOpen) close();
        return fail(ZipError::SinkRejected);
      }
      remaining -= dataRead;
    }

    if (!wasOpen) close();
    return true;
  }

  if (fileStat.method == ZIP_METHOD_DEFLATED) {
    std::unique_ptr<uint8_t[]> outputBuffer(new uint8_t[chunkSize]);

    InflateReader reader;
    if (!reader.begin(file, deflatedDataSize, chunkSize)) {
      LOG_ERR(TAG, "Failed to init inflate reader");
      if (!wasOpen) close();
      return fail(ZipError::InflateFailed);
    }

    ZipError result = ZipError::InflateFailed;
    size_t totalProduced = 0;

    while (true) {
      size_t produced;
      const InflateStatus status = reader.readAtMost(outputBuffer.get(), chunkSize, &produced);

      totalProduced += produced;
      if (totalProduced > static_cast<size_t>(inflatedDataSize)) {
        LOG_ERR(TAG, "Decompressed size exceeds expected (%zu > %zu)", totalProduced,
                static_cast<size_t>(inflatedDataSize));
        break;
      }

      if (produced > 0 && out.write(outputBuffer.get(), produced) != produced) {
        LOG_ERR(TAG, "Failed to write all output bytes to stream");
        result = ZipError::SinkRejected;
        break;
      }

      if (status == InflateStatus::Done) {
        if (totalProduced != static_cast<size_t>(inflatedDataSize)) {
          LOG_ERR(TAG, "Decompressed size mismatch (expected %zu, got %zu)", static_cast<size_t>(inflatedDataSize),
                  totalProduced);
          break;
        }
        LOG_DBG(TAG, "Decompressed %u bytes into %u bytes", deflatedDataSize, inflatedDataSize);
        result = ZipError::None;
        break;
      }

      if (status == InflateStatus::Error) {
        LOG_ERR(TAG, "Decompression failed");
        break;
      }
    }

    if (!wasOpen) close();
    return result == ZipError::None ? true : fail(result);
  }

  if (!wasOpen) close();

  LOG_ERR(TAG, "Unsupported compression method %u", fileStat.method);
  return fail(ZipError::UnsupportedMethod);
}
