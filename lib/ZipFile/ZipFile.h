#pragma once
#include <cstdint>
#include <cstdio>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "ByteSink.h"

enum class ZipError : uint8_t {
  None = 0,
  OpenFailed,
  NotAZip,
  EntryNotFound,
  BadLocalHeader,
  UnsupportedMethod,
  TooLarge,
  ReadFailed,
  InflateFailed,
  SinkRejected,
};

const char* zipErrorToString(ZipError err);

class ZipFile {
 public:
  struct FileStatSlim {
    uint16_t method;             // Compression method
    uint32_t compressedSize;     // Compressed size
    uint32_t uncompressedSize;   // Uncompressed size
    uint32_t localHeaderOffset;  // Offset of local file header
  };

  struct ZipDetails {
    uint32_t centralDirOffset;
    uint16_t totalEntries;
    bool isSet;
  };

 private:
  std::string filePath;
  FILE* file = nullptr;
  ZipDetails zipDetails = {0, 0, false};
  // Central directory in archive order; names index into it
  std::vector<std::string> entryNames;
  std::unordered_map<std::string, FileStatSlim> fileStatSlimCache;
  ZipError lastError_ = ZipError::None;

  bool loadFileStatSlim(const char* filename, FileStatSlim* fileStat);
  long getDataOffset(const FileStatSlim& fileStat);
  bool loadZipDetails();
  bool fail(ZipError err);

 public:
  explicit ZipFile(std::string filePath) : filePath(std::move(filePath)) {}
  ~ZipFile();

  ZipFile(const ZipFile&) = delete;
  ZipFile& operator=(const ZipFile&) = delete;

  // The archive can be held open across several reads; every read opens and closes it as needed otherwise
  bool isOpen() const { return file != nullptr; }
  bool open();
  void close();

  // Reads the whole central directory into memory. Later lookups don't touch the disk.
  bool loadAllFileStatSlims();
  uint16_t getTotalEntries();
  const std::vector<std::string>& getEntryNames() const { return entryNames; }
  bool getInflatedFileSize(const char* filename, size_t* size);

  // Reads one entry into `out`. Entries whose inflated size exceeds maxSize fail with TooLarge.
  bool readFileToString(const char* filename, std::string* out, size_t maxSize = SIZE_MAX);
  bool readFileToStream(const char* filename, ByteSink& out, size_t chunkSize);

  ZipError lastError() const { return lastError_; }
};
