#include "FileProgressStore.h"

#include <FsHelpers.h>
#include <Logging.h>
#include <Serialization.h>

#include <cstdio>
#include <cstring>
#include <fstream>
#include <functional>

#define TAG "PROGRESS"

namespace quire {

namespace {
constexpr char kMagic[4] = {'Q', 'P', 'R', 'G'};
}

std::string FileProgressStore::pathFor(const std::string& bookId) const {
  return directory + "/" + std::to_string(std::hash<std::string>{}(bookId)) + ".bin";
}

StoreStatus FileProgressStore::save(const std::string& bookId, const ReadingPosition& position) {
  if (!FsHelpers::makeDirs(directory)) {
    LOG_ERR(TAG, "Cannot create %s", directory.c_str());
    return StoreStatus::IoError;
  }

  // The live record is only replaced once the new one is fully on disk
  const std::string path = pathFor(bookId);
  const std::string tmpPath = path + ".tmp";
  {
    std::ofstream os(tmpPath, std::ios::binary | std::ios::trunc);
    if (!os) {
      LOG_ERR(TAG, "Failed to save progress to %s", tmpPath.c_str());
      return StoreStatus::IoError;
    }

    os.write(kMagic, sizeof(kMagic));
    serialization::writePod(os, FILE_VERSION);
    serialization::writeString(os, bookId);
    serialization::writePod(os, static_cast<int32_t>(position.page));
    serialization::writePod(os, static_cast<int32_t>(position.chapter));
    serialization::writePod(os, position.characterOffset);
    serialization::writePod(os, position.scrollOffset);
    serialization::writePod(os, position.progressPercentage);
    serialization::writePod(os, position.lastUpdatedMs);
    os.close();

    if (!os) {
      LOG_ERR(TAG, "Write failed for %s", tmpPath.c_str());
      std::remove(tmpPath.c_str());
      return StoreStatus::IoError;
    }
  }

  if (std::rename(tmpPath.c_str(), path.c_str()) != 0) {
    LOG_ERR(TAG, "Cannot replace %s", path.c_str());
    std::remove(tmpPath.c_str());
    return StoreStatus::IoError;
  }
  LOG_DBG(TAG, "Saved %s: page %d", bookId.c_str(), position.page);
  return StoreStatus::Ok;
}

StoreStatus FileProgressStore::load(const std::string& bookId, ReadingPosition* out) {
  const std::string path = pathFor(bookId);
  if (!FsHelpers::fileExists(path)) {
    LOG_DBG(TAG, "No saved progress for %s", bookId.c_str());
    return StoreStatus::NotFound;
  }

  std::ifstream is(path, std::ios::binary);
  if (!is) {
    LOG_ERR(TAG, "Cannot open %s", path.c_str());
    return StoreStatus::IoError;
  }

  char magic[sizeof(kMagic)];
  is.read(magic, sizeof(magic));
  uint8_t version = 0;
  if (!is.good() || memcmp(magic, kMagic, sizeof(kMagic)) != 0 || !serialization::readPodChecked(is, version) ||
      version != FILE_VERSION) {
    LOG_ERR(TAG, "Corrupted file %s (bad header)", path.c_str());
    return StoreStatus::Corrupted;
  }

  std::string storedId;
  if (!serialization::readString(is, storedId) || storedId != bookId) {
    LOG_ERR(TAG, "Corrupted file %s (book id mismatch)", path.c_str());
    return StoreStatus::Corrupted;
  }

  int32_t page = 0;
  int32_t chapter = 0;
  ReadingPosition pos;
  if (!serialization::readPodChecked(is, page) || !serialization::readPodChecked(is, chapter) ||
      !serialization::readPodChecked(is, pos.characterOffset) || !serialization::readPodChecked(is, pos.scrollOffset) ||
      !serialization::readPodChecked(is, pos.progressPercentage) ||
      !serialization::readPodChecked(is, pos.lastUpdatedMs)) {
    LOG_ERR(TAG, "Corrupted file %s (truncated)", path.c_str());
    return StoreStatus::Corrupted;
  }

  pos.page = page;
  pos.chapter = chapter;
  *out = pos;
  LOG_DBG(TAG, "Loaded %s: page %d", bookId.c_str(), pos.page);
  return StoreStatus::Ok;
}

}  // namespace quire
