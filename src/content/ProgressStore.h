#pragma once

#include <cstdint>
#include <string>

#include "ReaderEntities.h"

namespace quire {

enum class StoreStatus : uint8_t {
  Ok = 0,
  NotFound,
  IoError,
  Corrupted,
};

const char* storeStatusToString(StoreStatus status);

// Persists one reading position per book id
class ProgressStore {
 public:
  virtual ~ProgressStore() = default;

  virtual StoreStatus save(const std::string& bookId, const ReadingPosition& position) = 0;
  // `out` is only written on Ok
  virtual StoreStatus load(const std::string& bookId, ReadingPosition* out) = 0;
};

}  // namespace quire
