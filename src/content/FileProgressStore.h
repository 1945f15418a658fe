#pragma once

#include <cstdint>
#include <string>
#include <utility>

#include "ProgressStore.h"

namespace quire {

// One binary record per book under `directory`, named after a hash of the book id.
//
// Layout: "QPRG" | version u8 | bookId (u32 length + bytes) | page i32 | chapter i32 |
//         characterOffset i64 | scrollOffset f64 | progressPercentage f64 | lastUpdatedMs i64
class FileProgressStore : public ProgressStore {
 public:
  static constexpr uint8_t FILE_VERSION = 1;

  explicit FileProgressStore(std::string directory) : directory(std::move(directory)) {}

  StoreStatus save(const std::string& bookId, const ReadingPosition& position) override;
  StoreStatus load(const std::string& bookId, ReadingPosition* out) override;

  std::string pathFor(const std::string& bookId) const;

 private:
  std::string directory;
};

}  // namespace quire
