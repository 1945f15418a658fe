#pragma once

#include <map>
#include <string>

#include "ProgressStore.h"

namespace quire {

class MemoryProgressStore : public ProgressStore {
 public:
  StoreStatus save(const std::string& bookId, const ReadingPosition& position) override {
    positions[bookId] = position;
    return StoreStatus::Ok;
  }

  StoreStatus load(const std::string& bookId, ReadingPosition* out) override {
    const auto it = positions.find(bookId);
    if (it == positions.end()) return StoreStatus::NotFound;
    *out = it->second;
    return StoreStatus::Ok;
  }

  size_t size() const { return positions.size(); }

 private:
  std::map<std::string, ReadingPosition> positions;
};

}  // namespace quire
