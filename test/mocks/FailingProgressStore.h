#pragma once

#include "content/ProgressStore.h"

// Progress store whose every call returns a fixed status
class FailingProgressStore : public quire::ProgressStore {
 public:
  explicit FailingProgressStore(const quire::StoreStatus status) : status(status) {}

  quire::StoreStatus save(const std::string& /*bookId*/, const quire::ReadingPosition& /*position*/) override {
    saves++;
    return status;
  }

  quire::StoreStatus load(const std::string& /*bookId*/, quire::ReadingPosition* /*out*/) override {
    loads++;
    return status;
  }

  int saves = 0;
  int loads = 0;

 private:
  quire::StoreStatus status;
};
