#include "ProgressStore.h"

namespace quire {

const char* storeStatusToString(const StoreStatus status) {
  switch (status) {
    case StoreStatus::Ok:
      return "ok";
    case StoreStatus::NotFound:
      return "no saved progress";
    case StoreStatus::IoError:
      return "I/O error";
    case StoreStatus::Corrupted:
      return "corrupted progress record";
  }
  return "unknown";
}

}  // namespace quire
