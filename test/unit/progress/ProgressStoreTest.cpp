#include "test_utils.h"

#include <FsHelpers.h>

#include <fstream>
#include <iterator>
#include <string>

#include "ZipFixture.h"
#include "content/FileProgressStore.h"
#include "content/MemoryProgressStore.h"

using namespace quire;

static ReadingPosition samplePosition() {
  ReadingPosition pos;
  pos.page = 12;
  pos.chapter = 11;
  pos.characterOffset = 40213;
  pos.scrollOffset = 0.25;
  pos.progressPercentage = 0.48;
  pos.lastUpdatedMs = 1760000000123;
  return pos;
}

int main() {
  TestUtils::TestRunner runner("ProgressStore");

  // ---- File store round trip ----
  {
    const std::string dir = makeTempDir("quire_progress_") + "/nested/records";
    FileProgressStore store(dir);

    ReadingPosition loaded;
    runner.expectTrue(store.load("book-1", &loaded) == StoreStatus::NotFound, "load before save: NotFound");

    runner.expectTrue(store.save("book-1", samplePosition()) == StoreStatus::Ok, "save creates directories");
    runner.expectTrue(FsHelpers::fileExists(store.pathFor("book-1")), "record file written");
    runner.expectTrue(store.load("book-1", &loaded) == StoreStatus::Ok, "load after save: Ok");
    runner.expectTrue(loaded == samplePosition(), "every field survives the round trip");

    ReadingPosition later = samplePosition();
    later.page = 13;
    later.chapter = 12;
    store.save("book-1", later);
    store.load("book-1", &loaded);
    runner.expectEq(13, loaded.page, "save overwrites the previous record");

    store.save("book-2", samplePosition());
    store.load("book-1", &loaded);
    runner.expectEq(13, loaded.page, "records are kept per book");
  }

  // ---- Corrupt records ----
  {
    const std::string dir = makeTempDir("quire_progress_bad_");
    FileProgressStore store(dir);
    ReadingPosition loaded;

    writeFile(store.pathFor("garbage"), "not a progress record");
    runner.expectTrue(store.load("garbage", &loaded) == StoreStatus::Corrupted, "bad magic: Corrupted");

    store.save("truncated", samplePosition());
    {
      std::ifstream in(store.pathFor("truncated"), std::ios::binary);
      std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
      writeFile(store.pathFor("truncated"), bytes.substr(0, bytes.size() - 6));
    }
    runner.expectTrue(store.load("truncated", &loaded) == StoreStatus::Corrupted, "truncated record: Corrupted");

    // A record stored under another id at this path
    store.save("other", samplePosition());
    {
      std::ifstream in(store.pathFor("other"), std::ios::binary);
      std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
      writeFile(store.pathFor("impostor"), bytes);
    }
    runner.expectTrue(store.load("impostor", &loaded) == StoreStatus::Corrupted, "book id mismatch: Corrupted");
  }

  // ---- Replacing a record ----
  {
    const std::string dir = makeTempDir("quire_progress_swap_");
    FileProgressStore store(dir);
    const std::string path = store.pathFor("book");
    runner.expectTrue(store.save("book", samplePosition()) == StoreStatus::Ok, "swap: first save");
    runner.expectFalse(FsHelpers::fileExists(path + ".tmp"), "swap: no scratch file left behind");

    // A directory squatting on the scratch name makes the next write fail before it starts
    runner.expectTrue(FsHelpers::makeDirs(path + ".tmp"), "swap: block scratch file");
    ReadingPosition later = samplePosition();
    later.page = 40;
    runner.expectTrue(store.save("book", later) == StoreStatus::IoError, "swap: blocked save is IoError");

    ReadingPosition loaded;
    runner.expectTrue(store.load("book", &loaded) == StoreStatus::Ok, "swap: old record still loads");
    runner.expectEq(12, loaded.page, "swap: old record unchanged");
  }

  // ---- Unwritable directory ----
  {
    const std::string dir = makeTempDir("quire_progress_ro_");
    writeFile(dir + "/file", "x");
    FileProgressStore store(dir + "/file/sub");
    runner.expectTrue(store.save("book", samplePosition()) == StoreStatus::IoError, "directory is a file: IoError");
  }

  // ---- Memory store ----
  {
    MemoryProgressStore store;
    ReadingPosition loaded;
    runner.expectTrue(store.load("x", &loaded) == StoreStatus::NotFound, "memory: NotFound");
    store.save("x", samplePosition());
    runner.expectTrue(store.load("x", &loaded) == StoreStatus::Ok && loaded == samplePosition(), "memory: round trip");
    runner.expectEq(static_cast<size_t>(1), store.size(), "memory: one record");
  }

  runner.expectEqual(std::string("corrupted progress record"), std::string(storeStatusToString(StoreStatus::Corrupted)),
                     "storeStatusToString");

  runner.printSummary();
  return runner.allPassed() ? 0 : 1;
}
