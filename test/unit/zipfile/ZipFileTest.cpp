#include "test_utils.h"

#include <ZipFile.h>

#include <string>

#include "DeflateSamples.h"
#include "ZipFixture.h"

namespace {
// Accepts `budget` bytes, then refuses everything
class LimitedSink final : public ByteSink {
 public:
  explicit LimitedSink(const size_t budget) : budget(budget) {}

  size_t write(const uint8_t* buffer, const size_t size) override {
    if (size > budget) return 0;
    budget -= size;
    data.append(reinterpret_cast<const char*>(buffer), size);
    return size;
  }

  std::string data;

 private:
  size_t budget;
};
}  // namespace

int main() {
  TestUtils::TestRunner runner("ZipFile");

  const std::string dir = makeTempDir("quire_zip_");
  const std::string path = dir + "/sample.zip";
  writeRawZip(path, {
                        {"mimetype", "application/epub+zip", 0, 20},
                        {"docs/hello.txt", deflatedString(kHelloDeflated, sizeof(kHelloDeflated)), 8,
                         static_cast<uint32_t>(kHelloInflatedSize)},
                        {"docs/alphabet.txt", deflatedString(kAlphabetDeflated, sizeof(kAlphabetDeflated)), 8,
                         static_cast<uint32_t>(kAlphabetInflatedSize)},
                        {"legacy.bin", "xxxx", 12, 4},
                    });

  // ---- Central directory ----
  {
    ZipFile zip(path);
    runner.expectEq(static_cast<uint16_t>(4), zip.getTotalEntries(), "total entries from EOCD");
    runner.expectTrue(zip.loadAllFileStatSlims(), "central directory loads");
    const auto& names = zip.getEntryNames();
    runner.expectEq(static_cast<size_t>(4), names.size(), "every entry listed");
    runner.expectEqual(std::string("mimetype"), names[0], "archive order kept");
    runner.expectEqual(std::string("legacy.bin"), names[3], "last entry");

    size_t size = 0;
    runner.expectTrue(zip.getInflatedFileSize("docs/alphabet.txt", &size), "inflated size known");
    runner.expectEq(kAlphabetInflatedSize, size, "inflated size value");
    runner.expectFalse(zip.isOpen(), "archive closed again after loading");
  }

  // ---- Reading entries ----
  {
    ZipFile zip(path);
    std::string out;
    runner.expectTrue(zip.readFileToString("mimetype", &out), "stored entry read");
    runner.expectEqual(std::string("application/epub+zip"), out, "stored entry content");

    runner.expectTrue(zip.readFileToString("docs/hello.txt", &out), "deflated entry read");
    runner.expectEqual(std::string("Hello, World!"), out, "deflated entry content");

    runner.expectTrue(zip.open(), "archive held open");
    runner.expectTrue(zip.readFileToString("docs/alphabet.txt", &out), "deflated entry read while held open");
    runner.expectTrue(out == alphabetText(), "multi-chunk deflated content");
    runner.expectTrue(zip.isOpen(), "held-open archive stays open");
    zip.close();
    runner.expectFalse(zip.isOpen(), "close");
  }

  // ---- Streaming ----
  {
    ZipFile zip(path);
    LimitedSink sink(1 << 20);
    runner.expectTrue(zip.readFileToStream("docs/alphabet.txt", sink, 32), "small chunks stream the whole entry");
    runner.expectTrue(sink.data == alphabetText(), "streamed content matches");

    LimitedSink tight(10);
    runner.expectFalse(zip.readFileToStream("mimetype", tight, 16), "sink refusing data aborts");
    runner.expectTrue(zip.lastError() == ZipError::SinkRejected, "SinkRejected reported");
  }

  // ---- Failures ----
  {
    ZipFile zip(path);
    std::string out;
    runner.expectFalse(zip.readFileToString("docs/alphabet.txt", &out, 100), "entry above limit refused");
    runner.expectTrue(zip.lastError() == ZipError::TooLarge, "TooLarge reported");

    runner.expectFalse(zip.readFileToString("missing.txt", &out), "missing entry");
    runner.expectTrue(zip.lastError() == ZipError::EntryNotFound, "EntryNotFound reported");

    runner.expectFalse(zip.readFileToString("legacy.bin", &out), "unknown compression method");
    runner.expectTrue(zip.lastError() == ZipError::UnsupportedMethod, "UnsupportedMethod reported");

    writeFile(dir + "/plain.txt", std::string(100, 'x'));
    ZipFile notZip(dir + "/plain.txt");
    runner.expectFalse(notZip.loadAllFileStatSlims(), "plain file is not an archive");
    runner.expectTrue(notZip.lastError() == ZipError::NotAZip, "NotAZip reported");

    ZipFile missing(dir + "/missing.zip");
    runner.expectFalse(missing.open(), "missing archive");
    runner.expectTrue(missing.lastError() == ZipError::OpenFailed, "OpenFailed reported");
  }

  runner.expectEqual(std::string("entry too large"), std::string(zipErrorToString(ZipError::TooLarge)),
                     "zipErrorToString");

  runner.printSummary();
  return runner.allPassed() ? 0 : 1;
}
