#include "test_utils.h"

#include <memory>
#include <string>
#include <vector>

#include "FakeDecoder.h"
#include "content/EpubReaderService.h"
#include "content/MemoryProgressStore.h"
#include "content/PdfReaderService.h"
#include "content/ReaderRepository.h"

using namespace quire;

namespace {
struct Harness {
  std::shared_ptr<FakeScript> pdf = std::make_shared<FakeScript>();
  std::shared_ptr<FakeScript> epub = std::make_shared<FakeScript>();
  std::shared_ptr<MemoryProgressStore> store = std::make_shared<MemoryProgressStore>();
  std::unique_ptr<ReaderRepository> repo;

  Harness() {
    pdf->units = makeUnits(10, 50);
    epub->units = makeUnits(5, 50);
    repo.reset(new ReaderRepository(
        std::unique_ptr<ReaderService>(
            new PdfReaderService(std::unique_ptr<DocumentDecoder>(new FakeDecoder(pdf)), EngineConfig(), store)),
        std::unique_ptr<ReaderService>(
            new EpubReaderService(std::unique_ptr<DocumentDecoder>(new FakeDecoder(epub)), EngineConfig(), store))));
  }
};

bool isNoBookOpen(const ReaderFailure& f) {
  return f.kind == FailureKind::BookOpen && f.message == "No book is currently open";
}
}  // namespace

int main() {
  TestUtils::TestRunner runner("ReaderRepository");

  // ---- Idle guard ----
  {
    Harness h;
    ReadingPosition pos;
    runner.expectFalse(h.repo->hasActiveBook(), "starts idle");
    runner.expectTrue(isNoBookOpen(h.repo->getCurrentPosition().err), "idle: getCurrentPosition");
    runner.expectTrue(isNoBookOpen(h.repo->updatePosition(pos).err), "idle: updatePosition");
    runner.expectTrue(isNoBookOpen(h.repo->getSettings().err), "idle: getSettings");
    runner.expectTrue(isNoBookOpen(h.repo->updateSettings(ReaderSettings()).err), "idle: updateSettings");
    runner.expectTrue(isNoBookOpen(h.repo->goToPage(1).err), "idle: goToPage");
    runner.expectTrue(isNoBookOpen(h.repo->nextPage().err), "idle: nextPage");
    runner.expectTrue(isNoBookOpen(h.repo->previousPage().err), "idle: previousPage");
    runner.expectTrue(isNoBookOpen(h.repo->searchText("x").err), "idle: searchText");
    runner.expectTrue(isNoBookOpen(h.repo->getPageText(1).err), "idle: getPageText");
    runner.expectTrue(isNoBookOpen(h.repo->getTableOfContents().err), "idle: getTableOfContents");
    runner.expectTrue(isNoBookOpen(h.repo->getBookMetadata().err), "idle: getBookMetadata");
    runner.expectTrue(isNoBookOpen(h.repo->calculateProgress(pos).err), "idle: calculateProgress");
    runner.expectTrue(isNoBookOpen(h.repo->estimateRemainingTime(pos).err), "idle: estimateRemainingTime");
    runner.expectTrue(isNoBookOpen(h.repo->saveProgress("id", pos).err), "idle: saveProgress");
    runner.expectTrue(isNoBookOpen(h.repo->loadProgress("id").err), "idle: loadProgress");
    runner.expectTrue(h.repo->closeBook().ok(), "idle: closeBook succeeds");

    runner.expectTrue(h.repo->positionStream().isClosed(), "idle: position stream closed");
    runner.expectTrue(h.repo->settingsStream().isClosed(), "idle: settings stream closed");
    bool done = false;
    int values = 0;
    h.repo->loadingProgressStream().subscribe([&](const double&) { values++; }, [&]() { done = true; });
    runner.expectTrue(done && values == 0, "idle: loading stream closed and empty");

    BookFormat format = BookFormat::Pdf;
    runner.expectFalse(h.repo->currentFormat(&format), "idle: no current format");
  }

  // ---- Unsupported format ----
  {
    Harness h;
    auto opened = h.repo->openBook("notes.txt", BookFormat::Txt);
    runner.expectTrue(opened.err.kind == FailureKind::UnsupportedFormat, "txt: UnsupportedFormatFailure");
    runner.expectEqual(std::string("No service available for format: TXT"), opened.err.message, "txt: message");
    runner.expectEqual(std::string(".txt"), opened.err.fileExtension, "txt: extension");
    runner.expectEq(0, h.pdf->opens + h.epub->opens, "txt: no decoder touched");
    runner.expectFalse(h.repo->hasActiveBook(), "txt: still idle");

    auto detected = h.repo->detectFormat("notes.txt");
    runner.expectTrue(detected.err.kind == FailureKind::UnsupportedFormat, "detectFormat(.txt) fails");

    auto probed = h.repo->isFormatSupported("notes.txt");
    runner.expectTrue(probed.ok() && !probed.value, "isFormatSupported(notes.txt) is false");

    h.epub->probeResult = true;
    probed = h.repo->isFormatSupported("book.epub");
    runner.expectTrue(probed.ok() && probed.value, "isFormatSupported asks the EPUB probe too");

    const auto formats = h.repo->getSupportedFormats();
    runner.expectEq(static_cast<size_t>(2), formats.size(), "two supported formats");
  }

  // ---- Switching books closes the previous one exactly once ----
  {
    Harness h;
    runner.expectTrue(h.repo->openBook("a.pdf", BookFormat::Pdf).ok(), "switch: open PDF");
    BookFormat format = BookFormat::Txt;
    runner.expectTrue(h.repo->currentFormat(&format) && format == BookFormat::Pdf, "switch: current PDF");

    bool firstDone = false;
    h.repo->positionStream().subscribe([](const ReadingPosition&) {}, [&]() { firstDone = true; });

    runner.expectTrue(h.repo->openBook("b.epub", BookFormat::Epub).ok(), "switch: open EPUB");
    runner.expectEq(1, h.pdf->closes, "switch: PDF closed exactly once");
    runner.expectTrue(firstDone, "switch: old position stream completed");
    runner.expectTrue(h.repo->currentFormat(&format) && format == BookFormat::Epub, "switch: current EPUB");
    runner.expectEq(5, h.repo->getBookMetadata().value.pageCount, "switch: operations hit the EPUB");

    runner.expectTrue(h.repo->openBook("c.pdf", BookFormat::Pdf).ok(), "switch: back to PDF");
    runner.expectEq(1, h.epub->closes, "switch: EPUB closed exactly once");
    runner.expectEq(1, h.pdf->closes, "switch: PDF not closed again");
  }

  // ---- A failed open leaves the repository idle ----
  {
    Harness h;
    h.repo->openBook("a.pdf", BookFormat::Pdf);
    h.epub->openStatus = DecodeStatus::failure(DecodeError::ParseFailed, "bad opf");
    auto opened = h.repo->openBook("bad.epub", BookFormat::Epub);
    runner.expectTrue(opened.err.kind == FailureKind::EpubReader, "failed open: EpubReaderFailure");
    runner.expectFalse(h.repo->hasActiveBook(), "failed open: idle");
    runner.expectEq(1, h.pdf->closes, "failed open: previous book was closed");

    bool done = false;
    int values = 0;
    h.repo->loadingProgressStream().subscribe([&](const double&) { values++; }, [&]() { done = true; });
    runner.expectTrue(done, "failed open: loading stream completes at once");
    runner.expectEq(0, values, "failed open: no loading history replayed");
  }

  // ---- A throw after the decoder opened still releases it ----
  {
    Harness h;
    h.pdf->badAllocInToc = true;
    auto opened = h.repo->openBook("a.pdf", BookFormat::Pdf);
    runner.expectTrue(opened.err.kind == FailureKind::Memory, "toc bad_alloc: MemoryFailure");
    runner.expectFalse(h.repo->hasActiveBook(), "toc bad_alloc: idle");
    runner.expectEq(1, h.pdf->opens, "toc bad_alloc: decoder was opened");
    runner.expectEq(1, h.pdf->closes, "toc bad_alloc: decoder released by the failed open");

    h.repo->dispose();
    runner.expectEq(1, h.pdf->closes, "toc bad_alloc: dispose does not close twice");

    Harness again;
    again.pdf->badAllocInToc = true;
    again.repo->openBook("a.pdf", BookFormat::Pdf);
    again.pdf->badAllocInToc = false;
    runner.expectTrue(again.repo->openBook("a.pdf", BookFormat::Pdf).ok(), "toc bad_alloc: next open succeeds");
    runner.expectEq(10, again.repo->getBookMetadata().value.pageCount, "toc bad_alloc: fresh session");
  }

  // ---- Loading progress ----
  {
    Harness h;
    h.repo->openBook("a.pdf", BookFormat::Pdf);
    std::vector<double> values;
    h.repo->loadingProgressStream().subscribe([&](const double& v) { values.push_back(v); });
    bool increasing = !values.empty();
    for (size_t i = 1; i < values.size(); i++) increasing = increasing && values[i] > values[i - 1];
    runner.expectTrue(increasing, "loading progress strictly increasing");
    runner.expectFloatEq(1.0, values.back(), "loading progress ends at 1.0");
  }

  // ---- Navigation through the repository ----
  {
    Harness h;
    h.repo->openBook("a.pdf", BookFormat::Pdf);
    std::vector<ReadingPosition> seen;
    h.repo->positionStream().subscribe([&](const ReadingPosition& p) { seen.push_back(p); });

    runner.expectTrue(h.repo->goToPage(10).ok(), "goToPage(last)");
    auto next = h.repo->nextPage();
    runner.expectTrue(next.err.kind == FailureKind::Navigation, "nextPage at last page fails");
    runner.expectEqual(std::string("next"), next.err.direction, "nextPage failure direction");
    runner.expectFalse(h.repo->goToPage(11).ok(), "goToPage(total + 1) fails");
    runner.expectFalse(h.repo->goToPage(0).ok(), "goToPage(0) fails");
    runner.expectEq(static_cast<size_t>(1), seen.size(), "only the successful move emitted");
    runner.expectEq(10, seen[0].page, "emitted position is the last page");

    auto empty = h.repo->searchText("");
    runner.expectTrue(empty.ok() && empty.value.empty(), "empty search returns nothing");
  }

  // ---- Progress never decreases while paging forward ----
  {
    Harness h;
    h.repo->openBook("a.pdf", BookFormat::Pdf);
    ReadingPosition current = h.repo->getCurrentPosition().value;
    double previous = h.repo->calculateProgress(current).value;
    bool nonDecreasing = true;
    int steps = 0;
    for (auto next = h.repo->nextPage(); next.ok(); next = h.repo->nextPage()) {
      const double progress = h.repo->calculateProgress(next.value).value;
      nonDecreasing = nonDecreasing && progress >= previous;
      previous = progress;
      current = next.value;
      steps++;
    }
    runner.expectEq(9, steps, "paging: nine moves from page 1 to page 10");
    runner.expectTrue(nonDecreasing, "paging: progress never decreases");
    runner.expectEq(10, current.page, "paging: stops on the last page");
    runner.expectFloatEq(1.0, h.repo->calculateProgress(current).value, "paging: last page is 1.0");
  }

  // ---- Progress round trip ----
  {
    Harness h;
    h.repo->openBook("a.pdf", BookFormat::Pdf);
    ReadingPosition pos;
    pos.page = 7;
    pos.characterOffset = 1234;
    pos.progressPercentage = 0.7;
    runner.expectTrue(h.repo->saveProgress("book-a", pos).ok(), "saveProgress");
    auto loaded = h.repo->loadProgress("book-a");
    runner.expectTrue(loaded.ok() && loaded.value == pos, "loadProgress returns the saved position");
  }

  // ---- Five chapter EPUB ----
  {
    Harness h;
    auto opened = h.repo->openBook("/books/five.epub", BookFormat::Epub);
    runner.expectEq(5, opened.value.totalPages, "epub: five chapters");

    auto moved = h.repo->goToPage(3);
    runner.expectEq(2, moved.value.chapter, "epub: page 3 is chapter 2");
    auto progress = h.repo->calculateProgress(moved.value);
    runner.expectFloatEq(0.6, progress.value, "epub: progress 0.6");

    runner.expectTrue(h.repo->closeBook().ok(), "epub: close");
    runner.expectTrue(isNoBookOpen(h.repo->getCurrentPosition().err), "epub: closed -> no book open");
  }

  // ---- Exceptions become failures ----
  {
    Harness h;
    h.pdf->throwOnOpen = true;
    auto opened = h.repo->openBook("boom.pdf", BookFormat::Pdf);
    runner.expectTrue(opened.err.kind == FailureKind::ReaderFile, "exception: ReaderFileFailure");
    runner.expectEqual(std::string("Unexpected error: decoder exploded"), opened.err.message,
                       "exception: message carries what()");
    runner.expectEqual(std::string("general"), opened.err.operation, "exception: operation general");

    h.pdf->throwOnOpen = false;
    h.pdf->badAllocOnOpen = true;
    opened = h.repo->openBook("huge.pdf", BookFormat::Pdf);
    runner.expectTrue(opened.err.kind == FailureKind::Memory, "bad_alloc: MemoryFailure");
    runner.expectEqual(std::string("openBook"), opened.err.operation, "bad_alloc: operation named");
    runner.expectFalse(h.repo->hasActiveBook(), "exception: idle");
  }

  // ---- Close failure ----
  {
    Harness h;
    h.repo->openBook("a.pdf", BookFormat::Pdf);
    h.pdf->closeStatus = DecodeStatus::failure(DecodeError::IoError, "device gone");
    auto closed = h.repo->closeBook();
    runner.expectTrue(closed.err.kind == FailureKind::ReaderFile, "close failure reported");
    runner.expectTrue(h.repo->hasActiveBook(), "close failure: repository stays open");
    auto pos = h.repo->getCurrentPosition();
    runner.expectTrue(pos.err.kind == FailureKind::BookOpen, "close failure: session already gone");
    runner.expectEqual(std::string("No book is currently open"), pos.err.message, "close failure: guard message");
    h.pdf->closeStatus = DecodeStatus::success();
    runner.expectTrue(h.repo->closeBook().ok(), "close retry succeeds");
    runner.expectFalse(h.repo->hasActiveBook(), "close retry: idle");
  }

  // ---- Dispose ----
  {
    Harness h;
    h.repo->openBook("a.pdf", BookFormat::Pdf);
    h.repo->dispose();
    runner.expectFalse(h.repo->hasActiveBook(), "dispose: idle");
    runner.expectEq(1, h.pdf->closes, "dispose: open book closed");
    h.repo->dispose();
    runner.expectEq(1, h.pdf->closes, "dispose twice: no second close");
  }

  runner.printSummary();
  return runner.allPassed() ? 0 : 1;
}
