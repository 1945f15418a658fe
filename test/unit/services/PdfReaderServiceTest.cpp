#include "test_utils.h"

#include <memory>
#include <new>
#include <string>
#include <vector>

#include "FailingProgressStore.h"
#include "FakeDecoder.h"
#include "content/MemoryProgressStore.h"
#include "content/PdfReaderService.h"

using namespace quire;

namespace {
struct Fixture {
  std::shared_ptr<FakeScript> script = std::make_shared<FakeScript>();
  std::shared_ptr<MemoryProgressStore> store = std::make_shared<MemoryProgressStore>();
  EngineConfig config;

  std::unique_ptr<PdfReaderService> make(std::shared_ptr<ProgressStore> customStore = nullptr) {
    return std::unique_ptr<PdfReaderService>(new PdfReaderService(
        std::unique_ptr<DocumentDecoder>(new FakeDecoder(script)), config, customStore ? customStore : store));
  }
};
}  // namespace

int main() {
  TestUtils::TestRunner runner("PdfReaderService");

  // ---- Open ----
  {
    Fixture fx;
    fx.script->units = makeUnits(4, 500);
    fx.script->meta.title = "Annual Report";
    fx.script->meta.author = "Finance";
    auto svc = fx.make();

    auto opened = svc->openBook("/books/report.pdf", BookFormat::Pdf);
    runner.expectTrue(opened.ok(), "open: succeeds");
    runner.expectEq(4, opened.value.totalPages, "open: page count");
    runner.expectTrue(opened.value.format == BookFormat::Pdf, "open: format");
    runner.expectEqual(std::string("/books/report.pdf"), opened.value.filePath, "open: path recorded");
    runner.expectEqual(std::string("pdf_"), opened.value.documentId.substr(0, 4), "open: pdf_ document id");
    runner.expectEq(static_cast<int64_t>(4 * (500 * 5 - 1)), opened.value.totalCharacters, "open: characters");
    runner.expectEq(8, opened.value.estimatedReadingTime, "open: reading time rounded up");
    runner.expectEqual(std::string("Annual Report"), opened.value.metadata.title, "open: metadata title");
    runner.expectEq(4, opened.value.metadata.pageCount, "open: metadata page count");
    runner.expectTrue(svc->isOpen(), "open: isOpen");

    auto pos = svc->getCurrentPosition();
    runner.expectTrue(pos.ok() && pos.value.page == 1 && pos.value.chapter == 0, "open: position at page 1");
  }

  // ---- Throw after the decoder opened ----
  {
    Fixture fx;
    fx.script->units = makeUnits(3, 100);
    fx.script->badAllocInToc = true;
    auto svc = fx.make();
    bool threw = false;
    try {
      svc->openBook("big.pdf", BookFormat::Pdf);
    } catch (const std::bad_alloc&) {
      threw = true;
    }
    runner.expectTrue(threw, "toc throw: propagates to caller");
    runner.expectFalse(svc->isOpen(), "toc throw: service not open");
    runner.expectEq(1, fx.script->closes, "toc throw: decoder closed again");
    svc->dispose();
    runner.expectEq(1, fx.script->closes, "toc throw: dispose closes nothing more");
  }

  // ---- Open failures ----
  {
    Fixture fx;
    fx.script->openStatus = DecodeStatus::failure(DecodeError::Encrypted, "password");
    auto svc = fx.make();
    auto opened = svc->openBook("locked.pdf", BookFormat::Pdf);
    runner.expectFalse(opened.ok(), "encrypted: fails");
    runner.expectEqual(std::string("ENCRYPTED"), opened.err.errorCode, "encrypted: ENCRYPTED code");
    runner.expectFalse(svc->isOpen(), "encrypted: stays closed");
    int replayed = 0;
    bool completed = false;
    svc->loadingProgressStream().subscribe([&](const double&) { replayed++; }, [&]() { completed = true; });
    runner.expectTrue(completed, "encrypted: loading stream already complete");
    runner.expectEq(0, replayed, "encrypted: no loading values left behind");

    fx.script->openStatus = DecodeStatus::failure(DecodeError::ParseFailed, "xref");
    opened = svc->openBook("broken.pdf", BookFormat::Pdf);
    runner.expectTrue(opened.err.kind == FailureKind::PdfReader, "parse: PdfReaderFailure");
    runner.expectEqual(std::string("PARSE_ERROR"), opened.err.errorCode, "parse: PARSE_ERROR code");

    fx.script->openStatus = DecodeStatus::failure(DecodeError::FileNotFound, "missing");
    opened = svc->openBook("missing.pdf", BookFormat::Pdf);
    runner.expectTrue(opened.err.kind == FailureKind::BookOpen, "missing: BookOpenFailure");
    runner.expectEqual(std::string("missing.pdf"), opened.err.filePath, "missing: path attached");

    fx.script->openStatus = DecodeStatus::failure(DecodeError::CorruptHeader, "no %PDF");
    opened = svc->openBook("fake.pdf", BookFormat::Pdf);
    runner.expectEqual(std::string("Invalid file header"), opened.err.message, "header: message");

    fx.script->openStatus = DecodeStatus::success();
    opened = svc->openBook("empty.pdf", BookFormat::Pdf);
    runner.expectFalse(opened.ok(), "zero pages: fails");
    runner.expectTrue(opened.err.kind == FailureKind::PdfReader, "zero pages: PdfReaderFailure");
    runner.expectEq(1, fx.script->closes, "zero pages: decoder closed again");

    opened = svc->openBook("novel.epub", BookFormat::Epub);
    runner.expectTrue(opened.err.kind == FailureKind::UnsupportedFormat, "wrong format: UnsupportedFormat");
  }

  // ---- Loading progress ----
  {
    Fixture fx;
    fx.script->units = makeUnits(3, 10);
    auto svc = fx.make();
    svc->openBook("a.pdf", BookFormat::Pdf);

    std::vector<double> values;
    bool done = false;
    svc->loadingProgressStream().subscribe([&](const double& v) { values.push_back(v); }, [&]() { done = true; });
    runner.expectTrue(done, "loading: closed after open");
    runner.expectEq(static_cast<size_t>(6), values.size(), "loading: start, opened, one per page, final");
    bool increasing = true;
    for (size_t i = 1; i < values.size(); i++) increasing = increasing && values[i] > values[i - 1];
    runner.expectTrue(increasing, "loading: strictly increasing");
    runner.expectFloatEq(1.0, values.back(), "loading: ends at 1.0");
    bool inRange = true;
    for (const double v : values) inRange = inRange && v >= 0.0 && v <= 1.0;
    runner.expectTrue(inRange, "loading: within [0, 1]");
  }

  // ---- Navigation ----
  {
    Fixture fx;
    fx.script->units = makeUnits(5, 20);
    auto svc = fx.make();
    svc->openBook("nav.pdf", BookFormat::Pdf);

    std::vector<int> pages;
    svc->positionStream().subscribe([&](const ReadingPosition& p) { pages.push_back(p.page); });

    auto moved = svc->goToPage(3);
    runner.expectTrue(moved.ok() && moved.value.page == 3, "goToPage(3)");
    runner.expectEq(0, moved.value.chapter, "pdf chapter is 0");
    runner.expectFloatEq(0.6, moved.value.progressPercentage, "progress 3/5");

    moved = svc->goToPage(6);
    runner.expectTrue(moved.err.kind == FailureKind::Navigation, "goToPage(6) fails");
    runner.expectEq(6, moved.err.requestedPage, "goToPage(6): requested");
    runner.expectEq(5, moved.err.totalPages, "goToPage(6): total");
    runner.expectEqual(std::string("goto"), moved.err.direction, "goToPage(6): direction");

    moved = svc->goToPage(0);
    runner.expectFalse(moved.ok(), "goToPage(0) fails");
    runner.expectEq(3, svc->getCurrentPosition().value.page, "failed move keeps position");

    svc->goToPage(5);
    moved = svc->nextPage();
    runner.expectEqual(std::string("next"), moved.err.direction, "nextPage past end: direction next");

    svc->goToPage(1);
    moved = svc->previousPage();
    runner.expectEqual(std::string("previous"), moved.err.direction, "previousPage at start fails");

    moved = svc->nextPage();
    runner.expectTrue(moved.ok() && moved.value.page == 2, "nextPage from 1 -> 2");

    runner.expectTrue(pages == std::vector<int>({3, 5, 1, 2}), "position stream sees each successful move");
  }

  // ---- updatePosition ----
  {
    Fixture fx;
    fx.script->units = makeUnits(4, 20);
    auto svc = fx.make();
    svc->openBook("u.pdf", BookFormat::Pdf);

    ReadingPosition pos;
    pos.page = 2;
    pos.scrollOffset = 0.5;
    runner.expectTrue(svc->updatePosition(pos).ok(), "updatePosition: in range");
    auto current = svc->getCurrentPosition().value;
    runner.expectFloatEq(0.5, current.scrollOffset, "updatePosition: scroll kept");
    runner.expectFloatEq(0.5, current.progressPercentage, "updatePosition: progress recomputed");
    runner.expectTrue(current.lastUpdatedMs > 0, "updatePosition: timestamp set");

    pos.page = 9;
    auto bad = svc->updatePosition(pos);
    runner.expectEqual(std::string("update"), bad.err.direction, "updatePosition: out of range");
  }

  // ---- Settings ----
  {
    Fixture fx;
    fx.script->units = makeUnits(2, 20);
    auto svc = fx.make();
    svc->openBook("s.pdf", BookFormat::Pdf);

    int emitted = 0;
    svc->settingsStream().subscribe([&](const ReaderSettings&) { emitted++; });

    ReaderSettings s = ReaderSettings::dark();
    s.fontSize = 1.5;
    runner.expectTrue(svc->updateSettings(s).ok(), "updateSettings: valid");
    runner.expectFloatEq(1.5, svc->getSettings().value.fontSize, "getSettings: stored");

    s.fontSize = 9.0;
    auto bad = svc->updateSettings(s);
    runner.expectTrue(bad.err.kind == FailureKind::Settings, "updateSettings: invalid font size");
    runner.expectEqual(std::string("fontSize"), bad.err.settingName, "updateSettings: setting named");
    runner.expectFloatEq(1.5, svc->getSettings().value.fontSize, "updateSettings: previous kept");
    runner.expectEq(1, emitted, "settings stream: one emission");
  }

  // ---- Text, search and TOC ----
  {
    Fixture fx;
    fx.script->units = {"The whale surfaced.", "No match here.", "Another WHALE and a whale."};
    fx.script->toc = {{"Part One", 0, 0}, {"Intro", 0, 1}, {"Lost", -1, 1}, {"Part Two", 2, 0}};
    auto svc = fx.make();
    svc->openBook("moby.pdf", BookFormat::Pdf);

    auto text = svc->getPageText(2);
    runner.expectEqual(std::string("No match here."), text.value, "getPageText(2)");
    runner.expectTrue(svc->getPageText(4).err.kind == FailureKind::Navigation, "getPageText out of range");

    auto hits = svc->searchText("whale", false);
    runner.expectEq(static_cast<size_t>(3), hits.value.size(), "search: case-insensitive hits");
    runner.expectEq(1, hits.value[0].pageNumber, "search: first hit on page 1");
    runner.expectEq(3, hits.value[2].pageNumber, "search: last hit on page 3");

    hits = svc->searchText("whale", true);
    runner.expectEq(static_cast<size_t>(2), hits.value.size(), "search: case-sensitive hits");

    hits = svc->searchText("", false);
    runner.expectTrue(hits.ok() && hits.value.empty(), "search: empty query gives nothing");

    auto toc = svc->getTableOfContents();
    runner.expectEq(static_cast<size_t>(2), toc.value.size(), "toc: two top-level entries");
    runner.expectEq(static_cast<size_t>(1), toc.value[0].children.size(), "toc: unresolved child dropped");
    runner.expectEq(1, toc.value[0].children[0].level, "toc: child level");
    runner.expectEq(3, toc.value[1].page, "toc: 1-based target page");

    fx.script->failingUnit = 1;
    hits = svc->searchText("whale", false);
    runner.expectTrue(hits.err.kind == FailureKind::Search, "search: unreadable page aborts");
    runner.expectEqual(std::string("whale"), hits.err.query, "search: query attached");

    text = svc->getPageText(2);
    runner.expectTrue(text.err.kind == FailureKind::ContentExtraction, "getPageText: extraction failure");
  }

  // ---- Search limit ----
  {
    Fixture fx;
    fx.script->units = {"a a a", "a a a"};
    fx.config.searchMaxResults = 4;
    auto svc = fx.make();
    svc->openBook("a.pdf", BookFormat::Pdf);
    runner.expectEq(static_cast<size_t>(4), svc->searchText("a", false).value.size(), "search: capped results");
  }

  // ---- Remaining time ----
  {
    Fixture fx;
    fx.script->units = makeUnits(3, 500);
    fx.script->failingUnit = 2;
    auto svc = fx.make();
    auto opened = svc->openBook("t.pdf", BookFormat::Pdf);
    runner.expectTrue(opened.ok(), "unreadable page doesn't fail open");

    ReadingPosition pos;
    pos.page = 1;
    runner.expectEq(3, svc->estimateRemainingTime(pos, 250).value, "remaining: 500 + 250 words at 250 wpm");
    pos.page = 3;
    runner.expectEq(0, svc->estimateRemainingTime(pos, 250).value, "remaining: last page is 0");
    pos.page = 2;
    runner.expectEq(1, svc->estimateRemainingTime(pos, 0).value, "remaining: invalid wpm uses default");

    runner.expectFloatEq(2.0 / 3.0, svc->calculateProgress(pos).value, "calculateProgress 2/3");
    pos.page = 10;
    runner.expectFloatEq(1.0, svc->calculateProgress(pos).value, "calculateProgress clamped");
  }

  // ---- Page size ----
  {
    Fixture fx;
    fx.script->units = makeUnits(1, 5);
    auto svc = fx.make();
    runner.expectTrue(svc->getPageSize(1).err.kind == FailureKind::BookOpen, "page size needs an open book");
    svc->openBook("p.pdf", BookFormat::Pdf);
    auto size = svc->getPageSize(1);
    runner.expectFloatEq(612.0, size.value.width, "page size: width");
    runner.expectFloatEq(612.0 / 792.0, size.value.aspectRatio, "page size: aspect ratio");
  }

  // ---- Progress store ----
  {
    Fixture fx;
    fx.script->units = makeUnits(5, 5);
    auto svc = fx.make();
    svc->openBook("p.pdf", BookFormat::Pdf);

    auto missing = svc->loadProgress("never-saved");
    runner.expectTrue(missing.ok() && missing.value == ReadingPosition::initial(), "load: unknown id -> initial");

    ReadingPosition pos;
    pos.page = 4;
    pos.progressPercentage = 0.8;
    runner.expectTrue(svc->saveProgress("book-1", pos).ok(), "save: ok");
    auto loaded = svc->loadProgress("book-1");
    runner.expectTrue(loaded.ok() && loaded.value == pos, "load: round trip");

    pos.page = 40;
    fx.store->save("too-far", pos);
    loaded = svc->loadProgress("too-far");
    runner.expectEq(5, loaded.value.page, "load: clamped to last page");
    runner.expectFloatEq(1.0, loaded.value.progressPercentage, "load: clamped progress recomputed");

    runner.expectTrue(svc->saveProgress("", pos).err.kind == FailureKind::Progress, "save: empty id rejected");

    auto failing = std::make_shared<FailingProgressStore>(StoreStatus::IoError);
    auto broken = fx.make(failing);
    broken->openBook("p.pdf", BookFormat::Pdf);
    auto saved = broken->saveProgress("book-1", pos);
    runner.expectEqual(std::string("save"), saved.err.operation, "save failure: operation save");
    auto load = broken->loadProgress("book-1");
    runner.expectEqual(std::string("load"), load.err.operation, "load failure: operation load");
    runner.expectEq(1, failing->saves, "failing store: one save attempt");
  }

  // ---- Close ----
  {
    Fixture fx;
    fx.script->units = makeUnits(2, 5);
    auto svc = fx.make();
    runner.expectTrue(svc->closeBook().ok(), "close with nothing open succeeds");
    runner.expectEq(0, fx.script->closes, "close with nothing open: decoder untouched");

    svc->openBook("c.pdf", BookFormat::Pdf);
    bool positionDone = false;
    svc->positionStream().subscribe([](const ReadingPosition&) {}, [&]() { positionDone = true; });

    fx.script->closeStatus = DecodeStatus::failure(DecodeError::IoError, "flush failed");
    auto closed = svc->closeBook();
    runner.expectTrue(closed.err.kind == FailureKind::ReaderFile, "close failure: ReaderFileFailure");
    runner.expectEqual(std::string("close"), closed.err.operation, "close failure: operation close");
    runner.expectFalse(svc->isOpen(), "close failure still releases the session");
    runner.expectTrue(positionDone, "close: position stream completed");
    runner.expectTrue(svc->positionStream().isClosed(), "close: fresh stream is closed");
    runner.expectTrue(svc->getCurrentPosition().err.kind == FailureKind::BookOpen, "close: back to no book");
  }

  runner.printSummary();
  return runner.allPassed() ? 0 : 1;
}
