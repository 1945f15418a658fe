#include <Logging.h>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

#include "content/ContentTypes.h"
#include "content/ReaderRepository.h"
#include "core/EngineConfig.h"
#include "decoder/ReaderFactory.h"

using namespace quire;

static void usage() {
  fprintf(stderr, "Usage: quire-cli [--config file.ini] [--search text] [--page N] [--toc] [--progress id] <book>\n");
  fprintf(stderr, "  --config FILE    Engine configuration (INI)\n");
  fprintf(stderr, "  --search TEXT    Case-insensitive full text search\n");
  fprintf(stderr, "  --page N         Go to page N (1-based) and print its text\n");
  fprintf(stderr, "  --toc            Print the table of contents\n");
  fprintf(stderr, "  --progress ID    Save the final position under ID\n");
}

static int fail(const ReaderFailure& err) {
  fprintf(stderr, "%s\n", err.toString().c_str());
  return 1;
}

static void printToc(const std::vector<TableOfContentsEntry>& entries) {
  for (const auto& entry : entries) {
    printf("%*s%s ... %d\n", entry.level * 2, "", entry.title.c_str(), entry.page);
    printToc(entry.children);
  }
}

int main(int argc, char* argv[]) {
  if (argc < 2) {
    usage();
    return 1;
  }

  const char* configPath = nullptr;
  const char* query = nullptr;
  const char* progressId = nullptr;
  int page = 0;
  bool showToc = false;
  int argIdx = 1;
  while (argIdx < argc && argv[argIdx][0] == '-') {
    if (strcmp(argv[argIdx], "--toc") == 0) {
      showToc = true;
      argIdx++;
    } else if (strcmp(argv[argIdx], "--config") == 0 && argIdx + 1 < argc) {
      configPath = argv[argIdx + 1];
      argIdx += 2;
    } else if (strcmp(argv[argIdx], "--search") == 0 && argIdx + 1 < argc) {
      query = argv[argIdx + 1];
      argIdx += 2;
    } else if (strcmp(argv[argIdx], "--page") == 0 && argIdx + 1 < argc) {
      page = atoi(argv[argIdx + 1]);
      argIdx += 2;
    } else if (strcmp(argv[argIdx], "--progress") == 0 && argIdx + 1 < argc) {
      progressId = argv[argIdx + 1];
      argIdx += 2;
    } else {
      break;
    }
  }

  if (argIdx >= argc) {
    usage();
    return 1;
  }
  const std::string filepath = argv[argIdx];

  EngineConfig config;
  if (configPath) {
    const auto loaded = config.loadFile(configPath);
    if (!loaded.ok()) return fail(loaded.err);
  }
  config.applyLogging();

  auto repo = createDefaultRepository(config);

  const auto format = repo->detectFormat(filepath);
  if (!format.ok()) return fail(format.err);

  const auto opened = repo->openBook(filepath, format.value);
  if (!opened.ok()) return fail(opened.err);

  const BookContent& book = opened.value;
  const BookMetadata& meta = book.metadata;
  printf("%s: \"%s\"", bookFormatDisplayName(book.format), meta.title.c_str());
  if (!meta.author.empty()) printf(" by %s", meta.author.c_str());
  printf("\n");
  printf("  Pages: %d, characters: %lld, about %d min\n", book.totalPages,
         static_cast<long long>(book.totalCharacters), book.estimatedReadingTime);
  if (!meta.language.empty()) printf("  Language: %s\n", meta.language.c_str());
  if (!meta.producer.empty()) printf("  Producer: %s\n", meta.producer.c_str());

  if (showToc) {
    printf("Contents:\n");
    printToc(book.tableOfContents);
  }

  if (page > 0) {
    const auto moved = repo->goToPage(page);
    if (!moved.ok()) return fail(moved.err);
    const auto text = repo->getPageText(page);
    if (!text.ok()) return fail(text.err);
    const auto remaining = repo->estimateRemainingTime(moved.value, config.wordsPerMinute);
    if (!remaining.ok()) return fail(remaining.err);
    printf("--- Page %d (%.0f%%, %d min left) ---\n%s\n", page, moved.value.progressPercentage * 100.0,
           remaining.value, text.value.c_str());
  }

  if (query) {
    const auto found = repo->searchText(query);
    if (!found.ok()) return fail(found.err);
    printf("%zu match(es) for \"%s\"\n", found.value.size(), query);
    for (const auto& r : found.value) {
      printf("  p.%d @%zu: ...%s[%s]%s...\n", r.pageNumber, r.characterPosition, r.contextBefore.c_str(),
             r.snippet.c_str(), r.contextAfter.c_str());
    }
  }

  if (progressId) {
    const auto pos = repo->getCurrentPosition();
    if (!pos.ok()) return fail(pos.err);
    const auto saved = repo->saveProgress(progressId, pos.value);
    if (!saved.ok()) return fail(saved.err);
    printf("Saved page %d as %s\n", pos.value.page, progressId);
  }

  const auto closed = repo->closeBook();
  if (!closed.ok()) return fail(closed.err);
  return 0;
}
