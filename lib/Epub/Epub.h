#pragma once

#include <ByteSink.h>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "Epub/BookIndex.h"

class ZipFile;

enum class EpubError : uint8_t {
  None = 0,
  OpenFailed,        // archive can't be opened
  NotAZip,           // no zip structure
  MissingContainer,  // META-INF/container.xml absent or without a rootfile
  MissingPackage,    // OPF named by the container isn't in the archive
  BadPackage,        // OPF is not well-formed
  EmptySpine,
  ItemMissing,
  TooLarge,  // an item inflates past the configured limit
  ParseFailed,
};

const char* epubErrorToString(EpubError err);

class Epub {
 public:
  struct Metadata {
    std::string title;
    std::string author;
    std::string language;
    std::string identifier;
    std::string publisher;
    std::string subject;
  };

  static constexpr size_t DEFAULT_MAX_ITEM_SIZE = 32 * 1024 * 1024;

 private:
  // where is the EPUB file?
  std::string filepath;
  // the base path for items in the EPUB file
  std::string contentBasePath;
  // the ncx file (EPUB 2)
  std::string tocNcxItem;
  // the nav file (EPUB 3)
  std::string tocNavItem;
  size_t maxItemSize;
  std::unique_ptr<ZipFile> zip;
  BookIndex index;
  Metadata metadata;
  EpubError lastError_ = EpubError::None;

  bool findContentOpfFile(std::string* contentOpfFile);
  bool parseContentOpf();
  bool parseTocNcxFile();
  bool parseTocNavFile();
  bool fail(EpubError err);
  EpubError itemError() const;

 public:
  explicit Epub(std::string filepath, size_t maxItemSize = DEFAULT_MAX_ITEM_SIZE);
  ~Epub();

  Epub(const Epub&) = delete;
  Epub& operator=(const Epub&) = delete;

  // Reads container, package and TOC. The archive stays open until close().
  bool load();
  void close();
  bool isLoaded() const { return zip != nullptr; }

  const std::string& getPath() const { return filepath; }
  const std::string& getBasePath() const { return contentBasePath; }
  const Metadata& getMetadata() const { return metadata; }

  bool readItemContentsToString(const std::string& itemHref, std::string* out);
  bool readItemContentsToStream(const std::string& itemHref, ByteSink& out, size_t chunkSize);
  bool getItemSize(const std::string& itemHref, size_t* size);

  // Plain text of one spine item
  bool extractSpineItemText(int spineIndex, std::string* out);

  int getSpineItemsCount() const { return static_cast<int>(index.spine().size()); }
  const BookIndex::SpineEntry& getSpineItem(int spineIndex) const { return index.spine()[spineIndex]; }
  int getTocItemsCount() const { return static_cast<int>(index.toc().size()); }
  const BookIndex::TocEntry& getTocItem(int tocIndex) const { return index.toc()[tocIndex]; }

  EpubError lastError() const { return lastError_; }
};
