#pragma once

#include <cstdint>
#include <string>
#include <vector>

// Spine and table of contents of one EPUB, built by the OPF/NCX/nav parsers
class BookIndex {
 public:
  struct SpineEntry {
    std::string href;
    std::string mediaType;
  };

  struct TocEntry {
    std::string title;
    std::string href;
    std::string anchor;
    uint8_t depth;       // 1 = top level
    int16_t spineIndex;  // -1 if the target isn't part of the spine
  };

  void createSpineEntry(const std::string& href, const std::string& mediaType);
  void createTocEntry(const std::string& title, const std::string& href, const std::string& anchor, uint8_t depth);

  int spineIndexForHref(const std::string& href) const;
  void clear();

  const std::vector<SpineEntry>& spine() const { return spine_; }
  const std::vector<TocEntry>& toc() const { return toc_; }
  void clearToc() { toc_.clear(); }

 private:
  std::vector<SpineEntry> spine_;
  std::vector<TocEntry> toc_;
};
