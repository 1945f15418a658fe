#include "BookIndex.h"

void BookIndex::createSpineEntry(const std::string& href, const std::string& mediaType) {
  spine_.push_back({href, mediaType});
}

void BookIndex::createTocEntry(const std::string& title, const std::string& href, const std::string& anchor,
                               const uint8_t depth) {
  const int spineIndex = spineIndexForHref(href);
  toc_.push_back({title, href, anchor, depth, static_cast<int16_t>(spineIndex)});
}

int BookIndex::spineIndexForHref(const std::string& href) const {
  for (size_t i = 0; i < spine_.size(); i++) {
    if (spine_[i].href == href) {
      return static_cast<int>(i);
    }
  }
  return -1;
}

void BookIndex::clear() {
  spine_.clear();
  toc_.clear();
}
