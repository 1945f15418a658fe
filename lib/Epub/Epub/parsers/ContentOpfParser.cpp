#include "ContentOpfParser.h"

#include <FsHelpers.h>
#include <Logging.h>

#include <cstring>

#include "../BookIndex.h"

#define TAG "COF"

namespace {
constexpr char MEDIA_TYPE_NCX[] = "application/x-dtbncx+xml";

// Matches both "item" and "opf:item"
bool isElement(const char* name, const char* expected) {
  if (strncmp(name, "opf:", 4) == 0) name += 4;
  return strcmp(name, expected) == 0;
}

// Find the last valid UTF-8 boundary within maxLen bytes
size_t findUtf8Boundary(const char* s, const size_t maxLen) {
  size_t pos = maxLen;
  while (pos > 0 && (static_cast<unsigned char>(s[pos]) & 0xC0) == 0x80) {
    pos--;
  }
  return pos;
}

// space-separated property list contains `word`
bool hasProperty(const std::string& properties, const char* word) {
  size_t start = 0;
  const size_t wordLen = strlen(word);
  while (start < properties.size()) {
    size_t end = properties.find(' ', start);
    if (end == std::string::npos) end = properties.size();
    if (end - start == wordLen && properties.compare(start, wordLen, word) == 0) return true;
    start = end + 1;
  }
  return false;
}
}  // namespace

void ContentOpfParser::setupHandlers() {
  XML_SetElementHandler(parser, startElement, endElement);
  XML_SetCharacterDataHandler(parser, characterData);
}

void XMLCALL ContentOpfParser::startElement(void* userData, const XML_Char* name, const XML_Char** atts) {
  auto* self = static_cast<ContentOpfParser*>(userData);

  if (self->state == START && isElement(name, "package")) {
    self->state = IN_PACKAGE;
    return;
  }

  if (self->state == IN_PACKAGE && isElement(name, "metadata")) {
    self->state = IN_METADATA;
    return;
  }

  if (self->state == IN_METADATA) {
    std::string* field = nullptr;
    size_t limit = MAX_META_LENGTH;
    if (strcmp(name, "dc:title") == 0 && self->title.empty()) {
      field = &self->title;
      limit = MAX_TITLE_LENGTH;
    } else if (strcmp(name, "dc:creator") == 0) {
      if (!self->author.empty()) self->author += ", ";
      field = &self->author;
      limit = MAX_AUTHOR_LENGTH;
    } else if (strcmp(name, "dc:language") == 0 && self->language.empty()) {
      field = &self->language;
    } else if (strcmp(name, "dc:identifier") == 0 && self->identifier.empty()) {
      field = &self->identifier;
    } else if (strcmp(name, "dc:publisher") == 0 && self->publisher.empty()) {
      field = &self->publisher;
    } else if (strcmp(name, "dc:subject") == 0 && self->subject.empty()) {
      field = &self->subject;
    }

    if (field) {
      self->state = IN_META_FIELD;
      self->currentField = field;
      self->currentFieldLimit = limit;
    }
    return;
  }

  if (self->state == IN_PACKAGE && isElement(name, "manifest")) {
    self->state = IN_MANIFEST;
    return;
  }

  if (self->state == IN_PACKAGE && isElement(name, "spine")) {
    self->state = IN_SPINE;
    for (int i = 0; atts[i]; i += 2) {
      if (strcmp(atts[i], "toc") == 0) {
        self->spineTocId = atts[i + 1];
      }
    }
    // EPUB 2 books that only name the NCX through the spine
    if (self->tocNcxPath.empty() && !self->spineTocId.empty()) {
      const auto it = self->manifestIndex.find(self->spineTocId);
      if (it != self->manifestIndex.end()) {
        self->tocNcxPath = it->second.href;
      }
    }
    return;
  }

  if (self->state == IN_MANIFEST && isElement(name, "item")) {
    std::string itemId;
    std::string href;
    std::string mediaType;
    std::string properties;

    for (int i = 0; atts[i]; i += 2) {
      if (strcmp(atts[i], "id") == 0) {
        itemId = atts[i + 1];
      } else if (strcmp(atts[i], "href") == 0) {
        href = FsHelpers::normalisePath(self->baseContentPath + atts[i + 1]);
      } else if (strcmp(atts[i], "media-type") == 0) {
        mediaType = atts[i + 1];
      } else if (strcmp(atts[i], "properties") == 0) {
        properties = atts[i + 1];
      }
    }

    if (mediaType == MEDIA_TYPE_NCX) {
      if (self->tocNcxPath.empty()) {
        self->tocNcxPath = href;
      } else {
        LOG_WRN(TAG, "Multiple NCX files found in manifest. Ignoring duplicate: %s", href.c_str());
      }
    }

    if (self->tocNavPath.empty() && hasProperty(properties, "nav")) {
      self->tocNavPath = href;
      LOG_DBG(TAG, "Found EPUB 3 nav document: %s", href.c_str());
    }

    self->manifestIndex[itemId] = {href, mediaType};
    return;
  }

  // NOTE: This relies on spine appearing after the manifest, which the package format requires
  if (self->state == IN_SPINE && isElement(name, "itemref") && self->index) {
    for (int i = 0; atts[i]; i += 2) {
      if (strcmp(atts[i], "idref") == 0) {
        const auto it = self->manifestIndex.find(atts[i + 1]);
        if (it != self->manifestIndex.end()) {
          self->index->createSpineEntry(it->second.href, it->second.mediaType);
        } else {
          LOG_WRN(TAG, "Spine references unknown item: %s", atts[i + 1]);
        }
      }
    }
  }
}

void XMLCALL ContentOpfParser::characterData(void* userData, const XML_Char* s, const int len) {
  auto* self = static_cast<ContentOpfParser*>(userData);
  if (self->state != IN_META_FIELD || !self->currentField) return;

  std::string& field = *self->currentField;
  if (field.size() + static_cast<size_t>(len) <= self->currentFieldLimit) {
    field.append(s, len);
  } else if (field.size() < self->currentFieldLimit) {
    const size_t safeLen = findUtf8Boundary(s, self->currentFieldLimit - field.size());
    field.append(s, safeLen);
    LOG_DBG(TAG, "Metadata field truncated at %zu bytes", field.size());
  }
}

void XMLCALL ContentOpfParser::endElement(void* userData, const XML_Char* name) {
  auto* self = static_cast<ContentOpfParser*>(userData);

  if (self->state == IN_META_FIELD) {
    // Metadata fields don't nest, any closing tag ends the field
    self->state = IN_METADATA;
    self->currentField = nullptr;
    return;
  }

  if ((self->state == IN_METADATA && isElement(name, "metadata")) ||
      (self->state == IN_MANIFEST && isElement(name, "manifest")) ||
      (self->state == IN_SPINE && isElement(name, "spine"))) {
    self->state = IN_PACKAGE;
    return;
  }

  if (self->state == IN_PACKAGE && isElement(name, "package")) {
    self->state = START;
  }
}
