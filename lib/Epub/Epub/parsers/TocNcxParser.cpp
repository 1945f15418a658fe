#include "TocNcxParser.h"

#include <FsHelpers.h>
#include <Logging.h>

#include <cstring>

#include "../BookIndex.h"
#include "TocHref.h"

#define TAG "TOC_NCX"

void TocNcxParser::setupHandlers() {
  XML_SetElementHandler(parser, startElement, endElement);
  XML_SetCharacterDataHandler(parser, characterData);
}

void XMLCALL TocNcxParser::startElement(void* userData, const XML_Char* name, const XML_Char** atts) {
  // NOTE: navLabel and content must come before any nested navPoint, as the NCX format requires:
  // <navPoint>
  //   <navLabel><text>Chapter 1</text></navLabel>
  //   <content src="ch1.html"/>
  //   <navPoint> ...nested... </navPoint>
  // </navPoint>
  auto* self = static_cast<TocNcxParser*>(userData);

  if (self->state == START && strcmp(name, "ncx") == 0) {
    self->state = IN_NCX;
    return;
  }

  if (self->state == IN_NCX && strcmp(name, "navMap") == 0) {
    self->state = IN_NAV_MAP;
    return;
  }

  // Handles both top-level and nested navPoints
  if ((self->state == IN_NAV_MAP || self->state == IN_NAV_POINT) && strcmp(name, "navPoint") == 0) {
    if (self->currentDepth >= MAX_NCX_DEPTH) {
      LOG_ERR(TAG, "navPoint nesting deeper than %d, giving up", MAX_NCX_DEPTH);
      self->stop();
      return;
    }

    self->state = IN_NAV_POINT;
    self->currentDepth++;

    self->currentLabel.clear();
    self->currentSrc.clear();
    return;
  }

  if (self->state == IN_NAV_POINT && strcmp(name, "navLabel") == 0) {
    self->state = IN_NAV_LABEL;
    return;
  }

  if (self->state == IN_NAV_LABEL && strcmp(name, "text") == 0) {
    self->state = IN_NAV_LABEL_TEXT;
    return;
  }

  if (self->state == IN_NAV_POINT && strcmp(name, "content") == 0) {
    for (int i = 0; atts[i]; i += 2) {
      if (strcmp(atts[i], "src") == 0) {
        self->currentSrc = atts[i + 1];
        break;
      }
    }
  }
}

void XMLCALL TocNcxParser::characterData(void* userData, const XML_Char* s, const int len) {
  auto* self = static_cast<TocNcxParser*>(userData);
  if (self->state != IN_NAV_LABEL_TEXT) return;

  if (self->currentLabel.size() + static_cast<size_t>(len) <= MAX_LABEL_LENGTH) {
    self->currentLabel.append(s, len);
  } else if (self->currentLabel.size() < MAX_LABEL_LENGTH) {
    self->currentLabel.append(s, MAX_LABEL_LENGTH - self->currentLabel.size());
    LOG_DBG(TAG, "Label truncated at %zu bytes", MAX_LABEL_LENGTH);
  }
}

void XMLCALL TocNcxParser::endElement(void* userData, const XML_Char* name) {
  auto* self = static_cast<TocNcxParser*>(userData);

  if (self->state == IN_NAV_LABEL_TEXT && strcmp(name, "text") == 0) {
    self->state = IN_NAV_LABEL;
    return;
  }

  if (self->state == IN_NAV_LABEL && strcmp(name, "navLabel") == 0) {
    self->state = IN_NAV_POINT;
    return;
  }

  if (self->state == IN_NAV_POINT && strcmp(name, "content") == 0) {
    // Label and src are both known once <content/> closes
    if (!self->currentLabel.empty() && !self->currentSrc.empty()) {
      std::string href;
      std::string anchor;
      splitTocHref(self->baseContentPath, self->currentSrc, &href, &anchor);
      if (self->index) {
        self->index->createTocEntry(collapseLabel(self->currentLabel), href, anchor, self->currentDepth);
      }
      // Clear them so we don't re-add them if there are weird XML structures
      self->currentLabel.clear();
      self->currentSrc.clear();
    }
    return;
  }

  if (self->state == IN_NAV_POINT && strcmp(name, "navPoint") == 0) {
    self->currentDepth--;
    if (self->currentDepth == 0) {
      self->state = IN_NAV_MAP;
    }
    return;
  }

  if (self->state == IN_NAV_MAP && strcmp(name, "navMap") == 0) {
    self->state = IN_NCX;
  }
}
