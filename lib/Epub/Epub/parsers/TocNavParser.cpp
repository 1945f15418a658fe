#include "TocNavParser.h"

#include <Logging.h>

#include <cstring>

#include "../BookIndex.h"
#include "../htmlEntities.h"
#include "TocHref.h"

#define TAG "TOC_NAV"

namespace {
const char* localName(const char* name) {
  const char* colon = strrchr(name, ':');
  return colon ? colon + 1 : name;
}

bool isTocNav(const XML_Char** atts) {
  for (int i = 0; atts[i]; i += 2) {
    if (strcmp(atts[i], "epub:type") == 0 || strcmp(localName(atts[i]), "type") == 0) {
      // epub:type is a space separated list, "toc" must be one of its words
      const char* value = atts[i + 1];
      const char* hit = strstr(value, "toc");
      while (hit) {
        const bool startOk = hit == value || hit[-1] == ' ';
        const bool endOk = hit[3] == '\0' || hit[3] == ' ';
        if (startOk && endOk) return true;
        hit = strstr(hit + 3, "toc");
      }
    }
  }
  return false;
}
}  // namespace

void TocNavParser::setupHandlers() {
  // nav documents are XHTML and may use HTML entities without declaring them
  XML_UseForeignDTD(parser, XML_TRUE);
  XML_SetElementHandler(parser, startElement, endElement);
  XML_SetCharacterDataHandler(parser, characterData);
  XML_SetDefaultHandlerExpand(parser, defaultHandler);
}

void XMLCALL TocNavParser::startElement(void* userData, const XML_Char* rawName, const XML_Char** atts) {
  auto* self = static_cast<TocNavParser*>(userData);
  const char* name = localName(rawName);

  if (self->state == START) {
    if (strcmp(name, "nav") == 0 && isTocNav(atts)) {
      self->state = IN_NAV_TOC;
      self->navDepth = 1;
      self->olDepth = 0;
    }
    return;
  }

  self->navDepth++;

  if (self->state == IN_NAV_TOC && strcmp(name, "ol") == 0) {
    if (++self->olDepth > MAX_NAV_DEPTH) {
      LOG_ERR(TAG, "List nesting deeper than %d, giving up", MAX_NAV_DEPTH);
      self->stop();
    }
    return;
  }

  if (self->state == IN_NAV_TOC && strcmp(name, "a") == 0) {
    self->state = IN_ANCHOR;
    self->currentLabel.clear();
    self->currentHref.clear();
    for (int i = 0; atts[i]; i += 2) {
      if (strcmp(atts[i], "href") == 0) {
        self->currentHref = atts[i + 1];
        break;
      }
    }
  }
}

void XMLCALL TocNavParser::characterData(void* userData, const XML_Char* s, const int len) {
  auto* self = static_cast<TocNavParser*>(userData);
  if (self->state != IN_ANCHOR) return;

  const size_t room = MAX_NAV_LABEL_LENGTH - self->currentLabel.size();
  self->currentLabel.append(s, static_cast<size_t>(len) < room ? static_cast<size_t>(len) : room);
}

void XMLCALL TocNavParser::defaultHandler(void* userData, const XML_Char* s, const int len) {
  if (len >= 3 && s[0] == '&' && s[len - 1] == ';') {
    const char* utf8 = lookupHtmlEntity(s + 1, len - 2);
    if (utf8) {
      characterData(userData, utf8, static_cast<int>(strlen(utf8)));
    }
  }
}

void XMLCALL TocNavParser::endElement(void* userData, const XML_Char* rawName) {
  auto* self = static_cast<TocNavParser*>(userData);
  if (self->state == START) return;

  const char* name = localName(rawName);
  self->navDepth--;

  if (self->state == IN_ANCHOR && strcmp(name, "a") == 0) {
    self->state = IN_NAV_TOC;
    const std::string label = collapseLabel(self->currentLabel);
    if (!label.empty() && !self->currentHref.empty() && self->olDepth > 0) {
      std::string href;
      std::string anchor;
      splitTocHref(self->baseContentPath, self->currentHref, &href, &anchor);
      if (self->index) {
        self->index->createTocEntry(label, href, anchor, static_cast<uint8_t>(self->olDepth));
      }
    }
    return;
  }

  if (self->state == IN_NAV_TOC && strcmp(name, "ol") == 0) {
    self->olDepth--;
    return;
  }

  if (self->navDepth == 0) {
    // </nav> of the toc; later navs (landmarks, page-list) are not read
    self->state = START;
    XML_SetElementHandler(self->parser, nullptr, nullptr);
    XML_SetCharacterDataHandler(self->parser, nullptr);
  }
}
