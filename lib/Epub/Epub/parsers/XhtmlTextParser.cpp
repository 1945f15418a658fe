#include "XhtmlTextParser.h"

#include <Logging.h>

#include <cstring>

#include "../htmlEntities.h"

#define TAG "XHT"

namespace {
const char* BLOCK_TAGS[] = {"p",      "div",     "h1",         "h2",     "h3",     "h4",    "h5",     "h6",
                            "li",     "ul",      "ol",         "dl",     "dt",     "dd",    "tr",     "table",
                            "pre",    "section", "blockquote", "header", "footer", "aside", "figure", "figcaption",
                            "article", "nav",    "hr",         "br",     "body"};
constexpr int NUM_BLOCK_TAGS = sizeof(BLOCK_TAGS) / sizeof(BLOCK_TAGS[0]);

const char* SKIP_TAGS[] = {"head", "script", "style", "svg"};
constexpr int NUM_SKIP_TAGS = sizeof(SKIP_TAGS) / sizeof(SKIP_TAGS[0]);

const char* localName(const char* name) {
  const char* colon = strrchr(name, ':');
  return colon ? colon + 1 : name;
}

bool matches(const char* tag, const char* const* possibleTags, const int count) {
  for (int i = 0; i < count; i++) {
    if (strcmp(tag, possibleTags[i]) == 0) {
      return true;
    }
  }
  return false;
}

bool isWhitespace(const char c) { return c == ' ' || c == '\r' || c == '\n' || c == '\t'; }
}  // namespace

void XhtmlTextParser::setupHandlers() {
  // Allow undeclared HTML entities (&nbsp;, &mdash;). Expat reports them as skipped
  // instead of failing, and defaultHandler resolves them through the entity table.
  XML_UseForeignDTD(parser, XML_TRUE);
  XML_SetElementHandler(parser, startElement, endElement);
  XML_SetCharacterDataHandler(parser, characterData);
  XML_SetDefaultHandlerExpand(parser, defaultHandler);
}

void XhtmlTextParser::breakLine() {
  pendingSpace = false;
  if (!out.empty() && out.back() != '\n' && out.size() < maxOutput) {
    out += '\n';
  }
}

void XhtmlTextParser::appendText(const char* s, const int len) {
  for (int i = 0; i < len; i++) {
    const char c = s[i];
    if (isWhitespace(c)) {
      pendingSpace = true;
      continue;
    }

    // Leave room for the space too so the cut never lands mid-separator
    const size_t needed = pendingSpace ? 2 : 1;
    if (out.size() + needed > maxOutput) {
      if (!truncated_) {
        LOG_WRN(TAG, "Chapter text truncated at %zu bytes", out.size());
        truncated_ = true;
      }
      return;
    }

    if (pendingSpace && !out.empty() && out.back() != '\n') {
      out += ' ';
    }
    pendingSpace = false;
    out += c;
  }
}

void XhtmlTextParser::finish() {
  while (!out.empty() && (out.back() == '\n' || out.back() == ' ')) {
    out.pop_back();
  }
}

void XMLCALL XhtmlTextParser::startElement(void* userData, const XML_Char* rawName, const XML_Char** atts) {
  (void)atts;
  auto* self = static_cast<XhtmlTextParser*>(userData);
  const char* name = localName(rawName);

  // Middle of skipping
  if (self->skipUntilDepth < self->depth) {
    self->depth++;
    return;
  }

  if (matches(name, SKIP_TAGS, NUM_SKIP_TAGS)) {
    self->skipUntilDepth = self->depth;
    self->depth++;
    return;
  }

  if (matches(name, BLOCK_TAGS, NUM_BLOCK_TAGS)) {
    self->breakLine();
  }
  self->depth++;
}

void XMLCALL XhtmlTextParser::characterData(void* userData, const XML_Char* s, const int len) {
  auto* self = static_cast<XhtmlTextParser*>(userData);
  if (self->skipUntilDepth < self->depth) {
    return;
  }
  self->appendText(s, len);
}

void XMLCALL XhtmlTextParser::defaultHandler(void* userData, const XML_Char* s, const int len) {
  // Undeclared entities arrive here as "&name;". Declarations, comments and processing
  // instructions arrive here too and must not become visible text.
  if (len >= 3 && s[0] == '&' && s[len - 1] == ';') {
    const char* utf8 = lookupHtmlEntity(s + 1, len - 2);
    if (utf8) {
      characterData(userData, utf8, static_cast<int>(strlen(utf8)));
    }
  }
}

void XMLCALL XhtmlTextParser::endElement(void* userData, const XML_Char* rawName) {
  auto* self = static_cast<XhtmlTextParser*>(userData);
  self->depth--;

  if (self->skipUntilDepth == self->depth) {
    self->skipUntilDepth = INT_MAX;
    return;
  }
  if (self->skipUntilDepth < self->depth) {
    return;
  }

  if (matches(localName(rawName), BLOCK_TAGS, NUM_BLOCK_TAGS)) {
    self->breakLine();
  }
}
