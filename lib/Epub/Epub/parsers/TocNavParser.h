#pragma once
#include <string>

#include "XmlSink.h"

constexpr size_t MAX_NAV_LABEL_LENGTH = 512;
constexpr int MAX_NAV_DEPTH = 100;

class BookIndex;

// Parser for EPUB 3 nav.xhtml navigation documents
// Only the <nav epub:type="toc"> element is read; landmarks and page lists are ignored
class TocNavParser final : public XmlSink {
  enum ParserState {
    START,
    IN_NAV_TOC,  // Inside <nav epub:type="toc">
    IN_ANCHOR,   // Inside <a> of a toc <li>
  };

  const std::string& baseContentPath;
  ParserState state = START;
  BookIndex* index;

  // Element depth inside the toc nav, used to find its closing tag
  int navDepth = 0;
  // Track nesting depth for <ol> elements to determine TOC depth
  int olDepth = 0;
  std::string currentLabel;
  std::string currentHref;

  static void XMLCALL startElement(void* userData, const XML_Char* name, const XML_Char** atts);
  static void XMLCALL characterData(void* userData, const XML_Char* s, int len);
  static void XMLCALL endElement(void* userData, const XML_Char* name);
  static void XMLCALL defaultHandler(void* userData, const XML_Char* s, int len);

 protected:
  void setupHandlers() override;

 public:
  explicit TocNavParser(const std::string& baseContentPath, const size_t xmlSize, BookIndex* index)
      : XmlSink("TOC_NAV", xmlSize), baseContentPath(baseContentPath), index(index) {}
};
