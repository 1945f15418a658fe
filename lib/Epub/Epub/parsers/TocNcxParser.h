#pragma once
#include <string>

#include "XmlSink.h"

constexpr int MAX_NCX_DEPTH = 100;
constexpr size_t MAX_LABEL_LENGTH = 512;

class BookIndex;

// EPUB 2 toc.ncx navMap
class TocNcxParser final : public XmlSink {
  enum ParserState { START, IN_NCX, IN_NAV_MAP, IN_NAV_POINT, IN_NAV_LABEL, IN_NAV_LABEL_TEXT };

  const std::string& baseContentPath;
  ParserState state = START;
  BookIndex* index;

  std::string currentLabel;
  std::string currentSrc;
  uint8_t currentDepth = 0;

  static void XMLCALL startElement(void* userData, const XML_Char* name, const XML_Char** atts);
  static void XMLCALL characterData(void* userData, const XML_Char* s, int len);
  static void XMLCALL endElement(void* userData, const XML_Char* name);

 protected:
  void setupHandlers() override;

 public:
  explicit TocNcxParser(const std::string& baseContentPath, const size_t xmlSize, BookIndex* index)
      : XmlSink("TOC_NCX", xmlSize), baseContentPath(baseContentPath), index(index) {}
};
