#pragma once
#include <string>
#include <unordered_map>

#include "XmlSink.h"

constexpr size_t MAX_TITLE_LENGTH = 256;
constexpr size_t MAX_AUTHOR_LENGTH = 128;
constexpr size_t MAX_META_LENGTH = 256;

class BookIndex;

// Package document: metadata, manifest and spine
class ContentOpfParser final : public XmlSink {
  enum ParserState {
    START,
    IN_PACKAGE,
    IN_METADATA,
    IN_META_FIELD,
    IN_MANIFEST,
    IN_SPINE,
  };

  struct ManifestItem {
    std::string href;
    std::string mediaType;
  };

  const std::string& baseContentPath;
  ParserState state = START;
  BookIndex* index;
  std::unordered_map<std::string, ManifestItem> manifestIndex;  // itemId -> item
  std::string spineTocId;
  std::string* currentField = nullptr;
  size_t currentFieldLimit = 0;

  static void XMLCALL startElement(void* userData, const XML_Char* name, const XML_Char** atts);
  static void XMLCALL characterData(void* userData, const XML_Char* s, int len);
  static void XMLCALL endElement(void* userData, const XML_Char* name);

 protected:
  void setupHandlers() override;

 public:
  std::string title;
  std::string author;
  std::string language;
  std::string identifier;
  std::string publisher;
  std::string subject;
  std::string tocNcxPath;
  std::string tocNavPath;  // EPUB 3 nav document path

  explicit ContentOpfParser(const std::string& baseContentPath, const size_t xmlSize, BookIndex* index)
      : XmlSink("COF", xmlSize), baseContentPath(baseContentPath), index(index) {}
};
