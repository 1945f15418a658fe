#pragma once
#include <climits>
#include <string>

#include "XmlSink.h"

// Flattens one XHTML chapter to plain UTF-8 text.
// Block elements end a line, runs of whitespace collapse to one space, and
// <head>, <script> and <style> content is dropped.
class XhtmlTextParser final : public XmlSink {
  std::string& out;
  size_t maxOutput;
  int depth = 0;
  int skipUntilDepth = INT_MAX;
  bool pendingSpace = false;
  bool truncated_ = false;

  void appendText(const char* s, int len);
  void breakLine();

  static void XMLCALL startElement(void* userData, const XML_Char* name, const XML_Char** atts);
  static void XMLCALL characterData(void* userData, const XML_Char* s, int len);
  static void XMLCALL endElement(void* userData, const XML_Char* name);
  static void XMLCALL defaultHandler(void* userData, const XML_Char* s, int len);

 protected:
  void setupHandlers() override;

 public:
  XhtmlTextParser(std::string& out, const size_t xmlSize, const size_t maxOutput)
      : XmlSink("XHT", xmlSize), out(out), maxOutput(maxOutput) {}

  // Removes the trailing line break left by the last block
  void finish();

  // Output hit maxOutput and the rest of the chapter was dropped
  bool truncated() const { return truncated_; }
};
