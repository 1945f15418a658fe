#pragma once
#include <string>

#include "XmlSink.h"

// META-INF/container.xml: finds the full-path of the first OPF rootfile
class ContainerParser final : public XmlSink {
  enum ParserState {
    START,
    IN_CONTAINER,
    IN_ROOTFILES,
  };

  ParserState state = START;

  static void XMLCALL startElement(void* userData, const XML_Char* name, const XML_Char** atts);
  static void XMLCALL endElement(void* userData, const XML_Char* name);

 protected:
  void setupHandlers() override;

 public:
  std::string fullPath;

  explicit ContainerParser(const size_t xmlSize) : XmlSink("CTR", xmlSize) {}
};
