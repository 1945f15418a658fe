#include "ContainerParser.h"

#include <cstring>

void ContainerParser::setupHandlers() { XML_SetElementHandler(parser, startElement, endElement); }

void XMLCALL ContainerParser::startElement(void* userData, const XML_Char* name, const XML_Char** atts) {
  auto* self = static_cast<ContainerParser*>(userData);

  if (self->state == START && strcmp(name, "container") == 0) {
    self->state = IN_CONTAINER;
    return;
  }

  if (self->state == IN_CONTAINER && strcmp(name, "rootfiles") == 0) {
    self->state = IN_ROOTFILES;
    return;
  }

  if (self->state == IN_ROOTFILES && strcmp(name, "rootfile") == 0 && self->fullPath.empty()) {
    std::string path;
    bool isOpf = true;
    for (int i = 0; atts[i]; i += 2) {
      if (strcmp(atts[i], "full-path") == 0) {
        path = atts[i + 1];
      } else if (strcmp(atts[i], "media-type") == 0) {
        isOpf = strcmp(atts[i + 1], "application/oebps-package+xml") == 0;
      }
    }
    if (isOpf) {
      self->fullPath = path;
    }
  }
}

void XMLCALL ContainerParser::endElement(void* userData, const XML_Char* name) {
  auto* self = static_cast<ContainerParser*>(userData);

  if (self->state == IN_ROOTFILES && strcmp(name, "rootfiles") == 0) {
    self->state = IN_CONTAINER;
  } else if (self->state == IN_CONTAINER && strcmp(name, "container") == 0) {
    self->state = START;
  }
}
