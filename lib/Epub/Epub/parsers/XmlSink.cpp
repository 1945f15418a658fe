#include "XmlSink.h"

#include <Logging.h>

#include <cstring>

XmlSink::~XmlSink() { destroyParser(); }

void XmlSink::destroyParser() {
  if (parser) {
    XML_StopParser(parser, XML_FALSE);                // Stop any pending processing
    XML_SetElementHandler(parser, nullptr, nullptr);  // Clear callbacks
    XML_SetCharacterDataHandler(parser, nullptr);
    XML_SetDefaultHandlerExpand(parser, nullptr);
    XML_ParserFree(parser);
    parser = nullptr;
  }
}

bool XmlSink::setup() {
  parser = XML_ParserCreate(nullptr);
  if (!parser) {
    LOG_ERR(logTag, "Couldn't allocate memory for parser");
    return false;
  }

  XML_SetUserData(parser, this);
  setupHandlers();
  return true;
}

void XmlSink::stop() {
  failed_ = true;
  if (parser) XML_StopParser(parser, XML_FALSE);
}

size_t XmlSink::write(const uint8_t* buffer, const size_t size) {
  if (!parser) return 0;

  const uint8_t* currentBufferPos = buffer;
  auto remainingInBuffer = size;

  while (remainingInBuffer > 0) {
    void* const buf = XML_GetBuffer(parser, 1024);
    if (!buf) {
      LOG_ERR(logTag, "Couldn't allocate memory for buffer");
      failed_ = true;
      destroyParser();
      return 0;
    }

    const auto toRead = remainingInBuffer < 1024 ? remainingInBuffer : 1024;
    memcpy(buf, currentBufferPos, toRead);

    if (XML_ParseBuffer(parser, static_cast<int>(toRead), remainingSize <= toRead) == XML_STATUS_ERROR) {
      if (!failed_) {
        LOG_ERR(logTag, "Parse error at line %lu: %s", static_cast<unsigned long>(XML_GetCurrentLineNumber(parser)),
                XML_ErrorString(XML_GetErrorCode(parser)));
      }
      failed_ = true;
      destroyParser();
      return 0;
    }

    currentBufferPos += toRead;
    remainingInBuffer -= toRead;
    remainingSize = remainingSize > toRead ? remainingSize - toRead : 0;
  }

  return size;
}
