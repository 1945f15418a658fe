#pragma once
#include <ByteSink.h>
#include <expat.h>

#include <cstddef>

// Feeds streamed bytes into an expat parser. Subclasses register their callbacks in
// setupHandlers(); the final buffer is flagged once `xmlSize` bytes have been written.
class XmlSink : public ByteSink {
  const char* logTag;
  size_t remainingSize;
  bool failed_ = false;

  void destroyParser();

 protected:
  XML_Parser parser = nullptr;

  virtual void setupHandlers() = 0;

  // Abort from inside a callback (e.g. runaway nesting)
  void stop();

 public:
  XmlSink(const char* logTag, const size_t xmlSize) : logTag(logTag), remainingSize(xmlSize) {}
  ~XmlSink() override;

  XmlSink(const XmlSink&) = delete;
  XmlSink& operator=(const XmlSink&) = delete;

  bool setup();

  size_t write(const uint8_t* buffer, size_t size) override;

  // True once the parser hit malformed input or was stopped
  bool failed() const { return failed_; }
};
