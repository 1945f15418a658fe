#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

// Destination for streamed archive data. Returns the number of bytes accepted;
// anything short of `size` aborts the transfer.
class ByteSink {
 public:
  virtual ~ByteSink() = default;
  virtual size_t write(const uint8_t* buffer, size_t size) = 0;
};

// Collects everything written into a string, refusing to grow past `limit` bytes
class StringSink final : public ByteSink {
  std::string& out;
  size_t limit;

 public:
  explicit StringSink(std::string& out, const size_t limit = SIZE_MAX) : out(out), limit(limit) {}

  size_t write(const uint8_t* buffer, const size_t size) override {
    if (out.size() + size > limit) return 0;
    out.append(reinterpret_cast<const char*>(buffer), size);
    return size;
  }
};
