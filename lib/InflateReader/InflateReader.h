#pragma once

#include <uzlib.h>

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <memory>

enum class InflateStatus { Ok, Done, Error };

// Streams one raw deflate member out of an open file.
//
// The compressed bytes are pulled from the file's current position in chunks of at most
// `chunkSize`, never past `compressedSize`. A 32KB dictionary lets the output be drained
// through readAtMost() in windows of any size.
class InflateReader {
 public:
  InflateReader() = default;

  InflateReader(const InflateReader&) = delete;
  InflateReader& operator=(const InflateReader&) = delete;

  // Resets the reader onto a new member. False if the buffers can't be allocated.
  bool begin(FILE* source, size_t compressedSize, size_t chunkSize);

  // Produces up to maxLen bytes, reporting how many were written
  InflateStatus readAtMost(uint8_t* dest, size_t maxLen, size_t* produced);

  size_t compressedRemaining() const { return remaining; }

 private:
  // uzlib hands its read callback nothing but its own state
  struct Hook {
    uzlib_uncomp decomp;
    InflateReader* owner;
  };

  static int refill(uzlib_uncomp* uncomp);

  Hook hook = {};
  std::unique_ptr<uint8_t[]> dictionary;
  std::unique_ptr<uint8_t[]> input;
  size_t inputSize = 0;
  FILE* file = nullptr;
  size_t remaining = 0;
};
