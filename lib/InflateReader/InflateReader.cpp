#include "InflateReader.h"

#include <new>
#include <type_traits>

namespace {
constexpr size_t INFLATE_DICT_SIZE = 32768;
}

bool InflateReader::begin(FILE* source, const size_t compressedSize, const size_t chunkSize) {
  static_assert(std::is_standard_layout<Hook>::value, "refill() casts uzlib_uncomp* back to its Hook");

  if (!dictionary) {
    dictionary.reset(new (std::nothrow) uint8_t[INFLATE_DICT_SIZE]());
    if (!dictionary) return false;
  }
  if (!input || inputSize != chunkSize) {
    inputSize = 0;
    input.reset(chunkSize > 0 ? new (std::nothrow) uint8_t[chunkSize] : nullptr);
    if (!input) return false;
    inputSize = chunkSize;
  }

  file = source;
  remaining = compressedSize;

  hook.decomp = uzlib_uncomp();
  hook.owner = this;
  uzlib_uncompress_init(&hook.decomp, dictionary.get(), INFLATE_DICT_SIZE);
  hook.decomp.source = nullptr;
  hook.decomp.source_limit = nullptr;
  hook.decomp.source_read_cb = refill;
  return true;
}

int InflateReader::refill(uzlib_uncomp* uncomp) {
  InflateReader* self = reinterpret_cast<Hook*>(uncomp)->owner;
  if (self->remaining == 0 || !self->file) return -1;

  const size_t toRead = self->remaining < self->inputSize ? self->remaining : self->inputSize;
  const size_t bytesRead = fread(self->input.get(), 1, toRead, self->file);
  if (bytesRead == 0) return -1;
  self->remaining -= bytesRead;

  // uzlib takes the first byte as the return value and the rest through source
  uncomp->source = self->input.get() + 1;
  uncomp->source_limit = self->input.get() + bytesRead;
  return self->input[0];
}

InflateStatus InflateReader::readAtMost(uint8_t* dest, const size_t maxLen, size_t* produced) {
  *produced = 0;
  if (!dictionary) return InflateStatus::Error;

  hook.decomp.dest = dest;
  hook.decomp.dest_limit = dest + maxLen;

  const int res = uzlib_uncompress(&hook.decomp);
  *produced = static_cast<size_t>(hook.decomp.dest - dest);

  if (res == TINF_DONE) return InflateStatus::Done;
  if (res < 0) return InflateStatus::Error;
  return InflateStatus::Ok;
}
