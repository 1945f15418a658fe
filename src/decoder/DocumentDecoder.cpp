#include "DocumentDecoder.h"

namespace quire {

const char* decodeErrorToString(const DecodeError err) {
  switch (err) {
    case DecodeError::Ok:
      return "ok";
    case DecodeError::FileNotFound:
      return "file not found";
    case DecodeError::IoError:
      return "I/O error";
    case DecodeError::CorruptHeader:
      return "corrupt header";
    case DecodeError::ParseFailed:
      return "parse failed";
    case DecodeError::Encrypted:
      return "encrypted";
    case DecodeError::TooLarge:
      return "too large";
    case DecodeError::NoContent:
      return "no content";
    case DecodeError::OutOfRange:
      return "out of range";
  }
  return "unknown";
}

}  // namespace quire
