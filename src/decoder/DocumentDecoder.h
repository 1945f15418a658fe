#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace quire {

enum class DecodeError : uint8_t {
  Ok = 0,
  FileNotFound,
  IoError,
  CorruptHeader,
  ParseFailed,
  Encrypted,
  TooLarge,
  NoContent,
  OutOfRange,
};

const char* decodeErrorToString(DecodeError err);

struct DecodeStatus {
  DecodeError code = DecodeError::Ok;
  std::string detail;

  bool ok() const { return code == DecodeError::Ok; }

  static DecodeStatus success() { return DecodeStatus{}; }
  static DecodeStatus failure(const DecodeError code, std::string detail) { return {code, std::move(detail)}; }
};

struct DecodedTocEntry {
  std::string title;
  int unit;   // 0-based page or chapter, -1 if unresolved
  int depth;  // 0 = top level
};

struct DecodedMetadata {
  std::string title;
  std::string author;
  std::string subject;
  std::string language;
  std::string identifier;
  std::string creator;
  std::string producer;
};

// One document format behind a uniform unit model: a PDF unit is a page, an
// EPUB unit is a spine chapter. Units are 0-based at this layer.
class DocumentDecoder {
 public:
  virtual ~DocumentDecoder() = default;

  virtual DecodeStatus open(const std::string& path) = 0;
  // Releases the document. The decoder is closed afterwards even if this fails.
  virtual DecodeStatus close() = 0;
  virtual bool isOpen() const = 0;

  // Header sniff, no parsing
  virtual bool probe(const std::string& path) const = 0;

  virtual int unitCount() const = 0;
  virtual DecodeStatus unitText(int index, std::string* out) = 0;
  virtual DecodeStatus tableOfContents(std::vector<DecodedTocEntry>* out) = 0;
  virtual DecodedMetadata metadata() const = 0;

  // Source document of a unit inside the container, empty if the format has none
  virtual std::string unitHref(int /*index*/) const { return ""; }

  // Unit bounds in points
  virtual DecodeStatus unitSize(int /*index*/, double* /*width*/, double* /*height*/) {
    return DecodeStatus::failure(DecodeError::NoContent, "unit size not available");
  }
};

}  // namespace quire
