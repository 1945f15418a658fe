#pragma once
#include <strings.h>

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>

class FsHelpers {
 public:
  // Collapses "a/b/../c" style paths as used inside archives. Leading slashes are dropped.
  static std::string normalisePath(const std::string& path);

  // Directory part of an archive path including the trailing slash ("OEBPS/"), empty at root
  static std::string parentDir(const std::string& path);

  // Last path component
  static std::string fileName(const std::string& path);

  // Text after the last '.' of the file name, lower-cased. Whole lower-cased name if there is no dot.
  static std::string lowercaseExtension(const std::string& path);

  // Case-insensitive extension check. Extension must include dot (e.g., ".epub").
  static inline bool hasExtension(const char* path, const char* ext) {
    if (!path || !ext) return false;
    const char* pathExt = strrchr(path, '.');
    if (!pathExt) return false;
    return strcasecmp(pathExt, ext) == 0;
  }

  static inline bool hasExtension(const std::string& path, const char* ext) { return hasExtension(path.c_str(), ext); }

  static inline bool isPdfFile(const std::string& path) { return hasExtension(path, ".pdf"); }
  static inline bool isEpubFile(const std::string& path) { return hasExtension(path, ".epub"); }
  static inline bool isTxtFile(const std::string& path) { return hasExtension(path, ".txt"); }

  static bool fileExists(const std::string& path);

  // Reads up to `size` bytes from the start of the file. Returns bytes read or -1 if it can't be opened.
  static long readHeader(const std::string& path, uint8_t* buffer, size_t size);

  // Creates every missing directory of `path`
  static bool makeDirs(const std::string& path);
};
