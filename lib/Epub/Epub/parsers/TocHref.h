#pragma once
#include <FsHelpers.h>

#include <string>

// Resolves a TOC link against the directory of the document it appears in
// and splits off the fragment: "../Text/ch1.xhtml#s2" -> ("OEBPS/Text/ch1.xhtml", "s2")
inline void splitTocHref(const std::string& basePath, const std::string& link, std::string* href,
                         std::string* anchor) {
  std::string resolved = FsHelpers::normalisePath(basePath + link);
  const size_t pos = resolved.find('#');
  if (pos != std::string::npos) {
    *anchor = resolved.substr(pos + 1);
    resolved.resize(pos);
  } else {
    anchor->clear();
  }
  *href = std::move(resolved);
}

// Labels often carry the source document's line breaks and indentation
inline std::string collapseLabel(const std::string& label) {
  std::string out;
  out.reserve(label.size());
  bool pendingSpace = false;
  for (const char c : label) {
    if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
      pendingSpace = !out.empty();
      continue;
    }
    if (pendingSpace) {
      out += ' ';
      pendingSpace = false;
    }
    out += c;
  }
  return out;
}
