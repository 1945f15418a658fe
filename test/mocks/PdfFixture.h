#pragma once

#include <cstdio>
#include <string>
#include <vector>

// Minimal PDF writer for decoder tests: Helvetica text pages, an Info
// dictionary and an optional outline, with a correct cross-reference table.

struct PdfOutlineEntry {
  std::string title;
  int page;   // 0-based target
  int depth;  // 0 = top level, each entry nests under the closest shallower one
};

struct PdfBookLayout {
  std::string title;
  std::string author;
  std::vector<std::vector<std::string>> pages;  // lines of text per page
  std::vector<PdfOutlineEntry> outline;
};

namespace pdffixture {
inline std::string literal(const std::string& text) {
  std::string out = "(";
  for (const char c : text) {
    if (c == '(' || c == ')' || c == '\\') out += '\\';
    out += c;
  }
  return out + ")";
}

inline std::string ref(const int obj) { return std::to_string(obj) + " 0 R"; }
}  // namespace pdffixture

inline bool writePdf(const std::string& path, const PdfBookLayout& layout) {
  using pdffixture::literal;
  using pdffixture::ref;

  // 1 catalog, 2 page tree, 3 font, 4 info, then page/content pairs, then outline root and items
  const int pageCount = static_cast<int>(layout.pages.size());
  const int firstPageObj = 5;
  const int outlineRootObj = firstPageObj + 2 * pageCount;
  const int firstOutlineObj = outlineRootObj + 1;
  const int itemCount = static_cast<int>(layout.outline.size());
  const bool hasOutline = itemCount > 0;

  std::vector<std::string> objects;
  objects.push_back("<< /Type /Catalog /Pages 2 0 R" +
                    (hasOutline ? " /Outlines " + ref(outlineRootObj) + " /PageMode /UseOutlines" : std::string()) +
                    " >>");

  std::string kids;
  for (int i = 0; i < pageCount; i++) kids += ref(firstPageObj + 2 * i) + " ";
  objects.push_back("<< /Type /Pages /Kids [" + kids + "] /Count " + std::to_string(pageCount) + " >>");
  objects.push_back("<< /Type /Font /Subtype /Type1 /BaseFont /Helvetica /Encoding /WinAnsiEncoding >>");
  objects.push_back("<< /Title " + literal(layout.title) + " /Author " + literal(layout.author) +
                    " /Producer (quire fixture) >>");

  for (int i = 0; i < pageCount; i++) {
    objects.push_back("<< /Type /Page /Parent 2 0 R /MediaBox [0 0 612 792] /Resources << /Font << /F1 3 0 R >> >>"
                      " /Contents " + ref(firstPageObj + 2 * i + 1) + " >>");
    std::string stream = "BT /F1 14 Tf 72 720 Td 18 TL";
    for (const auto& line : layout.pages[i]) stream += " " + literal(line) + " Tj T*";
    stream += " ET";
    objects.push_back("<< /Length " + std::to_string(stream.size()) + " >>\nstream\n" + stream + "\nendstream");
  }

  if (hasOutline) {
    // Parent of each item: the closest earlier item one level up, or the root
    std::vector<int> parent(itemCount, -1);
    for (int i = 0; i < itemCount; i++) {
      for (int j = i - 1; j >= 0; j--) {
        if (layout.outline[j].depth < layout.outline[i].depth) {
          parent[i] = j;
          break;
        }
      }
    }
    auto objOf = [&](const int item) { return item < 0 ? outlineRootObj : firstOutlineObj + item; };
    auto siblings = [&](const int p) {
      std::vector<int> out;
      for (int i = 0; i < itemCount; i++) {
        if (parent[i] == p) out.push_back(i);
      }
      return out;
    };

    const std::vector<int> top = siblings(-1);
    objects.push_back("<< /Type /Outlines /First " + ref(objOf(top.front())) + " /Last " + ref(objOf(top.back())) +
                      " /Count " + std::to_string(itemCount) + " >>");

    for (int i = 0; i < itemCount; i++) {
      const std::vector<int> peers = siblings(parent[i]);
      const std::vector<int> children = siblings(i);
      std::string dict = "<< /Title " + literal(layout.outline[i].title) + " /Parent " + ref(objOf(parent[i])) +
                         " /Dest [" + ref(firstPageObj + 2 * layout.outline[i].page) + " /XYZ 0 792 0]";
      for (size_t k = 0; k < peers.size(); k++) {
        if (peers[k] != i) continue;
        if (k > 0) dict += " /Prev " + ref(objOf(peers[k - 1]));
        if (k + 1 < peers.size()) dict += " /Next " + ref(objOf(peers[k + 1]));
      }
      if (!children.empty()) {
        dict += " /First " + ref(objOf(children.front())) + " /Last " + ref(objOf(children.back())) + " /Count " +
                std::to_string(children.size());
      }
      objects.push_back(dict + " >>");
    }
  }

  std::string pdf = "%PDF-1.4\n%\xE2\xE3\xCF\xD3\n";
  std::vector<size_t> offsets;
  for (size_t i = 0; i < objects.size(); i++) {
    offsets.push_back(pdf.size());
    pdf += std::to_string(i + 1) + " 0 obj\n" + objects[i] + "\nendobj\n";
  }

  const size_t xrefOffset = pdf.size();
  pdf += "xref\n0 " + std::to_string(objects.size() + 1) + "\n0000000000 65535 f \n";
  char entry[24];
  for (const size_t offset : offsets) {
    snprintf(entry, sizeof(entry), "%010zu 00000 n \n", offset);
    pdf += entry;
  }
  pdf += "trailer\n<< /Size " + std::to_string(objects.size() + 1) + " /Root 1 0 R /Info 4 0 R >>\nstartxref\n" +
         std::to_string(xrefOffset) + "\n%%EOF\n";

  FILE* f = fopen(path.c_str(), "wb");
  if (!f) return false;
  const bool ok = fwrite(pdf.data(), 1, pdf.size(), f) == pdf.size();
  return fclose(f) == 0 && ok;
}
