#pragma once

#include <string>

namespace quire {

// Cheap signature checks on the first bytes of a file. Nothing is parsed beyond
// the header and a missing or unreadable file is never a match.
namespace FormatSniffer {

// "%PDF-" within the first 1KB
bool looksLikePdf(const std::string& path);

// ZIP local header, plus either a leading stored "mimetype" entry holding
// application/epub+zip or an .epub extension
bool looksLikeEpub(const std::string& path);

}  // namespace FormatSniffer

}  // namespace quire
