#pragma once

#include <memory>

#include "../content/ProgressStore.h"
#include "../content/ReaderRepository.h"
#include "../core/EngineConfig.h"

namespace quire {

// Repository wired to the MuPDF and EPUB decoders. Progress goes to a
// FileProgressStore under config.progressDirectory unless a store is given.
std::unique_ptr<ReaderRepository> createDefaultRepository(const EngineConfig& config,
                                                          std::shared_ptr<ProgressStore> store = nullptr);

}  // namespace quire
