#pragma once

#include "catalog/track_reference.h"
#include "core/error_codes.h"

#include <cstdint>
#include <random>
#include <string>
#include <vector>

namespace prerender::catalog {

struct SelectionResult {
    ErrorCode errorCode = ErrorCode::OK;
    std::string errorMessage;
    TrackReference track;
    std::string innerEntry;  // set by chooseInnerEntry

    bool ok() const {
        return errorCode == ErrorCode::OK;
    }
};

// Uniform random choice over catalog entries and, for archives, over the
// playable entries inside them. Successive choices are independent.
class TrackSelector {
   public:
    explicit TrackSelector(std::vector<std::string> allowedExtensions);
    TrackSelector(std::vector<std::string> allowedExtensions, std::uint64_t seed);

    // CATALOG_EMPTY when the catalog has no entries.
    SelectionResult select(const Catalog& catalog);

    // Picks one playable entry from an archive listing. Directories and
    // entries with disallowed extensions are ignored; nested archives count
    // as playable. CATALOG_NO_PLAYABLE_ENTRY when none qualify.
    SelectionResult chooseInnerEntry(const TrackReference& archive,
                                     const std::vector<std::string>& entries);

    bool isPlayableEntry(const std::string& entryName) const;

   private:
    std::size_t pick(std::size_t count);

    std::vector<std::string> allowedExtensions_;
    std::mt19937_64 rng_;
};

}  // namespace prerender::catalog
