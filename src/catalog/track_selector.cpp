#include "catalog/track_selector.h"

#include "core/config_loader.h"
#include "logging/logger.h"

#include <algorithm>

namespace prerender::catalog {

TrackSelector::TrackSelector(std::vector<std::string> allowedExtensions)
    : TrackSelector(std::move(allowedExtensions), std::random_device{}()) {}

TrackSelector::TrackSelector(std::vector<std::string> allowedExtensions, std::uint64_t seed)
    : allowedExtensions_(std::move(allowedExtensions)), rng_(seed) {
    for (auto& ext : allowedExtensions_) {
        ext = normalizeExtension(ext);
    }
}

std::size_t TrackSelector::pick(std::size_t count) {
    std::uniform_int_distribution<std::size_t> dist(0, count - 1);
    return dist(rng_);
}

bool TrackSelector::isPlayableEntry(const std::string& entryName) const {
    if (entryName.empty() || entryName.back() == '/') {
        return false;
    }
    std::string ext = extensionOf(entryName);
    if (ext.empty()) {
        return false;
    }
    return std::find(allowedExtensions_.begin(), allowedExtensions_.end(), ext) !=
           allowedExtensions_.end();
}

SelectionResult TrackSelector::select(const Catalog& catalog) {
    SelectionResult result;
    if (catalog.empty()) {
        result.errorCode = ErrorCode::CATALOG_EMPTY;
        result.errorMessage = "catalog has no entries";
        return result;
    }
    result.track = catalog.entries[pick(catalog.size())];
    LOG_DEBUG("Selected {}", result.track.uri);
    return result;
}

SelectionResult TrackSelector::chooseInnerEntry(const TrackReference& archive,
                                                const std::vector<std::string>& entries) {
    SelectionResult result;
    result.track = archive;

    std::vector<const std::string*> playable;
    for (const auto& entry : entries) {
        if (isPlayableEntry(entry)) {
            playable.push_back(&entry);
        }
    }
    if (playable.empty()) {
        result.errorCode = ErrorCode::CATALOG_NO_PLAYABLE_ENTRY;
        result.errorMessage = "no playable entry in " + archive.displayName();
        return result;
    }

    result.innerEntry = *playable[pick(playable.size())];
    result.track.innerEntry = result.innerEntry;
    LOG_DEBUG("Selected {} from {} ({} candidates)", result.innerEntry, archive.displayName(),
              playable.size());
    return result;
}

}  // namespace prerender::catalog
