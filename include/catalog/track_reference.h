#pragma once

#include <optional>
#include <string>
#include <vector>

namespace prerender::catalog {

constexpr const char* ARCHIVE_EXTENSION = "zip";

// A catalog entry. Archive references carry an inner entry once one has
// been chosen.
struct TrackReference {
    std::string uri;
    std::string extension;  // lowercase, no dot
    std::optional<std::string> innerEntry;

    bool isArchive() const {
        return extension == ARCHIVE_EXTENSION;
    }

    std::string displayName() const {
        return innerEntry ? uri + "#" + *innerEntry : uri;
    }
};

// Ordered and immutable between resolutions.
struct Catalog {
    std::string sourceUrl;
    std::vector<TrackReference> entries;

    bool empty() const {
        return entries.empty();
    }
    std::size_t size() const {
        return entries.size();
    }
};

// Lowercase extension of the last path component of a URI or archive entry,
// ignoring any query string or fragment. Empty when there is none.
std::string extensionOf(const std::string& uriOrPath);

}  // namespace prerender::catalog
