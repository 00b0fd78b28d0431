#include "eviction/storage_probe.h"

#include "logging/logger.h"

#include <system_error>

namespace prerender::eviction {

std::optional<StorageUsage> FilesystemStorageProbe::usage(const std::filesystem::path& path) {
    std::error_code ec;
    auto info = std::filesystem::space(path, ec);
    if (ec) {
        LOG_ERROR("Cannot query filesystem space for {}: {}", path.string(), ec.message());
        return std::nullopt;
    }
    StorageUsage usage;
    usage.capacityBytes = info.capacity;
    usage.usedBytes = info.capacity >= info.free ? info.capacity - info.free : 0;
    return usage;
}

}  // namespace prerender::eviction
