#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>

namespace prerender::eviction {

struct StorageUsage {
    std::uint64_t capacityBytes = 0;
    std::uint64_t usedBytes = 0;

    double utilization() const {
        return capacityBytes == 0 ? 0.0
                                  : static_cast<double>(usedBytes) /
                                        static_cast<double>(capacityBytes);
    }
};

class IStorageProbe {
   public:
    virtual ~IStorageProbe() = default;
    // nullopt when the filesystem cannot be queried.
    virtual std::optional<StorageUsage> usage(const std::filesystem::path& path) = 0;
};

// statvfs via std::filesystem::space; used = capacity - free.
class FilesystemStorageProbe : public IStorageProbe {
   public:
    std::optional<StorageUsage> usage(const std::filesystem::path& path) override;
};

}  // namespace prerender::eviction
