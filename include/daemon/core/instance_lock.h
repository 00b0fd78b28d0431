#pragma once

#include <optional>
#include <string>
#include <sys/types.h>

namespace prerender::daemon_core {

// Claims a working directory for one renderer. The directory sweep deletes
// anything it does not recognise, so two renderers must never share one.
// Renderers on different working directories may still share a media
// directory; that case needs no lock.
//
// The lock file holds "<pid> <instanceId>" and is held with flock(), so a
// crashed owner releases it implicitly.
class InstanceLock {
   public:
    struct Owner {
        pid_t pid = 0;
        std::string instanceId;
    };

    // nullopt if the file cannot be opened or another renderer holds it.
    static std::optional<InstanceLock> tryAcquire(const std::string& path,
                                                  const std::string& instanceId);

    // Contents of an existing lock file; nullopt if missing or unparsable.
    static std::optional<Owner> readOwner(const std::string& path);

    InstanceLock(const InstanceLock&) = delete;
    InstanceLock& operator=(const InstanceLock&) = delete;

    InstanceLock(InstanceLock&& other) noexcept;
    InstanceLock& operator=(InstanceLock&& other) noexcept;

    ~InstanceLock();

    const std::string& path() const {
        return path_;
    }

   private:
    InstanceLock(std::string path, int fd);

    void release() noexcept;

    std::string path_;
    int fd_ = -1;
};

}  // namespace prerender::daemon_core
