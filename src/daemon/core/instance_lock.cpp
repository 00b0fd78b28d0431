#include "daemon/core/instance_lock.h"

#include "logging/logger.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <sys/file.h>
#include <unistd.h>

namespace prerender::daemon_core {

namespace {

bool writeOwner(int fd, const std::string& instanceId) {
    if (ftruncate(fd, 0) < 0 || lseek(fd, 0, SEEK_SET) < 0) {
        return false;
    }
    std::string line = std::to_string(getpid()) + " " + instanceId + "\n";
    const char* data = line.data();
    std::size_t left = line.size();
    while (left > 0) {
        ssize_t n = write(fd, data, left);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            return false;
        }
        data += n;
        left -= static_cast<std::size_t>(n);
    }
    return fsync(fd) == 0;
}

}  // namespace

std::optional<InstanceLock::Owner> InstanceLock::readOwner(const std::string& path) {
    std::ifstream in(path);
    Owner owner;
    if (!(in >> owner.pid) || owner.pid <= 0) {
        return std::nullopt;
    }
    in >> owner.instanceId;
    return owner;
}

std::optional<InstanceLock> InstanceLock::tryAcquire(const std::string& path,
                                                     const std::string& instanceId) {
    int fd = open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        LOG_ERROR("Cannot open lock file {}: {}", path, std::strerror(errno));
        return std::nullopt;
    }

    if (flock(fd, LOCK_EX | LOCK_NB) < 0) {
        int err = errno;
        close(fd);
        if (err != EWOULDBLOCK) {
            LOG_ERROR("Cannot lock {}: {}", path, std::strerror(err));
            return std::nullopt;
        }
        auto owner = readOwner(path);
        if (owner) {
            LOG_ERROR("Working directory already claimed by instance {} (PID {})",
                      owner->instanceId.empty() ? "?" : owner->instanceId, owner->pid);
        } else {
            LOG_ERROR("Working directory already claimed (lock file {})", path);
        }
        return std::nullopt;
    }

    if (!writeOwner(fd, instanceId)) {
        LOG_WARN("Cannot record owner in {}: {}", path, std::strerror(errno));
    }
    LOG_DEBUG("Claimed working directory via {}", path);
    return InstanceLock(path, fd);
}

InstanceLock::InstanceLock(std::string path, int fd) : path_(std::move(path)), fd_(fd) {}

InstanceLock::InstanceLock(InstanceLock&& other) noexcept
    : path_(std::move(other.path_)), fd_(other.fd_) {
    other.fd_ = -1;
}

InstanceLock& InstanceLock::operator=(InstanceLock&& other) noexcept {
    if (this != &other) {
        release();
        path_ = std::move(other.path_);
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

InstanceLock::~InstanceLock() {
    release();
}

void InstanceLock::release() noexcept {
    if (fd_ < 0) {
        return;
    }
    // Unlink before unlocking.
    unlink(path_.c_str());
    flock(fd_, LOCK_UN);
    close(fd_);
    fd_ = -1;
}

}  // namespace prerender::daemon_core
