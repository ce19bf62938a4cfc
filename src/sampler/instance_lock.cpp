#include "sampler/instance_lock.hpp"
#include <cerrno>
#include <cstring>
#include <fstream>
#include <string>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>
#include <spdlog/spdlog.h>

namespace clockwork::sampler {

InstanceLock::InstanceLock(std::filesystem::path path)
    : path_(std::move(path)) {}

InstanceLock::~InstanceLock() {
    release();
}

bool InstanceLock::acquire() {
    if (fd_ >= 0) return true;

    int fd = ::open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        spdlog::error("Failed to open lock file {}: {}", path_.string(), strerror(errno));
        return false;
    }

    if (::flock(fd, LOCK_EX | LOCK_NB) != 0) {
        if (errno == EWOULDBLOCK) {
            spdlog::warn("Lock {} is held by another process", path_.string());
        } else {
            spdlog::error("flock({}) failed: {}", path_.string(), strerror(errno));
        }
        ::close(fd);
        return false;
    }

    std::string pid = std::to_string(getpid()) + "\n";
    if (::ftruncate(fd, 0) != 0 ||
        ::pwrite(fd, pid.data(), pid.size(), 0) != static_cast<ssize_t>(pid.size())) {
        spdlog::warn("Failed to record pid in {}: {}", path_.string(), strerror(errno));
    }

    fd_ = fd;
    return true;
}

void InstanceLock::release() {
    if (fd_ < 0) return;
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
    fd_ = -1;
}

std::optional<pid_t> InstanceLock::read_pid(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) return std::nullopt;
    long pid = 0;
    if (!(in >> pid) || pid <= 0) return std::nullopt;
    return static_cast<pid_t>(pid);
}

bool InstanceLock::is_locked(const std::filesystem::path& path) {
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) return false;

    bool locked = false;
    if (::flock(fd, LOCK_SH | LOCK_NB) != 0) {
        locked = (errno == EWOULDBLOCK);
    } else {
        ::flock(fd, LOCK_UN);
    }
    ::close(fd);
    return locked;
}

} // namespace clockwork::sampler
