#pragma once
#include <filesystem>
#include <optional>
#include <sys/types.h>

namespace clockwork::sampler {

/**
 * Exclusive advisory lock (flock) on a file, held for the object's lifetime.
 * The holder's pid is written into the file.
 */
class InstanceLock {
public:
    explicit InstanceLock(std::filesystem::path path);
    ~InstanceLock();

    InstanceLock(const InstanceLock&) = delete;
    InstanceLock& operator=(const InstanceLock&) = delete;

    // Non-blocking; false if another holder exists or the file can't be opened
    bool acquire();
    void release();

    bool held() const { return fd_ >= 0; }
    const std::filesystem::path& path() const { return path_; }

    // Pid recorded in a lock file, if readable
    static std::optional<pid_t> read_pid(const std::filesystem::path& path);

    // True when some process currently holds the lock
    static bool is_locked(const std::filesystem::path& path);

private:
    std::filesystem::path path_;
    int fd_ = -1;
};

} // namespace clockwork::sampler
