#include "session/named_lock_table.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>
#include <utility>

namespace venvbox::session {

NamedLock::NamedLock(std::string name, std::shared_ptr<std::mutex> mutex,
                     const std::filesystem::path& lock_file)
    : name_(std::move(name)), mutex_(std::move(mutex)), lock_(*mutex_) {
    if (lock_file.empty()) {
        return;
    }

    lock_fd_ = open(lock_file.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (lock_fd_ < 0) {
        file_lock_error_ = "Unable to open lock file " + lock_file.string() + ": " +
                           std::strerror(errno);
        return;
    }

    int rc = 0;
    do {
        rc = flock(lock_fd_, LOCK_EX);
    } while (rc != 0 && errno == EINTR);
    if (rc != 0) {
        file_lock_error_ = "Unable to lock " + lock_file.string() + ": " + std::strerror(errno);
        static_cast<void>(close(lock_fd_));
        lock_fd_ = -1;
    }
}

NamedLock::NamedLock(NamedLock&& other) noexcept
    : name_(std::move(other.name_)),
      mutex_(std::move(other.mutex_)),
      lock_(std::move(other.lock_)),
      lock_fd_(std::exchange(other.lock_fd_, -1)),
      file_lock_error_(std::move(other.file_lock_error_)) {}

NamedLock::~NamedLock() {
    // The file lock goes before the mutex is released by lock_'s destructor.
    if (lock_fd_ >= 0) {
        static_cast<void>(flock(lock_fd_, LOCK_UN));
        static_cast<void>(close(lock_fd_));
    }
}

NamedLock NamedLockTable::acquire(const std::string& name,
                                  const std::filesystem::path& lock_file) {
    std::shared_ptr<std::mutex> entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& slot = locks_[name];
        if (!slot) {
            slot = std::make_shared<std::mutex>();
        }
        entry = slot;
    }
    // Block outside the table lock so other names stay available.
    return NamedLock(name, std::move(entry), lock_file);
}

std::size_t NamedLockTable::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return locks_.size();
}

}  // namespace venvbox::session
