#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace venvbox::session {

// Exclusive hold on one name. The in-process mutex is taken first, then, when
// a lock file is given, an flock(LOCK_EX) on it so other processes sharing the
// cache root are excluded too. Both are released on destruction.
class NamedLock {
public:
    NamedLock(std::string name, std::shared_ptr<std::mutex> mutex,
              const std::filesystem::path& lock_file = {});
    ~NamedLock();

    NamedLock(NamedLock&& other) noexcept;
    NamedLock& operator=(NamedLock&&) = delete;
    NamedLock(const NamedLock&) = delete;
    NamedLock& operator=(const NamedLock&) = delete;

    const std::string& name() const { return name_; }

    // Set when the lock file could not be opened or locked; only the
    // in-process mutex is held in that case.
    const std::optional<std::string>& file_lock_error() const { return file_lock_error_; }

private:
    std::string name_;
    // Declared before the lock so the mutex outlives it.
    std::shared_ptr<std::mutex> mutex_;
    std::unique_lock<std::mutex> lock_;
    int lock_fd_ = -1;
    std::optional<std::string> file_lock_error_;
};

// One mutex per logical name, created on first use and kept for the life of
// the table. The set of names is bounded by the cached environments on disk.
class NamedLockTable {
public:
    NamedLock acquire(const std::string& name, const std::filesystem::path& lock_file = {});

    std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<std::mutex>> locks_;
};

}  // namespace venvbox::session
