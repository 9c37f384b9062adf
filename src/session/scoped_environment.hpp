#pragma once

#include <filesystem>
#include <string>
#include <system_error>
#include <utility>
#include "core/logging/logger.hpp"

namespace venvbox::session {

// Holds an environment root for the duration of one request. Temporary roots
// are removed on every exit path; named roots are left in place. Removal
// failures are logged and never propagate.
class ScopedEnvironment {
public:
    ScopedEnvironment(std::filesystem::path root, bool temporary, std::string request_id)
        : root_(std::move(root)), temporary_(temporary), request_id_(std::move(request_id)) {}

    ~ScopedEnvironment() {
        if (!temporary_) {
            LOG_REQ_DEBUG(request_id_, "cleanup: keeping cached environment " + root_.string());
            return;
        }
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
        if (ec) {
            LOG_REQ_WARN(request_id_, "cleanup: unable to remove " + root_.string() + ": " +
                                          ec.message());
            return;
        }
        LOG_REQ_DEBUG(request_id_, "cleanup: removed temporary environment " + root_.string());
    }

    ScopedEnvironment(const ScopedEnvironment&) = delete;
    ScopedEnvironment& operator=(const ScopedEnvironment&) = delete;

    const std::filesystem::path& root() const { return root_; }
    bool temporary() const { return temporary_; }

private:
    std::filesystem::path root_;
    bool temporary_;
    std::string request_id_;
};

}  // namespace venvbox::session
