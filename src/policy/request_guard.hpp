#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>
#include "core/errors/service_errors.hpp"

namespace venvbox::policy {

struct RequestPolicy {
    std::size_t max_name_length = 64;
    std::size_t max_dependencies = 256;
    std::size_t max_specifier_length = 512;
};

// Validates caller-supplied identifiers before they reach the core. Environment
// names become both a directory name and a metadata filename, and dependency
// specifiers become lines of a requirements manifest.
class RequestGuard {
public:
    explicit RequestGuard(RequestPolicy request_policy = {});

    core::errors::Result<std::string> validate_environment_name(
        const std::string& name) const;

    core::errors::Result<std::string> validate_dependency(
        const std::string& specifier) const;

    core::errors::Result<std::vector<std::string>> validate_dependencies(
        const std::vector<std::string>& specifiers) const;

    core::errors::Result<std::filesystem::path> validate_path_under_root(
        const std::filesystem::path& root,
        const std::filesystem::path& target_path) const;

private:
    static bool is_within_root(const std::filesystem::path& root,
                               const std::filesystem::path& child);
    static bool is_name_char(char c);

    RequestPolicy request_policy_;
};

}  // namespace venvbox::policy
