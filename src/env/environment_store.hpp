#pragma once

#include <cstdint>
#include <filesystem>
#include <set>
#include <string>
#include <vector>
#include "core/errors/service_errors.hpp"
#include "policy/request_guard.hpp"

namespace venvbox::env {

using DependencySet = std::set<std::string>;

// Order and duplicates do not matter; spelling does. "requests==2.31" and
// "requests==2.31.0" are different specifiers.
DependencySet to_dependency_set(const std::vector<std::string>& specifiers);

struct EnvironmentMetadata {
    std::string name;
    DependencySet dependencies;
    std::int64_t created_at_unix_ms = 0;
};

// On-disk registry of named environments:
//   <cache_root>/<name>/       the environment itself
//   <cache_root>/<name>.json   its metadata record
//   <cache_root>/.locks/<name>.lock   cross-process lock file
// A metadata record exists only for a fully built environment. Callers
// serialize access per name; the store itself holds no locks.
class EnvironmentStore {
public:
    explicit EnvironmentStore(std::filesystem::path cache_root,
                              policy::RequestGuard guard = policy::RequestGuard{});

    // Creates the cache root. On failure the store stays usable but reports
    // itself unavailable, and every named operation fails with that reason.
    core::errors::Result<std::filesystem::path> initialize();

    bool available() const { return available_; }
    const std::string& unavailable_reason() const { return unavailable_reason_; }
    const std::filesystem::path& cache_root() const { return cache_root_; }

    core::errors::Result<std::filesystem::path> environment_path(
        const std::string& name) const;
    core::errors::Result<std::filesystem::path> metadata_path(
        const std::string& name) const;

    // Names never start with '.', so the lock directory cannot collide with
    // an environment.
    core::errors::Result<std::filesystem::path> lock_path(const std::string& name) const;

    bool environment_exists(const std::string& name) const;

    core::errors::Result<EnvironmentMetadata> read_metadata(const std::string& name) const;

    // Writes to a temporary sibling and renames it into place.
    core::errors::Result<std::filesystem::path> write_metadata(
        const EnvironmentMetadata& metadata) const;

    // Removes the metadata record first, then the directory. Returns the number
    // of filesystem entries removed.
    core::errors::Result<std::uintmax_t> remove_environment(const std::string& name) const;

private:
    core::errors::Result<std::string> checked_name(const std::string& name) const;

    std::filesystem::path cache_root_;
    policy::RequestGuard guard_;
    bool available_ = false;
    std::string unavailable_reason_ = "Environment store not initialized";
};

}  // namespace venvbox::env
