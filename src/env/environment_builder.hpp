#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "core/config/service_config.hpp"
#include "core/errors/service_errors.hpp"
#include "env/environment_store.hpp"

namespace venvbox::env {

struct BuildReport {
    std::filesystem::path root;
    DependencySet installed;
    double create_ms = 0.0;
    double install_ms = 0.0;
};

// Creates an isolated environment at a path and installs dependencies into it.
// Implementations must not be called concurrently for the same path.
class EnvironmentBuilder {
public:
    virtual ~EnvironmentBuilder() = default;

    virtual core::errors::Result<BuildReport> build(
        const std::filesystem::path& root,
        const std::vector<std::string>& dependencies) const = 0;
};

struct BuilderOptions {
    std::string uv_executable = "uv";
    std::optional<std::string> python_request;
    std::uint32_t create_timeout_ms = 30000;
    std::uint32_t install_timeout_ms = 300000;
    std::vector<std::filesystem::path> certificate_candidates;
    // Where requirement manifests are staged while installing.
    std::filesystem::path staging_directory;
    std::size_t max_output_bytes = 4 * 1024 * 1024;
};

BuilderOptions builder_options_from(const core::config::ServiceConfig& config);

// First candidate that is an existing regular file, if any.
std::optional<std::filesystem::path> resolve_certificate_bundle(
    const std::vector<std::filesystem::path>& candidates);

// `uv venv <root>` followed by `uv pip install -r <manifest> --python <root>`.
class UvEnvironmentBuilder : public EnvironmentBuilder {
public:
    explicit UvEnvironmentBuilder(BuilderOptions options);

    core::errors::Result<BuildReport> build(
        const std::filesystem::path& root,
        const std::vector<std::string>& dependencies) const override;

    const BuilderOptions& options() const { return options_; }

private:
    core::errors::Result<double> create_environment(const std::filesystem::path& root) const;
    core::errors::Result<double> install_dependencies(
        const std::filesystem::path& root,
        const std::vector<std::string>& dependencies) const;

    BuilderOptions options_;
};

}  // namespace venvbox::env
