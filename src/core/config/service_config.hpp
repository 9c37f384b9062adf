#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/service_errors.hpp"
#include "core/logging/logger.hpp"

namespace venvbox::core::config {

// Process-wide settings. Built once at startup and handed to the orchestrator;
// nothing below the app layer reads the process environment.
struct ServiceConfig {
    std::uint32_t create_timeout_ms = 30000;
    std::uint32_t install_timeout_ms = 300000;
    std::uint32_t execution_timeout_ms = 30000;
    std::filesystem::path cache_root;
    std::filesystem::path temp_root;
    std::string uv_executable = "uv";
    std::optional<std::string> python_request;
    std::vector<std::filesystem::path> certificate_candidates;
    std::size_t max_output_bytes = 4 * 1024 * 1024;
    std::uint32_t workers = 4;
    logging::LogLevel log_level = logging::LogLevel::INFO;
};

using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

std::vector<std::filesystem::path> default_certificate_candidates();

ServiceConfig default_service_config();

// Applies one setting by its flag name (e.g. "exec-timeout-ms").
errors::Result<ServiceConfig> with_setting(ServiceConfig config,
                                           const std::string& key,
                                           const std::string& value);

bool is_setting_key(const std::string& key);

// Defaults overlaid with VENVBOX_* variables from `lookup`.
errors::Result<ServiceConfig> load_service_config(const EnvLookup& lookup);

// lookup backed by ::getenv
EnvLookup process_env_lookup();

}  // namespace venvbox::core::config
