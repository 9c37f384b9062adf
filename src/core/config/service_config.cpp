#include "core/config/service_config.hpp"

#include <charconv>
#include <cstdlib>
#include <system_error>
#include <utility>

namespace venvbox::core::config {

using errors::ErrorCategory;
using errors::ServiceError;

namespace {

struct SettingBinding {
    const char* key;
    const char* env_var;
};

constexpr SettingBinding kSettings[] = {
    {"create-timeout-ms", "VENVBOX_CREATE_TIMEOUT_MS"},
    {"install-timeout-ms", "VENVBOX_INSTALL_TIMEOUT_MS"},
    {"exec-timeout-ms", "VENVBOX_EXEC_TIMEOUT_MS"},
    {"cache-root", "VENVBOX_CACHE_ROOT"},
    {"temp-root", "VENVBOX_TEMP_ROOT"},
    {"uv", "VENVBOX_UV"},
    {"python", "VENVBOX_PYTHON"},
    {"max-output-bytes", "VENVBOX_MAX_OUTPUT_BYTES"},
    {"workers", "VENVBOX_WORKERS"},
    {"log-level", "VENVBOX_LOG_LEVEL"},
};

template <typename T>
errors::Result<T> parse_positive(const std::string& key, const std::string& value) {
    T parsed = 0;
    const char* begin = value.data();
    const char* end = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(begin, end, parsed);
    if (ec != std::errc() || ptr != end) {
        return ServiceError{ErrorCategory::Input, "Invalid number for " + key + ": " + value,
                            "invalid_integer", "Provide a positive integer."};
    }
    if (parsed == 0) {
        return ServiceError{ErrorCategory::Input, key + " must be greater than zero",
                            "bounds_error"};
    }
    return parsed;
}

std::filesystem::path default_base_dir() {
    std::error_code ec;
    auto base = std::filesystem::temp_directory_path(ec);
    if (ec) {
        base = "/tmp";
    }
    return base / "venvbox";
}

}  // namespace

std::vector<std::filesystem::path> default_certificate_candidates() {
    return {"/etc/ssl/certs/ca-certificates.crt",
            "/etc/pki/tls/certs/ca-bundle.crt",
            "/etc/ssl/cert.pem",
            "/etc/ssl/ca-bundle.pem"};
}

ServiceConfig default_service_config() {
    ServiceConfig config;
    config.cache_root = default_base_dir() / "cache";
    config.temp_root = default_base_dir() / "runs";
    config.certificate_candidates = default_certificate_candidates();
    return config;
}

bool is_setting_key(const std::string& key) {
    for (const auto& binding : kSettings) {
        if (key == binding.key) {
            return true;
        }
    }
    return false;
}

errors::Result<ServiceConfig> with_setting(ServiceConfig config, const std::string& key,
                                           const std::string& value) {
    if (key == "create-timeout-ms" || key == "install-timeout-ms" ||
        key == "exec-timeout-ms" || key == "workers") {
        auto parsed = parse_positive<std::uint32_t>(key, value);
        if (errors::is_error(parsed)) {
            return errors::get_error(parsed);
        }
        const auto number = errors::get_value(parsed);
        if (key == "create-timeout-ms") config.create_timeout_ms = number;
        else if (key == "install-timeout-ms") config.install_timeout_ms = number;
        else if (key == "exec-timeout-ms") config.execution_timeout_ms = number;
        else config.workers = number;
        return config;
    }
    if (key == "max-output-bytes") {
        auto parsed = parse_positive<std::size_t>(key, value);
        if (errors::is_error(parsed)) {
            return errors::get_error(parsed);
        }
        config.max_output_bytes = errors::get_value(parsed);
        return config;
    }
    if (key == "cache-root" || key == "temp-root" || key == "uv") {
        if (value.empty()) {
            return ServiceError{ErrorCategory::Input, key + " cannot be empty",
                                "missing_value"};
        }
        if (key == "cache-root") config.cache_root = value;
        else if (key == "temp-root") config.temp_root = value;
        else config.uv_executable = value;
        return config;
    }
    if (key == "python") {
        if (value.empty()) {
            config.python_request.reset();
        } else {
            config.python_request = value;
        }
        return config;
    }
    if (key == "log-level") {
        const auto level = logging::parse_log_level(value);
        if (!level.has_value()) {
            return ServiceError{ErrorCategory::Input, "Unknown log level: " + value,
                                "invalid_log_level", "Use debug, info, warn or error."};
        }
        config.log_level = level.value();
        return config;
    }
    return ServiceError{ErrorCategory::Input, "Unknown setting: " + key, "unknown_setting"};
}

errors::Result<ServiceConfig> load_service_config(const EnvLookup& lookup) {
    ServiceConfig config = default_service_config();
    for (const auto& binding : kSettings) {
        const auto value = lookup(binding.env_var);
        if (!value.has_value()) {
            continue;
        }
        auto updated = with_setting(std::move(config), binding.key, value.value());
        if (errors::is_error(updated)) {
            auto err = errors::get_error(updated);
            err.message = std::string(binding.env_var) + ": " + err.message;
            return err;
        }
        config = errors::get_value(updated);
    }
    return config;
}

EnvLookup process_env_lookup() {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (value == nullptr) {
            return std::nullopt;
        }
        return std::string(value);
    };
}

}  // namespace venvbox::core::config
