#include "env/environment_builder.hpp"

#include <fstream>
#include <system_error>
#include <utility>
#include "core/config/request_id.hpp"
#include "core/logging/logger.hpp"
#include "process/process_runner.hpp"

namespace venvbox::env {

using core::errors::ErrorCategory;
using core::errors::ServiceError;

namespace {

// Requirements manifest that lives exactly as long as the install call.
class StagedManifest {
public:
    explicit StagedManifest(std::filesystem::path path) : path_(std::move(path)) {}
    ~StagedManifest() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }
    StagedManifest(const StagedManifest&) = delete;
    StagedManifest& operator=(const StagedManifest&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

// Installer diagnostics usually land on stderr; fall back to stdout, then the
// exit status.
std::string failure_text(const process::ProcessCapture& capture) {
    if (!capture.stderr_text.empty()) {
        return capture.stderr_text;
    }
    if (!capture.stdout_text.empty()) {
        return capture.stdout_text;
    }
    return process::describe_exit(capture);
}

}  // namespace

BuilderOptions builder_options_from(const core::config::ServiceConfig& config) {
    BuilderOptions options;
    options.uv_executable = config.uv_executable;
    options.python_request = config.python_request;
    options.create_timeout_ms = config.create_timeout_ms;
    options.install_timeout_ms = config.install_timeout_ms;
    options.certificate_candidates = config.certificate_candidates;
    options.staging_directory = config.temp_root;
    options.max_output_bytes = config.max_output_bytes;
    return options;
}

std::optional<std::filesystem::path> resolve_certificate_bundle(
    const std::vector<std::filesystem::path>& candidates) {
    for (const auto& candidate : candidates) {
        std::error_code ec;
        if (std::filesystem::is_regular_file(candidate, ec) && !ec) {
            return candidate;
        }
    }
    return std::nullopt;
}

UvEnvironmentBuilder::UvEnvironmentBuilder(BuilderOptions options)
    : options_(std::move(options)) {}

core::errors::Result<double> UvEnvironmentBuilder::create_environment(
    const std::filesystem::path& root) const {
    process::ProcessRequest request;
    request.argv = {options_.uv_executable, "venv", root.string()};
    if (options_.python_request.has_value()) {
        request.argv.push_back("--python");
        request.argv.push_back(options_.python_request.value());
    }
    request.env_overrides = {{"NO_COLOR", "1"}};
    request.timeout_ms = options_.create_timeout_ms;
    request.max_output_bytes = options_.max_output_bytes;

    auto capture_result = process::run_process(request);
    std::string reason;
    std::string code;
    if (core::errors::is_error(capture_result)) {
        reason = core::errors::get_error(capture_result).message;
        code = "venv_create_failed";
    } else {
        const auto& capture = core::errors::get_value(capture_result);
        if (capture.timed_out) {
            reason = "environment creation timed out after " +
                     std::to_string(options_.create_timeout_ms) + " ms";
            code = "venv_create_timeout";
        } else if (capture.exit_code != 0) {
            reason = failure_text(capture);
            code = "venv_create_failed";
        } else {
            return capture.duration_ms;
        }
    }

    // Leave nothing half-created behind.
    std::error_code ec;
    std::filesystem::remove_all(root, ec);
    if (ec) {
        LOG_WARN("UvEnvironmentBuilder: unable to remove partial environment " +
                 root.string() + ": " + ec.message());
    }
    return ServiceError{ErrorCategory::Construction,
                        "Failed to create virtual environment: " + reason, code};
}

core::errors::Result<double> UvEnvironmentBuilder::install_dependencies(
    const std::filesystem::path& root, const std::vector<std::string>& dependencies) const {
    std::error_code ec;
    std::filesystem::path staging_dir = options_.staging_directory;
    if (staging_dir.empty()) {
        staging_dir = std::filesystem::temp_directory_path(ec);
        if (ec) {
            return ServiceError{ErrorCategory::Installation,
                                "Failed to install dependencies: no staging directory: " +
                                    ec.message(),
                                "manifest_stage_failed"};
        }
    }
    std::filesystem::create_directories(staging_dir, ec);
    if (ec) {
        return ServiceError{ErrorCategory::Installation,
                            "Failed to install dependencies: unable to create " +
                                staging_dir.string() + ": " + ec.message(),
                            "manifest_stage_failed"};
    }

    StagedManifest manifest(staging_dir /
                            ("requirements_" + core::config::generate_request_id() + ".txt"));
    {
        std::ofstream out(manifest.path(), std::ios::trunc);
        if (!out.is_open()) {
            return ServiceError{ErrorCategory::Installation,
                                "Failed to install dependencies: unable to open manifest " +
                                    manifest.path().string(),
                                "manifest_stage_failed"};
        }
        for (const auto& dependency : dependencies) {
            out << dependency << "\n";
        }
        out.flush();
        if (!out.good()) {
            return ServiceError{ErrorCategory::Installation,
                                "Failed to install dependencies: unable to write manifest " +
                                    manifest.path().string(),
                                "manifest_stage_failed"};
        }
    }

    process::ProcessRequest request;
    request.argv = {options_.uv_executable, "pip", "install", "-r",
                    manifest.path().string(), "--python", root.string()};
    request.env_overrides = {{"NO_COLOR", "1"}};
    const auto certificate = resolve_certificate_bundle(options_.certificate_candidates);
    if (certificate.has_value()) {
        request.env_overrides.emplace_back("SSL_CERT_FILE", certificate->string());
    }
    request.timeout_ms = options_.install_timeout_ms;
    request.max_output_bytes = options_.max_output_bytes;

    auto capture_result = process::run_process(request);
    if (core::errors::is_error(capture_result)) {
        return ServiceError{ErrorCategory::Installation,
                            "Failed to install dependencies: " +
                                core::errors::get_error(capture_result).message,
                            "install_failed"};
    }
    const auto& capture = core::errors::get_value(capture_result);
    if (capture.timed_out) {
        return ServiceError{ErrorCategory::Installation,
                            "Failed to install dependencies: installation timed out after " +
                                std::to_string(options_.install_timeout_ms) + " ms",
                            "install_timeout"};
    }
    if (capture.exit_code != 0) {
        return ServiceError{ErrorCategory::Installation,
                            "Failed to install dependencies: " + failure_text(capture),
                            "install_failed"};
    }
    return capture.duration_ms;
}

core::errors::Result<BuildReport> UvEnvironmentBuilder::build(
    const std::filesystem::path& root, const std::vector<std::string>& dependencies) const {
    BuildReport report;
    report.root = root;

    auto created = create_environment(root);
    if (core::errors::is_error(created)) {
        return core::errors::get_error(created);
    }
    report.create_ms = core::errors::get_value(created);

    if (!dependencies.empty()) {
        auto installed = install_dependencies(root, dependencies);
        if (core::errors::is_error(installed)) {
            return core::errors::get_error(installed);
        }
        report.install_ms = core::errors::get_value(installed);
    }

    report.installed = to_dependency_set(dependencies);
    return report;
}

}  // namespace venvbox::env
