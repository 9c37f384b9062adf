#include "policy/request_guard.hpp"

#include <cctype>
#include <system_error>
#include <utility>
#include <nlohmann/json.hpp>

namespace venvbox::policy {

using core::errors::ErrorCategory;
using core::errors::ServiceError;

RequestGuard::RequestGuard(RequestPolicy request_policy)
    : request_policy_(std::move(request_policy)) {}

bool RequestGuard::is_within_root(const std::filesystem::path& root,
                                  const std::filesystem::path& child) {
    auto root_it = root.begin();
    auto child_it = child.begin();
    for (; root_it != root.end() && child_it != child.end(); ++root_it, ++child_it) {
        if (*root_it != *child_it) {
            return false;
        }
    }
    return root_it == root.end();
}

bool RequestGuard::is_name_char(const char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_' || c == '-' ||
           c == '.';
}

core::errors::Result<std::string> RequestGuard::validate_environment_name(
    const std::string& name) const {
    if (name.empty()) {
        return ServiceError{ErrorCategory::Input, "Environment name cannot be empty.",
                            "invalid_environment_name"};
    }
    if (name.size() > request_policy_.max_name_length) {
        return ServiceError{ErrorCategory::Input,
                            "Environment name is longer than " +
                                std::to_string(request_policy_.max_name_length) +
                                " characters.",
                            "invalid_environment_name"};
    }
    if (name.front() == '.') {
        return ServiceError{ErrorCategory::Input,
                            "Environment name cannot start with '.': " + name,
                            "invalid_environment_name"};
    }
    for (const char c : name) {
        if (!is_name_char(c)) {
            return ServiceError{ErrorCategory::Input,
                                "Environment name contains an unsupported character: " + name,
                                "invalid_environment_name",
                                "Use letters, digits, '.', '_' or '-'."};
        }
    }
    return name;
}

core::errors::Result<std::string> RequestGuard::validate_dependency(
    const std::string& specifier) const {
    if (specifier.empty()) {
        return ServiceError{ErrorCategory::Input, "Dependency specifier cannot be empty.",
                            "invalid_dependency"};
    }
    if (specifier.size() > request_policy_.max_specifier_length) {
        return ServiceError{ErrorCategory::Input, "Dependency specifier is too long.",
                            "invalid_dependency"};
    }
    if (specifier.find('\n') != std::string::npos ||
        specifier.find('\r') != std::string::npos) {
        return ServiceError{ErrorCategory::Input,
                            "Dependency specifier must be a single line: " + specifier,
                            "invalid_dependency"};
    }
    // Specifiers are recorded in JSON metadata, which must be valid UTF-8.
    try {
        static_cast<void>(nlohmann::json(specifier).dump());
    } catch (const nlohmann::json::type_error&) {
        return ServiceError{ErrorCategory::Input,
                            "Dependency specifier is not valid UTF-8.",
                            "invalid_dependency"};
    }
    // A leading dash would be read as an installer option inside the manifest.
    if (specifier.front() == '-') {
        return ServiceError{ErrorCategory::Input,
                            "Dependency specifier cannot start with '-': " + specifier,
                            "invalid_dependency"};
    }
    return specifier;
}

core::errors::Result<std::vector<std::string>> RequestGuard::validate_dependencies(
    const std::vector<std::string>& specifiers) const {
    if (specifiers.size() > request_policy_.max_dependencies) {
        return ServiceError{ErrorCategory::Input,
                            "Too many dependencies: " + std::to_string(specifiers.size()),
                            "too_many_dependencies"};
    }
    for (const auto& specifier : specifiers) {
        auto checked = validate_dependency(specifier);
        if (core::errors::is_error(checked)) {
            return core::errors::get_error(checked);
        }
    }
    return specifiers;
}

core::errors::Result<std::filesystem::path> RequestGuard::validate_path_under_root(
    const std::filesystem::path& root,
    const std::filesystem::path& target_path) const {
    std::error_code ec;
    const std::filesystem::path canonical_root = std::filesystem::weakly_canonical(root, ec);
    if (ec) {
        return ServiceError{ErrorCategory::Internal,
                            "Unable to resolve root: " + root.string(), "invalid_root"};
    }

    std::filesystem::path candidate = target_path;
    if (candidate.is_relative()) {
        candidate = canonical_root / candidate;
    }

    const std::filesystem::path canonical_candidate =
        std::filesystem::weakly_canonical(candidate, ec);
    if (ec) {
        return ServiceError{ErrorCategory::Input,
                            "Unable to resolve target path: " + target_path.string(),
                            "invalid_path"};
    }

    if (canonical_candidate == canonical_root ||
        !is_within_root(canonical_root, canonical_candidate)) {
        return ServiceError{ErrorCategory::Input,
                            "Path escapes root: " + canonical_candidate.string(),
                            "path_outside_root"};
    }

    return canonical_candidate;
}

}  // namespace venvbox::policy
