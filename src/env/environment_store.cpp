#include "env/environment_store.hpp"

#include <ctime>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>
#include <nlohmann/json.hpp>
#include "core/config/request_id.hpp"

namespace venvbox::env {

using core::errors::ErrorCategory;
using core::errors::ServiceError;
using nlohmann::json;

namespace {

constexpr int kFormatVersion = 1;
constexpr const char* kMetadataSuffix = ".json";
constexpr const char* kLockDirectory = ".locks";
constexpr const char* kLockSuffix = ".lock";

std::string format_utc(const std::int64_t unix_ms) {
    const std::time_t seconds = static_cast<std::time_t>(unix_ms / 1000);
    std::tm tm{};
    gmtime_r(&seconds, &tm);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buffer;
}

ServiceError corrupt(const std::filesystem::path& path, const std::string& detail) {
    return ServiceError{ErrorCategory::Store,
                        "Corrupt environment metadata " + path.string() + ": " + detail,
                        "metadata_corrupt"};
}

}  // namespace

DependencySet to_dependency_set(const std::vector<std::string>& specifiers) {
    return DependencySet(specifiers.begin(), specifiers.end());
}

EnvironmentStore::EnvironmentStore(std::filesystem::path cache_root,
                                   policy::RequestGuard guard)
    : cache_root_(std::move(cache_root)), guard_(std::move(guard)) {}

core::errors::Result<std::filesystem::path> EnvironmentStore::initialize() {
    std::error_code ec;
    std::filesystem::create_directories(cache_root_, ec);
    if (!ec && !std::filesystem::is_directory(cache_root_, ec)) {
        ec = std::make_error_code(std::errc::not_a_directory);
    }
    if (!ec) {
        std::filesystem::create_directories(cache_root_ / kLockDirectory, ec);
    }
    if (ec) {
        available_ = false;
        unavailable_reason_ = "Unable to create cache root " + cache_root_.string() +
                              ": " + ec.message();
        return ServiceError{ErrorCategory::Store, unavailable_reason_, "store_unavailable"};
    }

    const auto canonical = std::filesystem::weakly_canonical(cache_root_, ec);
    if (!ec) {
        cache_root_ = canonical;
    }
    available_ = true;
    unavailable_reason_.clear();
    return cache_root_;
}

core::errors::Result<std::string> EnvironmentStore::checked_name(
    const std::string& name) const {
    if (!available_) {
        return ServiceError{ErrorCategory::Store,
                            "Named environments are unavailable: " + unavailable_reason_,
                            "store_unavailable"};
    }
    // Directories and metadata records share one namespace.
    if (name.find(kMetadataSuffix) != std::string::npos) {
        return ServiceError{ErrorCategory::Input,
                            "Environment name cannot contain '" + std::string(kMetadataSuffix) +
                                "': " + name,
                            "invalid_environment_name"};
    }
    return guard_.validate_environment_name(name);
}

core::errors::Result<std::filesystem::path> EnvironmentStore::environment_path(
    const std::string& name) const {
    auto checked = checked_name(name);
    if (core::errors::is_error(checked)) {
        return core::errors::get_error(checked);
    }
    return guard_.validate_path_under_root(cache_root_, core::errors::get_value(checked));
}

core::errors::Result<std::filesystem::path> EnvironmentStore::metadata_path(
    const std::string& name) const {
    auto checked = checked_name(name);
    if (core::errors::is_error(checked)) {
        return core::errors::get_error(checked);
    }
    return guard_.validate_path_under_root(cache_root_,
                                           core::errors::get_value(checked) + kMetadataSuffix);
}

core::errors::Result<std::filesystem::path> EnvironmentStore::lock_path(
    const std::string& name) const {
    auto checked = checked_name(name);
    if (core::errors::is_error(checked)) {
        return core::errors::get_error(checked);
    }
    return guard_.validate_path_under_root(
        cache_root_, std::filesystem::path(kLockDirectory) /
                         (core::errors::get_value(checked) + kLockSuffix));
}

bool EnvironmentStore::environment_exists(const std::string& name) const {
    auto path = environment_path(name);
    if (core::errors::is_error(path)) {
        return false;
    }
    std::error_code ec;
    return std::filesystem::is_directory(core::errors::get_value(path), ec) && !ec;
}

core::errors::Result<EnvironmentMetadata> EnvironmentStore::read_metadata(
    const std::string& name) const {
    auto path_result = metadata_path(name);
    if (core::errors::is_error(path_result)) {
        return core::errors::get_error(path_result);
    }
    const auto path = core::errors::get_value(path_result);

    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec) || ec) {
        return ServiceError{ErrorCategory::Store,
                            "No metadata recorded for environment: " + name,
                            "metadata_missing"};
    }

    std::ifstream in(path);
    if (!in.is_open()) {
        return ServiceError{ErrorCategory::Store,
                            "Unable to open environment metadata: " + path.string(),
                            "metadata_unreadable"};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();

    json document;
    try {
        document = json::parse(buffer.str());
    } catch (const json::exception& e) {
        return corrupt(path, e.what());
    }

    if (!document.is_object()) {
        return corrupt(path, "not an object");
    }
    const auto recorded_name = document.find("name");
    if (recorded_name == document.end() || !recorded_name->is_string() ||
        recorded_name->get<std::string>() != name) {
        return corrupt(path, "name does not match");
    }
    const auto deps = document.find("dependencies");
    if (deps == document.end() || !deps->is_array()) {
        return corrupt(path, "missing dependency list");
    }

    EnvironmentMetadata metadata;
    metadata.name = name;
    for (const auto& item : *deps) {
        if (!item.is_string()) {
            return corrupt(path, "dependency entry is not a string");
        }
        metadata.dependencies.insert(item.get<std::string>());
    }
    const auto created = document.find("created_at_unix_ms");
    if (created == document.end() || !created->is_number_integer()) {
        return corrupt(path, "missing creation timestamp");
    }
    metadata.created_at_unix_ms = created->get<std::int64_t>();
    return metadata;
}

core::errors::Result<std::filesystem::path> EnvironmentStore::write_metadata(
    const EnvironmentMetadata& metadata) const {
    auto path_result = metadata_path(metadata.name);
    if (core::errors::is_error(path_result)) {
        return core::errors::get_error(path_result);
    }
    const auto path = core::errors::get_value(path_result);

    json document;
    document["format_version"] = kFormatVersion;
    document["name"] = metadata.name;
    document["dependencies"] = json::array();
    for (const auto& dependency : metadata.dependencies) {
        document["dependencies"].push_back(dependency);
    }
    document["created_at_unix_ms"] = metadata.created_at_unix_ms;
    document["created_at"] = format_utc(metadata.created_at_unix_ms);

    std::string serialized;
    try {
        serialized = document.dump(2);
    } catch (const json::exception& e) {
        return ServiceError{ErrorCategory::Store,
                            "Unable to serialize metadata for " + metadata.name + ": " + e.what(),
                            "metadata_write_failed"};
    }

    auto staging = path;
    staging += ".tmp-" + core::config::generate_request_id();
    {
        std::ofstream out(staging, std::ios::trunc);
        if (!out.is_open()) {
            return ServiceError{ErrorCategory::Store,
                                "Unable to open metadata file: " + staging.string(),
                                "metadata_write_failed"};
        }
        out << serialized << "\n";
        out.flush();
        if (!out.good()) {
            std::error_code ignored;
            std::filesystem::remove(staging, ignored);
            return ServiceError{ErrorCategory::Store,
                                "Unable to write metadata file: " + staging.string(),
                                "metadata_write_failed"};
        }
    }

    std::error_code ec;
    std::filesystem::rename(staging, path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(staging, ignored);
        return ServiceError{ErrorCategory::Store,
                            "Unable to publish metadata file " + path.string() + ": " +
                                ec.message(),
                            "metadata_write_failed"};
    }
    return path;
}

core::errors::Result<std::uintmax_t> EnvironmentStore::remove_environment(
    const std::string& name) const {
    auto meta_result = metadata_path(name);
    if (core::errors::is_error(meta_result)) {
        return core::errors::get_error(meta_result);
    }
    auto dir_result = environment_path(name);
    if (core::errors::is_error(dir_result)) {
        return core::errors::get_error(dir_result);
    }

    std::uintmax_t removed = 0;
    std::error_code ec;
    if (std::filesystem::remove(core::errors::get_value(meta_result), ec)) {
        ++removed;
    }
    if (ec) {
        return ServiceError{ErrorCategory::Store,
                            "Unable to remove metadata for " + name + ": " + ec.message(),
                            "remove_failed"};
    }

    const auto count = std::filesystem::remove_all(core::errors::get_value(dir_result), ec);
    if (ec) {
        return ServiceError{ErrorCategory::Store,
                            "Unable to remove environment " + name + ": " + ec.message(),
                            "remove_failed"};
    }
    return removed + count;
}

}  // namespace venvbox::env
