#include "session/orchestrator.hpp"

#include <chrono>
#include <exception>
#include <system_error>
#include <utility>
#include "core/config/request_id.hpp"
#include "core/logging/logger.hpp"
#include "session/scoped_environment.hpp"

namespace venvbox::session {

using core::errors::ErrorCategory;
using core::errors::ServiceError;
using protocol::ExecutionRequest;
using protocol::ExecutionResult;

namespace {

std::int64_t now_unix_ms() {
    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        now.time_since_epoch())
                        .count();
    return static_cast<std::int64_t>(ms);
}

ExecutionResult failure(std::string error) {
    return ExecutionResult{"", std::move(error)};
}

}  // namespace

ExecutionOrchestrator::ExecutionOrchestrator(
    core::config::ServiceConfig config, std::shared_ptr<const env::EnvironmentBuilder> builder)
    : config_(std::move(config)),
      builder_(std::move(builder)),
      store_(config_.cache_root),
      reuse_policy_(store_),
      runner_(runtime::RunnerOptions{config_.execution_timeout_ms, config_.max_output_bytes}) {
    auto initialized = store_.initialize();
    if (core::errors::is_error(initialized)) {
        LOG_WARN("ExecutionOrchestrator: named environments disabled: " +
                 core::errors::get_error(initialized).message);
    } else {
        LOG_INFO("ExecutionOrchestrator: environment cache at " +
                 core::errors::get_value(initialized).string());
    }
}

std::string ExecutionOrchestrator::to_string(const RequestState state) {
    switch (state) {
        case RequestState::Resolve:
            return "resolve";
        case RequestState::Reuse:
            return "reuse";
        case RequestState::Build:
            return "build";
        case RequestState::Execute:
            return "execute";
        case RequestState::Respond:
            return "respond";
        default:
            return "unknown";
    }
}

void ExecutionOrchestrator::transition(const std::string& request_id, const RequestState from,
                                       const RequestState to) {
    LOG_REQ_DEBUG(request_id, "transition " + to_string(from) + " -> " + to_string(to));
}

OrchestratorStats ExecutionOrchestrator::stats() const {
    OrchestratorStats snapshot;
    snapshot.requests = requests_.load();
    snapshot.builds = builds_.load();
    snapshot.reuses = reuses_.load();
    snapshot.build_failures = build_failures_.load();
    snapshot.unexpected_faults = unexpected_faults_.load();
    return snapshot;
}

ExecutionResult ExecutionOrchestrator::execute(const ExecutionRequest& request) noexcept {
    std::string request_id;
    try {
        request_id = core::config::generate_request_id();
        ++requests_;
        LOG_REQ_INFO(request_id,
                     "request received: " + std::to_string(request.dependencies.size()) +
                         " dependencies, environment " +
                         request.environment_name.value_or("<temporary>"));
        if (request.environment_name.has_value()) {
            return execute_named(request_id, request.environment_name.value(), request);
        }
        return execute_temporary(request_id, request);
    } catch (const std::exception& e) {
        ++unexpected_faults_;
        LOG_REQ_ERROR(request_id, std::string("unexpected fault: ") + e.what());
        return failure(std::string("Unexpected error: ") + e.what());
    } catch (...) {
        ++unexpected_faults_;
        LOG_REQ_ERROR(request_id, "unexpected fault of unknown type");
        return failure("Unexpected error: unknown fault");
    }
}

core::errors::Result<std::filesystem::path> ExecutionOrchestrator::allocate_temporary_root()
    const {
    std::error_code ec;
    std::filesystem::create_directories(config_.temp_root, ec);
    if (ec) {
        return ServiceError{ErrorCategory::Construction,
                            "Unable to create temporary root " + config_.temp_root.string() +
                                ": " + ec.message(),
                            "temp_root_unavailable"};
    }

    constexpr int kMaxAttempts = 16;
    for (int attempt = 0; attempt < kMaxAttempts; ++attempt) {
        const auto candidate =
            config_.temp_root / ("venv_" + core::config::generate_request_id());
        if (std::filesystem::create_directory(candidate, ec)) {
            return candidate;
        }
        if (ec) {
            return ServiceError{ErrorCategory::Construction,
                                "Unable to create temporary environment " +
                                    candidate.string() + ": " + ec.message(),
                                "temp_env_create_failed"};
        }
    }

    return ServiceError{ErrorCategory::Internal,
                        "Unable to allocate a unique temporary environment.",
                        "temp_env_allocation_failed"};
}

ExecutionResult ExecutionOrchestrator::execute_temporary(const std::string& request_id,
                                                         const ExecutionRequest& request) {
    auto allocated = allocate_temporary_root();
    if (core::errors::is_error(allocated)) {
        const auto& err = core::errors::get_error(allocated);
        LOG_REQ_ERROR(request_id, "resolve failed [" + err.code + "]: " + err.message);
        return failure("Failed to create virtual environment: " + err.message);
    }

    ScopedEnvironment environment(core::errors::get_value(allocated), true, request_id);
    transition(request_id, RequestState::Resolve, RequestState::Build);

    ++builds_;
    auto built = builder_->build(environment.root(), request.dependencies);
    if (core::errors::is_error(built)) {
        ++build_failures_;
        const auto& err = core::errors::get_error(built);
        LOG_REQ_WARN(request_id, "build failed [" + err.code + "]");
        transition(request_id, RequestState::Build, RequestState::Respond);
        return failure(err.message);
    }

    transition(request_id, RequestState::Build, RequestState::Execute);
    return run_in(request_id, environment.root(), request);
}

ExecutionResult ExecutionOrchestrator::execute_named(const std::string& request_id,
                                                     const std::string& name,
                                                     const ExecutionRequest& request) {
    if (!store_.available()) {
        LOG_REQ_WARN(request_id, "named environment requested while store is unavailable");
        return failure("Named environments are unavailable: " + store_.unavailable_reason());
    }

    auto path_result = store_.environment_path(name);
    if (core::errors::is_error(path_result)) {
        return failure(core::errors::get_error(path_result).message);
    }

    auto lock_file = store_.lock_path(name);
    if (core::errors::is_error(lock_file)) {
        return failure(core::errors::get_error(lock_file).message);
    }
    const NamedLock lock = locks_.acquire(name, core::errors::get_value(lock_file));
    if (lock.file_lock_error().has_value()) {
        LOG_REQ_ERROR(request_id, lock.file_lock_error().value());
        return failure(lock.file_lock_error().value());
    }
    ScopedEnvironment environment(core::errors::get_value(path_result), false, request_id);

    const auto decision = reuse_policy_.resolve(name, request.dependencies);
    LOG_REQ_INFO(request_id, "environment " + name + ": " + env::to_string(decision.verdict) +
                                 " (" + decision.reason + ")");

    if (decision.verdict == env::ReuseVerdict::Reuse) {
        ++reuses_;
        transition(request_id, RequestState::Resolve, RequestState::Reuse);
        transition(request_id, RequestState::Reuse, RequestState::Execute);
        return run_in(request_id, environment.root(), request);
    }

    transition(request_id, RequestState::Resolve, RequestState::Build);
    auto removed = store_.remove_environment(name);
    if (core::errors::is_error(removed)) {
        LOG_REQ_WARN(request_id, "unable to discard previous environment: " +
                                     core::errors::get_error(removed).message);
    }

    ++builds_;
    auto built = builder_->build(environment.root(), request.dependencies);
    if (core::errors::is_error(built)) {
        ++build_failures_;
        const auto& err = core::errors::get_error(built);
        LOG_REQ_WARN(request_id, "build failed [" + err.code + "]");
        // No metadata was written, so the next request rebuilds; drop the
        // half-installed directory now rather than keeping it around.
        auto discarded = store_.remove_environment(name);
        if (core::errors::is_error(discarded)) {
            LOG_REQ_WARN(request_id, "unable to discard failed build: " +
                                         core::errors::get_error(discarded).message);
        }
        transition(request_id, RequestState::Build, RequestState::Respond);
        return failure(err.message);
    }

    env::EnvironmentMetadata metadata;
    metadata.name = name;
    metadata.dependencies = core::errors::get_value(built).installed;
    metadata.created_at_unix_ms = now_unix_ms();
    auto written = store_.write_metadata(metadata);
    if (core::errors::is_error(written)) {
        LOG_REQ_WARN(request_id, "environment built but not recorded, next request rebuilds: " +
                                     core::errors::get_error(written).message);
    }

    transition(request_id, RequestState::Build, RequestState::Execute);
    return run_in(request_id, environment.root(), request);
}

ExecutionResult ExecutionOrchestrator::run_in(const std::string& request_id,
                                              const std::filesystem::path& root,
                                              const ExecutionRequest& request) {
    const auto outcome = runner_.run(root, request.code);
    transition(request_id, RequestState::Execute, RequestState::Respond);
    LOG_REQ_INFO(request_id,
                 std::string("execution ") + (outcome.timed_out ? "timed out" : "finished") +
                     " with exit code " + std::to_string(outcome.exit_code) + " in " +
                     std::to_string(static_cast<long long>(outcome.duration_ms)) + " ms");
    return ExecutionResult{outcome.stdout_text, outcome.diagnostic};
}

}  // namespace venvbox::session
