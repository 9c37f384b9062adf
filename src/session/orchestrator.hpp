#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include "core/config/service_config.hpp"
#include "core/errors/service_errors.hpp"
#include "env/environment_builder.hpp"
#include "env/environment_store.hpp"
#include "env/reuse_policy.hpp"
#include "protocol/execution_contract.hpp"
#include "runtime/execution_runner.hpp"
#include "session/named_lock_table.hpp"

namespace venvbox::session {

enum class RequestState {
    Resolve,
    Reuse,
    Build,
    Execute,
    Respond
};

struct OrchestratorStats {
    std::uint64_t requests = 0;
    std::uint64_t builds = 0;
    std::uint64_t reuses = 0;
    std::uint64_t build_failures = 0;
    std::uint64_t unexpected_faults = 0;
};

// Drives one request through RESOLVE -> (REUSE | BUILD) -> EXECUTE -> RESPOND,
// with CLEANUP on every exit path. Safe to call from many threads at once:
// requests naming the same environment are serialized, across processes that
// share the cache root as well, and everything else runs in parallel.
class ExecutionOrchestrator {
public:
    ExecutionOrchestrator(core::config::ServiceConfig config,
                          std::shared_ptr<const env::EnvironmentBuilder> builder);

    // Never throws. Failures of any kind come back in ExecutionResult::error.
    protocol::ExecutionResult execute(const protocol::ExecutionRequest& request) noexcept;

    bool store_available() const { return store_.available(); }
    const env::EnvironmentStore& store() const { return store_; }
    const core::config::ServiceConfig& config() const { return config_; }
    OrchestratorStats stats() const;

private:
    protocol::ExecutionResult execute_temporary(const std::string& request_id,
                                                const protocol::ExecutionRequest& request);
    protocol::ExecutionResult execute_named(const std::string& request_id,
                                            const std::string& name,
                                            const protocol::ExecutionRequest& request);
    protocol::ExecutionResult run_in(const std::string& request_id,
                                     const std::filesystem::path& root,
                                     const protocol::ExecutionRequest& request);

    core::errors::Result<std::filesystem::path> allocate_temporary_root() const;
    static std::string to_string(RequestState state);
    static void transition(const std::string& request_id, RequestState from, RequestState to);

    core::config::ServiceConfig config_;
    std::shared_ptr<const env::EnvironmentBuilder> builder_;
    env::EnvironmentStore store_;
    env::ReusePolicy reuse_policy_;
    runtime::ExecutionRunner runner_;
    NamedLockTable locks_;

    std::atomic<std::uint64_t> requests_{0};
    std::atomic<std::uint64_t> builds_{0};
    std::atomic<std::uint64_t> reuses_{0};
    std::atomic<std::uint64_t> build_failures_{0};
    std::atomic<std::uint64_t> unexpected_faults_{0};
};

}  // namespace venvbox::session
