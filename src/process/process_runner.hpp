#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>
#include "core/errors/service_errors.hpp"

namespace venvbox::process {

struct ProcessRequest {
    std::vector<std::string> argv;
    // Empty means the child inherits the caller's working directory.
    std::filesystem::path working_directory;
    // Added to, or replacing entries of, the parent environment.
    std::vector<std::pair<std::string, std::string>> env_overrides;
    std::uint32_t timeout_ms = 5000;
    std::size_t max_output_bytes = 4 * 1024 * 1024;
};

struct ProcessCapture {
    int exit_code = -1;
    int term_signal = 0;
    bool timed_out = false;
    bool stdout_truncated = false;
    bool stderr_truncated = false;
    std::string stdout_text;
    std::string stderr_text;
    double duration_ms = 0.0;
};

// Runs argv[0] (resolved through PATH) in its own process group with stdin
// bound to /dev/null. On timeout the whole group is killed; once the child
// exits, any process it left behind in the group is killed as well.
// Returns an error only if the child could not be started.
core::errors::Result<ProcessCapture> run_process(const ProcessRequest& request);

// Human-readable summary of a non-zero exit, e.g. "Process exited with code 3".
std::string describe_exit(const ProcessCapture& capture);

}  // namespace venvbox::process
