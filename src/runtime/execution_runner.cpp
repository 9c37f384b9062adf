#include "runtime/execution_runner.hpp"

#include <exception>
#include <system_error>
#include <utility>
#include "core/errors/service_errors.hpp"
#include "process/process_runner.hpp"

namespace venvbox::runtime {

namespace {

constexpr const char* kTruncatedMarker = "\n[output truncated]";

ExecutionOutcome failed_outcome(std::string diagnostic) {
    ExecutionOutcome outcome;
    outcome.diagnostic = std::move(diagnostic);
    return outcome;
}

}  // namespace

std::filesystem::path interpreter_path(const std::filesystem::path& environment_root) {
#ifdef _WIN32
    return environment_root / "Scripts" / "python.exe";
#else
    return environment_root / "bin" / "python";
#endif
}

std::string timeout_message(const std::uint32_t timeout_ms) {
    std::string limit;
    if (timeout_ms == 1000) {
        limit = "1 second";
    } else if (timeout_ms % 1000 == 0) {
        limit = std::to_string(timeout_ms / 1000) + " seconds";
    } else {
        limit = std::to_string(timeout_ms) + " ms";
    }
    return std::string(kTimeoutMessagePrefix) + " (" + limit + " limit)";
}

ExecutionRunner::ExecutionRunner(RunnerOptions options) : options_(std::move(options)) {}

ExecutionOutcome ExecutionRunner::run(const std::filesystem::path& environment_root,
                                      const std::string& code) const noexcept {
    try {
        const auto interpreter = interpreter_path(environment_root);
        std::error_code ec;
        if (!std::filesystem::exists(interpreter, ec) || ec) {
            return failed_outcome("Error: Python interpreter not found: " +
                                  interpreter.string());
        }

        process::ProcessRequest request;
        request.argv = {interpreter.string(), "-c", code};
        request.env_overrides = {{"PYTHONUNBUFFERED", "1"}};
        request.timeout_ms = options_.timeout_ms;
        request.max_output_bytes = options_.max_output_bytes;

        auto capture_result = process::run_process(request);
        if (core::errors::is_error(capture_result)) {
            return failed_outcome("Error: " + core::errors::get_error(capture_result).message);
        }
        const auto& capture = core::errors::get_value(capture_result);

        ExecutionOutcome outcome;
        outcome.exit_code = capture.exit_code;
        outcome.duration_ms = capture.duration_ms;
        if (capture.timed_out) {
            outcome.timed_out = true;
            outcome.diagnostic = timeout_message(options_.timeout_ms);
            return outcome;
        }

        outcome.stdout_text = capture.stdout_text;
        if (capture.stdout_truncated) {
            outcome.stdout_text += kTruncatedMarker;
        }
        outcome.diagnostic = capture.stderr_text;
        if (capture.stderr_truncated) {
            outcome.diagnostic += kTruncatedMarker;
        }
        if (capture.exit_code != 0 && outcome.diagnostic.empty()) {
            outcome.diagnostic = process::describe_exit(capture);
        }
        return outcome;
    } catch (const std::exception& e) {
        return failed_outcome(std::string("Error: ") + e.what());
    }
}

}  // namespace venvbox::runtime
