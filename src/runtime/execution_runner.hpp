#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace venvbox::runtime {

inline constexpr const char* kTimeoutMessagePrefix = "Error: Code execution timed out";

struct RunnerOptions {
    std::uint32_t timeout_ms = 30000;
    std::size_t max_output_bytes = 4 * 1024 * 1024;
};

struct ExecutionOutcome {
    std::string stdout_text;
    std::string diagnostic;
    bool timed_out = false;
    int exit_code = -1;
    double duration_ms = 0.0;
};

// bin/python on POSIX hosts, Scripts/python.exe on Windows.
std::filesystem::path interpreter_path(const std::filesystem::path& environment_root);

// "Error: Code execution timed out (30 seconds limit)"
std::string timeout_message(std::uint32_t timeout_ms);

// Runs `<interpreter> -c <code>` once. Never throws: every failure is
// reported through ExecutionOutcome::diagnostic with empty stdout.
class ExecutionRunner {
public:
    explicit ExecutionRunner(RunnerOptions options);

    ExecutionOutcome run(const std::filesystem::path& environment_root,
                         const std::string& code) const noexcept;

private:
    RunnerOptions options_;
};

}  // namespace venvbox::runtime
