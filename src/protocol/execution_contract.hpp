#pragma once
#include <optional>
#include <string>
#include <vector>

namespace venvbox::protocol {

    // A validated job: code to run, the packages it needs, and optionally the
    // logical name of a cached environment to run it in.
    struct ExecutionRequest {
        std::string code;
        std::vector<std::string> dependencies;
        std::optional<std::string> environment_name;
    };

    // `error` is empty on full success.
    struct ExecutionResult {
        std::string output;
        std::string error;
    };

} // namespace venvbox::protocol
