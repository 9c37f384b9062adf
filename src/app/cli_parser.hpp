#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "core/config/service_config.hpp"
#include "core/errors/service_errors.hpp"

namespace venvbox::app::cli {

    enum class Command {
        Run,
        Serve,
        Info
    };

    struct CliCommand {
        Command command = Command::Run;
        core::config::ServiceConfig config;
        // `run` only: at most one of request_file / code; neither means stdin.
        std::optional<std::filesystem::path> request_file;
        std::optional<std::string> code;
        std::vector<std::string> libs;
        std::optional<std::string> name;
    };

    core::errors::Result<CliCommand> parse_and_validate(
        int argc, char* argv[],
        const core::config::EnvLookup& env_lookup = core::config::process_env_lookup());

    std::string usage();
}
