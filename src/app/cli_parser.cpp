#include "cli_parser.hpp"
#include <system_error>
#include <utility>
#include "policy/request_guard.hpp"

namespace venvbox::app::cli {

    using namespace venvbox::core::errors;
    using venvbox::core::config::ServiceConfig;

    // 1. Raw options (internal only)
    struct RawCliOptions {
        std::optional<std::string> request_file;
        std::optional<std::string> code;
        std::vector<std::string> libs;
        std::optional<std::string> name;
        std::vector<std::pair<std::string, std::string>> settings;
    };

    std::string usage() {
        return "Usage: venvbox run [--request FILE | --code TEXT] [--lib SPECIFIER]... [--name NAME] [settings]\n"
               "       venvbox serve [settings]\n"
               "       venvbox info\n"
               "Settings: --create-timeout-ms N --install-timeout-ms N --exec-timeout-ms N\n"
               "          --cache-root DIR --temp-root DIR --uv PATH --python VERSION\n"
               "          --max-output-bytes N --workers N --log-level LEVEL";
    }

    Result<CliCommand> parse_and_validate(int argc, char* argv[],
                                          const core::config::EnvLookup& env_lookup) {
        if (argc < 2) {
            return ServiceError{ErrorCategory::Input, "No command provided.", "missing_command", usage()};
        }

        CliCommand parsed;
        const std::string command = argv[1];
        if (command == "run") {
            parsed.command = Command::Run;
        } else if (command == "serve") {
            parsed.command = Command::Serve;
        } else if (command == "info") {
            parsed.command = Command::Info;
        } else {
            return ServiceError{ErrorCategory::Input, "Unknown command: " + command, "unknown_command", usage()};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Start at 2 to skip program name and command
            args.push_back(argv[i]);
        }

        // 2. Parser phase: just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            const std::string& flag = args[i];
            if (flag.rfind("--", 0) != 0) {
                return ServiceError{ErrorCategory::Input, "Unexpected argument: " + flag, "unknown_argument"};
            }
            if (i + 1 >= args.size()) {
                return ServiceError{ErrorCategory::Input, "Missing value for " + flag, "missing_value"};
            }
            const std::string value = args[++i];
            const std::string key = flag.substr(2);

            if (core::config::is_setting_key(key)) {
                raw.settings.emplace_back(key, value);
            } else if (parsed.command != Command::Run) {
                return ServiceError{ErrorCategory::Input, "Unknown argument: " + flag, "unknown_argument"};
            } else if (key == "request") {
                raw.request_file = value;
            } else if (key == "code") {
                raw.code = value;
            } else if (key == "lib") {
                raw.libs.push_back(value);
            } else if (key == "name") {
                raw.name = value;
            } else {
                return ServiceError{ErrorCategory::Input, "Unknown argument: " + flag, "unknown_argument"};
            }
        }

        // 3. Validator phase: defaults < environment < flags
        auto loaded = core::config::load_service_config(env_lookup);
        if (is_error(loaded)) {
            return get_error(loaded);
        }
        ServiceConfig config = get_value(loaded);
        for (const auto& [key, value] : raw.settings) {
            auto updated = core::config::with_setting(std::move(config), key, value);
            if (is_error(updated)) {
                return get_error(updated);
            }
            config = get_value(updated);
        }
        parsed.config = std::move(config);

        if (raw.request_file && raw.code) {
            return ServiceError{ErrorCategory::Input, "Cannot provide both --request and --code", "conflicting_flags"};
        }
        if (raw.request_file && (!raw.libs.empty() || raw.name)) {
            return ServiceError{ErrorCategory::Input, "--lib and --name only apply together with --code", "conflicting_flags",
                                "Put \"lib\" and \"name\" inside the request file instead."};
        }

        if (raw.request_file) {
            std::filesystem::path p(raw.request_file.value());
            std::error_code path_ec;
            const bool is_file = std::filesystem::is_regular_file(p, path_ec);
            if (path_ec || !is_file) {
                return ServiceError{ErrorCategory::Input, "Request file does not exist: " + p.string(), "invalid_path"};
            }
            parsed.request_file = std::move(p);
        }

        if (raw.code) {
            const policy::RequestGuard guard;
            auto libs = guard.validate_dependencies(raw.libs);
            if (is_error(libs)) {
                return get_error(libs);
            }
            if (raw.name) {
                auto name = guard.validate_environment_name(raw.name.value());
                if (is_error(name)) {
                    return get_error(name);
                }
            }
            parsed.code = raw.code;
            parsed.libs = raw.libs;
            parsed.name = raw.name;
        } else if (!raw.libs.empty() || raw.name) {
            return ServiceError{ErrorCategory::Input, "--lib and --name require --code", "missing_required_flag"};
        }

        return parsed;
    }

} // namespace venvbox::app::cli
