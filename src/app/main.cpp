#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>
#include "app/cli_parser.hpp"
#include "app/request_server.hpp"
#include "core/errors/service_errors.hpp"
#include "core/logging/logger.hpp"
#include "env/environment_builder.hpp"
#include "protocol/execution_contract.hpp"
#include "protocol/request_codec.hpp"
#include "session/orchestrator.hpp"

namespace {

constexpr const char* kVersion = "1.0.0";

std::string read_all(std::istream& in) {
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

}  // namespace

int main(int argc, char* argv[]) {
    // 1. Parse CLI input, settings and environment once
    auto parsed = venvbox::app::cli::parse_and_validate(argc, argv);
    if (venvbox::core::errors::is_error(parsed)) {
        const auto& err = venvbox::core::errors::get_error(parsed);
        LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            LOG_INFO("Hint: " + err.hint);
        }
        return 2;
    }

    const auto& cli = venvbox::core::errors::get_value(parsed);
    venvbox::core::logging::Logger::get().set_min_level(cli.config.log_level);

    if (cli.command == venvbox::app::cli::Command::Info) {
        std::cout << venvbox::protocol::encode_service_info(kVersion) << std::endl;
        return 0;
    }

    // 2. Wire the core
    auto builder = std::make_shared<venvbox::env::UvEnvironmentBuilder>(
        venvbox::env::builder_options_from(cli.config));
    venvbox::session::ExecutionOrchestrator orchestrator(cli.config, builder);

    if (cli.command == venvbox::app::cli::Command::Serve) {
        venvbox::app::RequestServer server(orchestrator, cli.config.workers, std::cout);
        server.serve(std::cin);
        return 0;
    }

    // 3. Single request: from flags, a file, or stdin
    venvbox::protocol::ExecutionRequest request;
    if (cli.code.has_value()) {
        request.code = cli.code.value();
        request.dependencies = cli.libs;
        request.environment_name = cli.name;
    } else {
        std::string document;
        if (cli.request_file.has_value()) {
            std::ifstream in(cli.request_file.value());
            if (!in.is_open()) {
                LOG_ERROR("Unable to open request file: " + cli.request_file->string());
                return 2;
            }
            document = read_all(in);
        } else {
            document = read_all(std::cin);
        }

        auto decoded = venvbox::protocol::decode_request(document);
        if (venvbox::core::errors::is_error(decoded)) {
            const auto& err = venvbox::core::errors::get_error(decoded);
            LOG_ERROR("Invalid request [" + err.code + "]: " + err.message);
            std::cout << venvbox::protocol::encode_result(
                             venvbox::protocol::ExecutionResult{"", err.message})
                      << std::endl;
            return 2;
        }
        request = venvbox::core::errors::get_value(decoded).request;
    }

    const auto result = orchestrator.execute(request);
    std::cout << venvbox::protocol::encode_result(result) << std::endl;
    return 0;
}
