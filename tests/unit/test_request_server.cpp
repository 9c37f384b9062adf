#include <map>
#include <memory>
#include <sstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "app/request_server.hpp"
#include "env/environment_builder.hpp"
#include "unit/test_support.hpp"

namespace {

using nlohmann::json;
using venvbox::app::RequestServer;
using venvbox::env::UvEnvironmentBuilder;
using venvbox::env::builder_options_from;
using venvbox::session::ExecutionOrchestrator;
using venvbox::testing::TempWorkspace;
using venvbox::testing::test_config;
using venvbox::testing::write_fake_uv;

class RequestServerTest : public ::testing::Test {
protected:
    RequestServerTest() : workspace_("request_server") {
        auto config = test_config(workspace_.root());
        config.uv_executable =
            write_fake_uv(workspace_.root(), workspace_.root() / "uv.log").string();
        auto builder = std::make_shared<UvEnvironmentBuilder>(builder_options_from(config));
        orchestrator_ = std::make_unique<ExecutionOrchestrator>(config, builder);
    }

    std::vector<json> serve(const std::string& input, std::uint32_t workers,
                            std::size_t* accepted = nullptr) {
        std::istringstream in(input);
        std::ostringstream out;
        RequestServer server(*orchestrator_, workers, out);
        const auto handled = server.serve(in);
        if (accepted != nullptr) {
            *accepted = handled;
        }

        std::vector<json> replies;
        std::istringstream lines(out.str());
        std::string line;
        while (std::getline(lines, line)) {
            replies.push_back(json::parse(line));
        }
        return replies;
    }

    TempWorkspace workspace_;
    std::unique_ptr<ExecutionOrchestrator> orchestrator_;
};

TEST_F(RequestServerTest, AnswersEveryLineAndEchoesIds) {
    const std::string input =
        R"({"id": "a", "code": "echo alpha"})" "\n"
        "\n"
        R"({"id": "b", "code": "echo beta", "lib": ["rich"], "name": "cached"})" "\n"
        R"({"id": 7, "code": "echo oops >&2; exit 2"})" "\n";

    std::size_t accepted = 0;
    const auto replies = serve(input, 3, &accepted);
    EXPECT_EQ(accepted, 3u);
    ASSERT_EQ(replies.size(), 3u);

    std::map<std::string, json> by_id;
    for (const auto& reply : replies) {
        by_id[reply["id"].get<std::string>()] = reply;
    }
    EXPECT_EQ(by_id["a"]["output"], "alpha\n");
    EXPECT_EQ(by_id["a"]["error"], "");
    EXPECT_EQ(by_id["b"]["output"], "beta\n");
    EXPECT_EQ(by_id["7"]["output"], "");
    EXPECT_EQ(by_id["7"]["error"], "oops\n");
}

TEST_F(RequestServerTest, RejectsBadLinesWithoutStopping) {
    const std::string input =
        "not json\n"
        R"({"code": "pass", "name": "../up"})" "\n"
        R"({"id": "ok", "code": "echo fine"})" "\n";

    const auto replies = serve(input, 1);
    ASSERT_EQ(replies.size(), 3u);

    // One worker answers in input order.
    EXPECT_FALSE(replies[0].contains("id"));
    EXPECT_EQ(replies[0]["output"], "");
    EXPECT_EQ(replies[0]["error"].get<std::string>().rfind("Malformed request JSON", 0), 0u);
    EXPECT_NE(replies[1]["error"].get<std::string>().find("Environment name"),
              std::string::npos);
    EXPECT_EQ(replies[2]["id"], "ok");
    EXPECT_EQ(replies[2]["output"], "fine\n");
}

TEST_F(RequestServerTest, HandlesMoreRequestsThanQueueSlots) {
    std::string input;
    for (int i = 0; i < 20; ++i) {
        input += R"({"id": ")" + std::to_string(i) + R"(", "code": "echo )" +
                 std::to_string(i) + "\"}\n";
    }

    const auto replies = serve(input, 2);
    ASSERT_EQ(replies.size(), 20u);
    for (const auto& reply : replies) {
        EXPECT_EQ(reply["output"], reply["id"].get<std::string>() + "\n");
    }
}

TEST_F(RequestServerTest, EmptyInputAnswersNothing) {
    std::size_t accepted = 99;
    const auto replies = serve("", 2, &accepted);
    EXPECT_TRUE(replies.empty());
    EXPECT_EQ(accepted, 0u);
}

}  // namespace
