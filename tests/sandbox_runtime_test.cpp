#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

#include "support/test_modules.hpp"
#include "worker/sandbox_protocol.hpp"
#include "worker/sandbox_runtime.hpp"

using helix::testing::FakeModuleSource;
using helix::worker::SandboxRuntime;

namespace {

constexpr std::uint32_t kStack = 64 * 1024;

std::vector<nlohmann::json> RunLines(SandboxRuntime& runtime, const std::string& requests) {
    std::istringstream in(requests);
    std::ostringstream out;
    EXPECT_EQ(helix::worker::RunSandboxLoop(runtime, in, out), 0);

    std::vector<nlohmann::json> replies;
    std::istringstream lines(out.str());
    std::string line;
    while (std::getline(lines, line)) {
        replies.push_back(nlohmann::json::parse(line));
    }
    return replies;
}

}  // namespace

// NOLINTNEXTLINE
TEST(sandbox_runtime, executes_request) {
    FakeModuleSource source;
    source.Put("mem://echo.wasm", helix::testing::EchoModule());
    SandboxRuntime runtime(source, 4, kStack);

    const auto request = helix::worker::EncodeExecute({"t1", "mem://echo.wasm", R"({"x":1})"});
    const auto replies = RunLines(runtime, helix::worker::DumpLine(request) + "\n");
    ASSERT_EQ(replies.size(), 1u);
    EXPECT_EQ(replies[0]["type"], "result");
    EXPECT_EQ(replies[0]["taskId"], "t1");
    EXPECT_EQ(replies[0]["success"], true);
    EXPECT_EQ(replies[0]["output"]["x"], 1);
}

// NOLINTNEXTLINE
TEST(sandbox_runtime, fetch_failure_is_a_failed_result) {
    FakeModuleSource source;
    SandboxRuntime runtime(source, 4, kStack);
    const auto result = runtime.Execute("mem://missing.wasm", "");
    EXPECT_FALSE(result.success);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_NE(result.error->find("Failed to fetch WASM"), std::string::npos);
}

// NOLINTNEXTLINE
TEST(sandbox_runtime, control_messages) {
    FakeModuleSource source;
    source.Put("mem://echo.wasm", helix::testing::EchoModule());
    SandboxRuntime runtime(source, 4, kStack);
    runtime.Execute("mem://echo.wasm", "a");
    EXPECT_EQ(runtime.Cache().Size(), 1u);

    const auto replies = RunLines(runtime,
        "{\"type\":\"ping\"}\n"
        "\n"
        "{\"type\":\"clear-cache\"}\n"
        "{\"type\":\"reboot\"}\n"
        "{oops\n");
    ASSERT_EQ(replies.size(), 4u);
    EXPECT_EQ(replies[0]["type"], "pong");
    EXPECT_TRUE(replies[0]["timestamp"].is_number());
    EXPECT_EQ(replies[1]["type"], "cache-cleared");
    EXPECT_EQ(replies[2]["type"], "error");
    EXPECT_EQ(replies[2]["error"], "unknown message type: reboot");
    EXPECT_EQ(replies[3]["type"], "error");
    EXPECT_EQ(replies[3]["error"], "malformed message");
    EXPECT_EQ(runtime.Cache().Size(), 0u);
}

// NOLINTNEXTLINE
TEST(sandbox_runtime, bad_execute_request_is_an_error_reply) {
    FakeModuleSource source;
    SandboxRuntime runtime(source, 4, kStack);
    const auto reply = runtime.Handle(nlohmann::json{{"type", "execute"}, {"taskId", 5}});
    EXPECT_EQ(reply["type"], "error");
    EXPECT_EQ(reply["error"], "execute request has no modulePath");
    EXPECT_EQ(source.Fetches(), 0);
}

// NOLINTNEXTLINE
TEST(sandbox_runtime, invalid_utf8_output_still_encodes) {
    FakeModuleSource source;
    source.Put("mem://raw.wasm", helix::testing::WriteModule(1, std::string("ab\xff\xfe", 4)));
    SandboxRuntime runtime(source, 4, kStack);
    const auto reply = helix::worker::EncodeResult("t2", runtime.Execute("mem://raw.wasm", ""));
    const auto line = helix::worker::DumpLine(reply);
    EXPECT_EQ(line.find('\n'), std::string::npos);
    EXPECT_FALSE(nlohmann::json::parse(line, nullptr, false).is_discarded());
}
