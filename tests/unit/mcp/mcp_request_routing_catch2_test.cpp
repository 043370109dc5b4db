#include <catch2/catch_test_macros.hpp>

#include <string>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <govcat/mcp/mcp_server.h>
#include <govcat/mcp/tool_registry.h>

#include "../../common/server_fixture.h"

using govcat::ErrorCode;
using govcat::mcp::json;
using govcat::test::ServerFixture;
namespace protocol = govcat::mcp::protocol;

namespace {

class SpdlogLevelGuard {
public:
    SpdlogLevelGuard() : previous_(spdlog::get_level()) {}
    ~SpdlogLevelGuard() { spdlog::set_level(previous_); }

private:
    spdlog::level::level_enum previous_;
};

struct RoutingFixture : ServerFixture {
    RoutingFixture() {
        catalog.writeDoc("alpha", "Prefer composition.",
                         {{"categories", json::array({"design"})}});
        startServer();
    }

    json call(const json& request) {
        auto mr = server->testHandleRequest(request);
        REQUIRE(mr);
        return mr.value();
    }
};

} // namespace

TEST_CASE_METHOD(RoutingFixture, "MCP routing - notifications return the notification sentinel",
                 "[mcp][routing][notifications][catch2]") {
    SECTION("notifications/initialized") {
        auto mr = server->testHandleRequest(notification("notifications/initialized"));
        REQUIRE_FALSE(mr);
        CHECK(mr.error().code == ErrorCode::Success);
        CHECK(mr.error().message == "notification");
    }

    SECTION("notifications/cancelled accepts requestId") {
        auto mr =
            server->testHandleRequest(notification("notifications/cancelled", {{"requestId", 123}}));
        REQUIRE_FALSE(mr);
        CHECK(mr.error().code == ErrorCode::Success);
    }

    SECTION("notifications/cancelled rejects missing id") {
        auto mr = server->testHandleRequest(notification("notifications/cancelled"));
        REQUIRE_FALSE(mr);
        CHECK(mr.error().code == ErrorCode::InvalidArgument);
    }

    SECTION("unknown notifications are ignored") {
        auto mr = server->testHandleRequest(notification("notifications/progress"));
        REQUIRE_FALSE(mr);
        CHECK(mr.error().code == ErrorCode::Success);
    }

    SECTION("exit") {
        auto mr = server->testHandleRequest(notification("exit"));
        REQUIRE_FALSE(mr);
        CHECK(mr.error().code == ErrorCode::Success);
        CHECK_FALSE(server->isRunning());
    }
}

TEST_CASE_METHOD(RoutingFixture, "MCP routing - core methods answer directly",
                 "[mcp][routing][core][catch2]") {
    auto ping = call(request(1, "ping"));
    CHECK(ping["jsonrpc"] == "2.0");
    CHECK(ping["id"] == 1);
    CHECK(ping["result"] == json::object());

    auto shutdown = call(request(2, "shutdown"));
    CHECK(shutdown["result"] == json::object());

    auto tools = call(request(3, "tools/list"));
    REQUIRE(tools["result"]["tools"].is_array());
    CHECK(tools["result"]["tools"].size() == govcat::mcp::getRegistry().size());
    for (const auto& tool : tools["result"]["tools"]) {
        CHECK(tool.contains("name"));
        CHECK(tool.contains("inputSchema"));
    }
}

TEST_CASE_METHOD(RoutingFixture, "MCP routing - logging/setLevel",
                 "[mcp][routing][logging][catch2]") {
    SpdlogLevelGuard levelGuard;

    auto ok = call(request(7, "logging/setLevel", {{"level", "debug"}}));
    REQUIRE(ok.contains("result"));
    CHECK(spdlog::get_level() == spdlog::level::debug);

    auto bad = call(request(8, "logging/setLevel", {{"level", 3}}));
    REQUIRE(bad.contains("error"));
    CHECK(bad["error"]["code"] == protocol::INVALID_PARAMS);
    CHECK(bad["error"]["data"]["method"] == "logging/setLevel");
}

TEST_CASE_METHOD(RoutingFixture, "MCP routing - registry methods are callable directly",
                 "[mcp][routing][dispatch][catch2]") {
    auto list = call(request("r1", "instructions/list"));
    REQUIRE(list.contains("result"));
    CHECK(list["id"] == "r1");
    CHECK(list["result"]["count"] == 1);

    SECTION("null params read as an empty object") {
        json req = request("r2", "instructions/list");
        req["params"] = nullptr;
        CHECK(call(req)["result"]["count"] == 1);
    }

    SECTION("unknown method") {
        auto unknown = call(request("r3", "instructions/frobnicate"));
        REQUIRE(unknown.contains("error"));
        CHECK(unknown["error"]["code"] == protocol::METHOD_NOT_FOUND);
    }

    SECTION("registry method sent as a notification has no response") {
        auto mr = server->testHandleRequest(notification("instructions/list"));
        REQUIRE_FALSE(mr);
        CHECK(mr.error().code == ErrorCode::Success);
    }
}

TEST_CASE_METHOD(RoutingFixture, "MCP routing - tools/call wraps results and keeps error codes",
                 "[mcp][routing][tools][catch2]") {
    SECTION("structured result becomes text content") {
        auto out = call(request(10, "tools/call",
                                {{"name", "instructions/get"}, {"arguments", {{"id", "alpha"}}}}));
        REQUIRE(out.contains("result"));
        const auto& content = out["result"]["content"];
        REQUIRE(content.is_array());
        REQUIRE(content.size() == 1);
        CHECK(content[0]["type"] == "text");
        auto inner = json::parse(content[0]["text"].get<std::string>());
        CHECK(inner["item"]["id"] == "alpha");
        CHECK_FALSE(out["result"].contains("isError"));
    }

    SECTION("missing tool name") {
        auto out = call(request(11, "tools/call", {{"arguments", json::object()}}));
        REQUIRE(out.contains("error"));
        CHECK(out["error"]["code"] == protocol::INVALID_PARAMS);
    }

    SECTION("validation failure") {
        auto out = call(request(12, "tools/call",
                                {{"name", "instructions/get"}, {"arguments", json::object()}}));
        REQUIRE(out.contains("error"));
        CHECK(out["error"]["code"] == protocol::INVALID_PARAMS);
        CHECK(out["error"]["data"]["method"] == "instructions/get");
        CHECK(out["error"]["data"].contains("errors"));
    }

    SECTION("mutation disabled") {
        json entry{{"id", "gamma"}, {"title", "Gamma"}, {"body", "Write tests."}};
        auto out = call(request(13, "tools/call",
                                {{"name", "instructions/add"}, {"arguments", {{"entry", entry}}}}));
        REQUIRE(out.contains("error"));
        CHECK(out["error"]["code"] == protocol::MUTATION_DISABLED);
    }

    SECTION("null arguments") {
        auto out = call(request(14, "tools/call",
                                {{"name", "instructions/list"}, {"arguments", nullptr}}));
        REQUIRE(out.contains("result"));
    }
}
