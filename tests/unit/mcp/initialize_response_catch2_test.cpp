// initialize: version negotiation, server info and advertised capabilities

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <string>

#include <nlohmann/json.hpp>
#include <govcat/mcp/mcp_server.h>
#include <govcat/version.hpp>

#include "../../common/server_fixture.h"

using govcat::mcp::json;
using govcat::mcp::MCPServer;
using govcat::mcp::ServerOptions;
using govcat::test::ServerFixture;
namespace protocol = govcat::mcp::protocol;

namespace {

json initializeRequest(json params) {
    return ServerFixture::request(1, "initialize", std::move(params));
}

json clientParams(const std::string& version) {
    return json{{"protocolVersion", version},
                {"clientInfo", {{"name", "test-client"}, {"version", "1.0"}}},
                {"capabilities", json::object()}};
}

} // namespace

TEST_CASE_METHOD(ServerFixture, "MCPInitialize - Result has all required fields",
                 "[mcp][initialize][catch2]") {
    startServer();
    auto mr = server->testHandleRequest(initializeRequest(clientParams("2024-11-05")));
    REQUIRE(mr);
    const auto& response = mr.value();
    CHECK(response["jsonrpc"] == "2.0");
    CHECK(response["id"] == 1);

    const auto& result = response["result"];
    REQUIRE(result.is_object());
    CHECK(result["protocolVersion"] == "2024-11-05");
    CHECK(result["serverInfo"]["name"] == "govcat");
    CHECK(result["serverInfo"]["version"] == std::string(govcat::kVersion));

    const auto& caps = result["capabilities"];
    CHECK(caps["tools"]["listChanged"] == true);
    CHECK(caps.contains("logging"));
    CHECK(caps["experimental"]["cancellation"] == true);
    CHECK(caps["experimental"]["readyNotification"] == std::string(protocol::NOTIFY_READY));
    CHECK(caps["experimental"]["mutationEnabled"] == false);
    CHECK(caps["experimental"]["validationBackend"] == "declarative");

    CHECK(server->testNegotiatedVersion() == "2024-11-05");
}

TEST_CASE_METHOD(ServerFixture, "MCPInitialize - Empty params negotiate the latest version",
                 "[mcp][initialize][catch2]") {
    startServer();
    auto mr = server->testHandleRequest(initializeRequest(json::object()));
    REQUIRE(mr);
    CHECK(mr.value()["result"]["protocolVersion"] ==
          std::string(protocol::LATEST_PROTOCOL_VERSION));
    CHECK(server->testNegotiatedVersion() == std::string(protocol::LATEST_PROTOCOL_VERSION));
}

TEST_CASE_METHOD(ServerFixture, "MCPInitialize - Every supported version is accepted",
                 "[mcp][initialize][catch2]") {
    ServerOptions opts;
    opts.strictProtocol = true;
    startServer(opts);
    const auto& supported = MCPServer::supportedProtocolVersions();
    REQUIRE(std::ranges::find(supported, std::string(protocol::LATEST_PROTOCOL_VERSION)) !=
            supported.end());
    for (const auto& version : supported) {
        auto mr = server->testHandleRequest(initializeRequest(clientParams(version)));
        REQUIRE(mr);
        CHECK(mr.value()["result"]["protocolVersion"] == version);
    }
}

TEST_CASE_METHOD(ServerFixture, "MCPInitialize - Unsupported version",
                 "[mcp][initialize][catch2]") {
    SECTION("lenient mode falls back to the latest version") {
        startServer();
        auto mr = server->testHandleRequest(initializeRequest(clientParams("1999-01-01")));
        REQUIRE(mr);
        CHECK(mr.value()["result"]["protocolVersion"] ==
              std::string(protocol::LATEST_PROTOCOL_VERSION));
    }

    SECTION("strict mode rejects with the supported list") {
        ServerOptions opts;
        opts.strictProtocol = true;
        startServer(opts);
        auto mr = server->testHandleRequest(initializeRequest(clientParams("1999-01-01")));
        REQUIRE(mr);
        const auto& response = mr.value();
        REQUIRE(response.contains("error"));
        CHECK_FALSE(response.contains("result"));
        CHECK(response["id"] == 1);
        CHECK(response["error"]["code"] == protocol::UNSUPPORTED_PROTOCOL_VERSION);
        CHECK(response["error"]["data"]["requested"] == "1999-01-01");
        CHECK(response["error"]["data"]["supportedVersions"].size() ==
              MCPServer::supportedProtocolVersions().size());
        CHECK(server->testNegotiatedVersion().empty());
    }
}

TEST_CASE("MCPInitialize - Capabilities follow the dispatcher configuration",
          "[mcp][initialize][catch2]") {
    govcat::mcp::DispatcherOptions dopts;
    dopts.mutationEnabled = true;
    dopts.validationBackend = govcat::config::ValidationBackend::SchemaRule;
    ServerFixture fx(dopts);
    ServerOptions opts;
    opts.name = "govcat-test";
    opts.version = "0.0.1";
    fx.startServer(opts);

    auto mr = fx.server->testHandleRequest(initializeRequest(json::object()));
    REQUIRE(mr);
    const auto& result = mr.value()["result"];
    CHECK(result["serverInfo"]["name"] == "govcat-test");
    CHECK(result["serverInfo"]["version"] == "0.0.1");
    CHECK(result["capabilities"]["experimental"]["mutationEnabled"] == true);
    CHECK(result["capabilities"]["experimental"]["validationBackend"] == "schema");
}
