// JSON-RPC envelope helpers and error normalization

#include <catch2/catch_test_macros.hpp>

#include <exception>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include <govcat/core/types.h>
#include <govcat/mcp/error_handling.h>

namespace {
using govcat::Error;
using govcat::ErrorCode;
using govcat::mcp::json;
using govcat::mcp::RpcError;
namespace protocol = govcat::mcp::protocol;

std::exception_ptr capture(auto&& thrower) {
    try {
        thrower();
    } catch (...) {
        return std::current_exception();
    }
    return nullptr;
}
} // namespace

TEST_CASE("MCP JsonUtils - parse_json handles empty input", "[mcp][json][error_handling][catch2]") {
    const auto r = govcat::mcp::json_utils::parse_json("");
    REQUIRE_FALSE(r);
    CHECK(r.error().code == ErrorCode::InvalidData);
    CHECK(r.error().message.find("Empty input") != std::string::npos);
}

TEST_CASE("MCP JsonUtils - parse_json reports parse errors",
          "[mcp][json][error_handling][catch2]") {
    const auto r = govcat::mcp::json_utils::parse_json("{");
    REQUIRE_FALSE(r);
    CHECK(r.error().code == ErrorCode::InvalidData);
    CHECK(r.error().message.find("JSON parse error:") != std::string::npos);
    CHECK(r.error().message.find("at position") != std::string::npos);
}

TEST_CASE("MCP JsonUtils - validate_jsonrpc_message rejects invalid envelopes",
          "[mcp][jsonrpc][error_handling][catch2]") {
    {
        const auto r = govcat::mcp::json_utils::validate_jsonrpc_message(json::array());
        REQUIRE_FALSE(r);
        CHECK(r.error().message.find("JSON object") != std::string::npos);
    }

    {
        const auto r = govcat::mcp::json_utils::validate_jsonrpc_message(json::object());
        REQUIRE_FALSE(r);
        CHECK(r.error().message.find("jsonrpc") != std::string::npos);
    }

    {
        json msg = {{"jsonrpc", "1.0"}};
        const auto r = govcat::mcp::json_utils::validate_jsonrpc_message(msg);
        REQUIRE_FALSE(r);
        CHECK(r.error().message.find("version") != std::string::npos);
    }

    {
        json msg = {{"jsonrpc", "2.0"}, {"method", 42}};
        const auto r = govcat::mcp::json_utils::validate_jsonrpc_message(msg);
        REQUIRE_FALSE(r);
        CHECK(r.error().message.find("method") != std::string::npos);
    }

    {
        json msg = {{"jsonrpc", "2.0"}, {"method", "ping"}, {"id", 1}};
        const auto r = govcat::mcp::json_utils::validate_jsonrpc_message(msg);
        REQUIRE(r);
        CHECK(r.value().at("method").get<std::string>() == "ping");
    }
}

TEST_CASE("MCP JsonUtils - get_field reports missing/wrong type",
          "[mcp][json][error_handling][catch2]") {
    json obj = {{"x", 5}, {"s", "text"}};
    REQUIRE(govcat::mcp::json_utils::get_field<int>(obj, "x").value() == 5);

    const auto missing = govcat::mcp::json_utils::get_field<int>(obj, "y");
    REQUIRE_FALSE(missing);
    CHECK(missing.error().message.find("Missing required field") != std::string::npos);

    const auto wrong = govcat::mcp::json_utils::get_field<int>(obj, "s");
    REQUIRE_FALSE(wrong);
    CHECK(wrong.error().message.find("Invalid field") != std::string::npos);
}

TEST_CASE("MCP ErrorMapping - result codes map to stable rpc codes",
          "[mcp][error_handling][mapping][catch2]") {
    CHECK(govcat::mcp::rpcCodeFor(ErrorCode::ValidationError) == protocol::INVALID_PARAMS);
    CHECK(govcat::mcp::rpcCodeFor(ErrorCode::InvalidArgument) == protocol::INVALID_PARAMS);
    CHECK(govcat::mcp::rpcCodeFor(ErrorCode::NotFound) == protocol::NOT_FOUND);
    CHECK(govcat::mcp::rpcCodeFor(ErrorCode::Conflict) == protocol::CONFLICT);
    CHECK(govcat::mcp::rpcCodeFor(ErrorCode::MutationDisabled) == protocol::MUTATION_DISABLED);
    CHECK(govcat::mcp::rpcCodeFor(ErrorCode::HashMismatch) == protocol::INTEGRITY_ERROR);
    CHECK(govcat::mcp::rpcCodeFor(ErrorCode::WriteError) == protocol::WRITE_FAILURE);
    CHECK(govcat::mcp::rpcCodeFor(ErrorCode::Timeout) == protocol::INTERNAL_ERROR);

    try {
        govcat::mcp::throwRpcError(Error{ErrorCode::NotFound, "no such entry"}, {{"id", "a"}});
        FAIL("throwRpcError returned");
    } catch (const RpcError& e) {
        CHECK(e.code() == protocol::NOT_FOUND);
        CHECK(std::string(e.what()) == "no such entry");
        CHECK(e.data()["id"] == "a");
        CHECK(e.data().contains("reason"));
    }
}

TEST_CASE("MCP DeepUnwrap - mutation disabled survives generic wrapping",
          "[mcp][error_handling][unwrap][catch2]") {
    auto ep = capture([] {
        try {
            throw RpcError(protocol::MUTATION_DISABLED, "Mutation disabled");
        } catch (...) {
            std::throw_with_nested(std::runtime_error("handler failed"));
        }
    });

    const auto n = govcat::mcp::deepUnwrap(ep, "instructions/add");
    CHECK(n.code == protocol::MUTATION_DISABLED);
    CHECK(n.message == "Mutation disabled");
    CHECK(n.data["method"] == "instructions/add");
}

TEST_CASE("MCP DeepUnwrap - most specific code wins across json nesting",
          "[mcp][error_handling][unwrap][catch2]") {
    json error = {{"code", protocol::INTERNAL_ERROR},
                  {"message", "wrapper"},
                  {"data",
                   {{"cause",
                     {{"code", protocol::NOT_FOUND},
                      {"message", "missing"},
                      {"data", {{"inner", {{"code", protocol::INVALID_PARAMS},
                                           {"message", "bad id"},
                                           {"data", {{"field", "id"}}}}}}}}}}}};

    const auto n = govcat::mcp::deepUnwrap(error, "instructions/get");
    CHECK(n.code == protocol::INVALID_PARAMS);
    CHECK(n.message == "bad id");
    CHECK(n.data["field"] == "id");
    CHECK(n.data["method"] == "instructions/get");
}

TEST_CASE("MCP DeepUnwrap - equal rank resolves to the innermost occurrence",
          "[mcp][error_handling][unwrap][catch2]") {
    json error = {{"code", protocol::NOT_FOUND},
                  {"message", "outer"},
                  {"error", {{"code", protocol::NOT_FOUND}, {"message", "inner"}}}};
    CHECK(govcat::mcp::deepUnwrap(error, "m").message == "inner");
}

TEST_CASE("MCP DeepUnwrap - plain and foreign failures become internal errors",
          "[mcp][error_handling][unwrap][catch2]") {
    SECTION("std::exception") {
        auto n = govcat::mcp::deepUnwrap(capture([] { throw std::logic_error("boom"); }), "m");
        CHECK(n.code == protocol::INTERNAL_ERROR);
        CHECK(n.message == "boom");
        CHECK(n.data["method"] == "m");
    }
    SECTION("unknown code keeps the original") {
        auto n = govcat::mcp::deepUnwrap(json{{"code", 4242}, {"message", "odd"}}, "m");
        CHECK(n.code == protocol::INTERNAL_ERROR);
        CHECK(n.data["originalCode"] == 4242);
    }
    SECTION("non-exception throw") {
        auto n = govcat::mcp::deepUnwrap(capture([] { throw 7; }), "m");
        CHECK(n.code == protocol::INTERNAL_ERROR);
        CHECK_FALSE(n.message.empty());
    }
}
