#pragma once

#include <nlohmann/json.hpp>

#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>
#include <govcat/core/types.h>

namespace govcat::mcp {

using json = nlohmann::json;

template <typename T> using MCPResult = Result<T>;

using MessageResult = MCPResult<json>;

// Transport state management with atomic operations
enum class TransportState : int {
    Disconnected = 0,
    Connecting = 1,
    Connected = 2,
    Error = 3,
    Closing = 4
};

namespace protocol {
constexpr std::string_view JSONRPC_VERSION = "2.0";
constexpr std::string_view METHOD_INITIALIZE = "initialize";
constexpr std::string_view METHOD_INITIALIZED = "notifications/initialized";
constexpr std::string_view METHOD_CANCELLED = "notifications/cancelled";
constexpr std::string_view METHOD_PING = "ping";
constexpr std::string_view METHOD_SHUTDOWN = "shutdown";
constexpr std::string_view METHOD_EXIT = "exit";
constexpr std::string_view METHOD_TOOLS_LIST = "tools/list";
constexpr std::string_view METHOD_TOOLS_CALL = "tools/call";
constexpr std::string_view METHOD_SET_LOG_LEVEL = "logging/setLevel";
constexpr std::string_view NOTIFY_READY = "server/ready";
constexpr std::string_view NOTIFY_TOOLS_LIST_CHANGED = "notifications/tools/list_changed";

constexpr std::string_view LATEST_PROTOCOL_VERSION = "2025-06-18";

// Error codes from JSON-RPC 2.0 specification
constexpr int PARSE_ERROR = -32700;
constexpr int INVALID_REQUEST = -32600;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INVALID_PARAMS = -32602;
constexpr int INTERNAL_ERROR = -32603;

// Server specific codes
constexpr int NOT_FOUND = -32004;
constexpr int CONFLICT = -32009;
constexpr int MUTATION_DISABLED = -32010;
constexpr int INTEGRITY_ERROR = -32011;
constexpr int WRITE_FAILURE = -32012;
constexpr int UNSUPPORTED_PROTOCOL_VERSION = -32901;
} // namespace protocol

/**
 * Error raised by RPC handlers. Carries a JSON-RPC code and a data object
 * that the dispatcher returns to the client unchanged (plus data.method).
 */
class RpcError : public std::runtime_error {
public:
    RpcError(int code, const std::string& message, json data = json::object());

    int code() const noexcept { return code_; }
    const json& data() const noexcept { return data_; }

    // {code, message, data}
    json toJson() const;

private:
    int code_;
    json data_;
};

// Map an internal ErrorCode to its JSON-RPC code
int rpcCodeFor(ErrorCode code) noexcept;

// Rank used when several codes compete; 0 means the code is not one of ours
int codeSpecificity(int code) noexcept;

// Throw the RpcError matching a Result error
[[noreturn]] void throwRpcError(const Error& error, json data = json::object());

struct NormalizedError {
    int code = protocol::INTERNAL_ERROR;
    std::string message;
    json data = json::object();

    json toJson() const;
};

// Search an error and everything nested in it (std::nested_exception chains,
// data.cause / data.error / data.inner) for the most specific known code.
// Equal rank resolves to the innermost occurrence. Always stamps data.method.
NormalizedError deepUnwrap(std::exception_ptr error, std::string_view method);
NormalizedError deepUnwrap(const json& error, std::string_view method);

// JSON parsing utilities with error handling
namespace json_utils {
// Safe JSON parsing without exceptions
inline MCPResult<json> parse_json(std::string_view input) noexcept {
    if (input.empty()) {
        return Error{ErrorCode::InvalidData, "Empty input string for JSON parsing"};
    }

    try {
        auto result = json::parse(input);
        return result;
    } catch (const json::parse_error& e) {
        return Error{ErrorCode::InvalidData, std::string("JSON parse error: ") + e.what() +
                                                 " at position " + std::to_string(e.byte)};
    } catch (const std::exception& e) {
        return Error{ErrorCode::InvalidData, std::string("JSON parsing failed: ") + e.what()};
    }
}

// Validate JSON-RPC message structure
inline MCPResult<json> validate_jsonrpc_message(const json& msg) noexcept {
    if (!msg.is_object()) {
        return Error{ErrorCode::InvalidData, "Message must be a JSON object"};
    }

    if (!msg.contains("jsonrpc")) {
        return Error{ErrorCode::InvalidData, "Missing 'jsonrpc' field"};
    }

    const auto& version = msg["jsonrpc"];
    if (!version.is_string() || version.get<std::string>() != protocol::JSONRPC_VERSION) {
        return Error{ErrorCode::InvalidData, "Invalid or missing jsonrpc version"};
    }

    if (msg.contains("method") && !msg["method"].is_string()) {
        return Error{ErrorCode::InvalidData, "Field 'method' must be a string"};
    }

    return msg;
}

// Safe JSON field access
template <typename T>
MCPResult<T> get_field(const json& obj, std::string_view field_name) noexcept {
    try {
        if (!obj.contains(field_name)) {
            return Error{ErrorCode::InvalidData,
                         std::string("Missing required field: ") + std::string(field_name)};
        }
        return obj[field_name].get<T>();
    } catch (const std::exception& e) {
        return Error{ErrorCode::InvalidData,
                     std::string("Invalid field '") + std::string(field_name) + "': " + e.what()};
    }
}
} // namespace json_utils

} // namespace govcat::mcp
