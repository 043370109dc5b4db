#include <govcat/mcp/mcp_server.h>
#include <govcat/mcp/tool_registry.h>

#include <spdlog/spdlog.h>

namespace govcat::mcp {

namespace {

spdlog::level::level_enum parseMcpLogLevel(const std::string& level) {
    if (level == "trace")
        return spdlog::level::trace;
    if (level == "debug")
        return spdlog::level::debug;
    if (level == "info" || level == "notice")
        return spdlog::level::info;
    if (level == "warning" || level == "warn")
        return spdlog::level::warn;
    if (level == "error")
        return spdlog::level::err;
    if (level == "critical" || level == "alert" || level == "emergency")
        return spdlog::level::critical;
    return spdlog::level::info;
}

MessageResult notificationHandled() {
    return Error{ErrorCode::Success, "notification"};
}

} // namespace

MessageResult MCPServer::handleRequest(const json& request) {
    const auto id = request.value("id", json{});
    const bool isNotification = !request.contains("id");
    const std::string method = request.value("method", "");
    json params = request.value("params", json::object());
    if (params.is_null()) {
        params = json::object();
    }

    try {
        if (auto core = dispatchCoreMethod(id, method, params)) {
            return std::move(*core);
        }

        if (method.starts_with("notifications/")) {
            spdlog::debug("Ignoring notification '{}'", method);
            return notificationHandled();
        }

        if (isNotification) {
            if (!dispatcher_.hasHandler(method)) {
                spdlog::debug("Ignoring notification for unknown method '{}'", method);
                return notificationHandled();
            }
            // Runs for its side effects; there is no id to answer
            auto outcome = dispatcher_.dispatch(method, params);
            if (!outcome.ok()) {
                spdlog::debug("Notification '{}' failed: {}", method, outcome.error->dump());
            }
            return notificationHandled();
        }

        // Every registry method is also callable directly
        auto outcome = dispatcher_.dispatch(method, params);
        if (!outcome.ok()) {
            return json{{"jsonrpc", protocol::JSONRPC_VERSION},
                        {"id", id},
                        {"error", std::move(*outcome.error)}};
        }
        return createResponse(id, outcome.result);
    } catch (const RpcError& e) {
        json err = e.toJson();
        err["data"]["method"] = method;
        return json{{"jsonrpc", protocol::JSONRPC_VERSION}, {"id", id}, {"error", std::move(err)}};
    } catch (const json::exception& e) {
        return createError(id, protocol::INVALID_PARAMS, std::string("JSON error: ") + e.what(),
                           json{{"method", method}});
    } catch (const std::exception& e) {
        return createError(id, protocol::INTERNAL_ERROR,
                           std::string("Internal error: ") + e.what(), json{{"method", method}});
    }
}

std::optional<MessageResult>
MCPServer::dispatchCoreMethod(const json& id, const std::string& method, const json& params) {
    if (method == protocol::METHOD_INITIALIZE) {
        spdlog::debug("MCP handling initialize request with params: {}", params.dump());
        auto result = initialize(params);
        spdlog::debug("MCP initialize successful, protocol version: {}",
                      result.value("protocolVersion", "unknown"));
        return MessageResult{createResponse(id, result)};
    }

    if (method == protocol::METHOD_CANCELLED) {
        json cancelId;
        if (params.contains("requestId")) {
            cancelId = params["requestId"];
        } else if (params.contains("id")) {
            cancelId = params["id"];
        } else {
            spdlog::warn("notifications/cancelled missing id/requestId");
            return MessageResult{Error{ErrorCode::InvalidArgument, "Missing id/requestId"}};
        }
        cancelRequest(cancelId);
        return notificationHandled();
    }

    if (method == protocol::METHOD_INITIALIZED) {
        markClientInitialized();
        return notificationHandled();
    }

    if (method == protocol::METHOD_PING) {
        return MessageResult{createResponse(id, json::object())};
    }

    if (method == protocol::METHOD_SHUTDOWN) {
        spdlog::debug("Shutdown request received, preparing for exit");
        shutdownRequested_ = true;
        return MessageResult{createResponse(id, json::object())};
    }

    if (method == protocol::METHOD_EXIT) {
        spdlog::debug("Exit request received");
        if (externalShutdown_)
            externalShutdown_->store(true);
        running_ = false;
        return notificationHandled();
    }

    if (method == protocol::METHOD_TOOLS_LIST) {
        return MessageResult{createResponse(id, listToolsResult())};
    }

    if (method == protocol::METHOD_TOOLS_CALL) {
        const auto toolName = params.value("name", "");
        json toolArgs = params.value("arguments", json::object());
        if (toolArgs.is_null()) {
            toolArgs = json::object();
        }
        spdlog::debug("MCP tool call: '{}' with args: {}", toolName, toolArgs.dump());
        return MessageResult{callTool(toolName, toolArgs, id)};
    }

    if (method == protocol::METHOD_SET_LOG_LEVEL) {
        if (!params.contains("level") || !params["level"].is_string()) {
            return MessageResult{createError(id, protocol::INVALID_PARAMS,
                                             "logging/setLevel requires a string 'level'",
                                             json{{"method", method}})};
        }
        spdlog::set_level(parseMcpLogLevel(params["level"].get<std::string>()));
        return MessageResult{createResponse(id, json::object())};
    }

    return std::nullopt;
}

json MCPServer::callTool(const std::string& name, const json& arguments, const json& id) {
    if (name.empty()) {
        return createError(id, protocol::INVALID_PARAMS, "Missing tool name",
                           json{{"method", std::string(protocol::METHOD_TOOLS_CALL)}});
    }
    auto outcome = dispatcher_.dispatch(name, arguments);
    if (!outcome.ok()) {
        // The handler's own code is kept; MutationDisabled stays -32010
        return json{{"jsonrpc", protocol::JSONRPC_VERSION},
                    {"id", id},
                    {"error", std::move(*outcome.error)}};
    }
    return createResponse(id, wrapToolResult(outcome.result));
}

} // namespace govcat::mcp
