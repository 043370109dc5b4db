#include <govcat/core/clock.h>
#include <govcat/mcp/dispatcher.h>
#include <govcat/mcp/tool_registry.h>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace govcat::mcp {

Dispatcher::Dispatcher(DispatcherOptions options)
    : options_(options), validation_(options.validationBackend) {
    handlers_.reserve(48);
    spdlog::debug("Dispatcher created (mutation {})",
                  options_.mutationEnabled ? "enabled" : "disabled");
}

void Dispatcher::registerHandler(std::string method, Handler handler, HandlerOptions options) {
    auto [it, inserted] =
        handlers_.insert_or_assign(std::move(method), Registration{std::move(handler), options});
    if (!inserted) {
        spdlog::warn("Handler for '{}' replaced", it->first);
    }
}

bool Dispatcher::hasHandler(std::string_view method) const {
    return handlers_.find(std::string(method)) != handlers_.end();
}

std::vector<std::string> Dispatcher::methods() const {
    std::vector<std::string> out;
    out.reserve(handlers_.size());
    for (const auto& [name, _] : handlers_) {
        out.push_back(name);
    }
    std::sort(out.begin(), out.end());
    return out;
}

json Dispatcher::invoke(std::string_view method, const json& params) {
    auto it = handlers_.find(std::string(method));
    if (it == handlers_.end()) {
        throw RpcError(protocol::METHOD_NOT_FOUND, "Method not found: " + std::string(method),
                       json{{"method", std::string(method)}});
    }

    const json& effective = params.is_null() ? json::object() : params;
    auto outcome = validation_.validate(method, effective);
    if (!outcome.ok) {
        json errors = json::array();
        for (const auto& issue : outcome.errors) {
            errors.push_back(issue.toJson());
        }
        throw RpcError(protocol::INVALID_PARAMS, "Invalid params",
                       json{{"method", std::string(method)},
                            {"errors", std::move(errors)},
                            {"validator", outcome.backend}});
    }

    const auto* tool = findTool(method);
    if (tool && tool->mutation && !options_.mutationEnabled &&
        !it->second.options.noopWhenDisabled) {
        throw RpcError(protocol::MUTATION_DISABLED, "Mutation disabled",
                       json{{"method", std::string(method)},
                            {"hint", "start with --enable-mutation or GOVCAT_ENABLE_MUTATION=1"}});
    }

    CallContext ctx{method, options_.mutationEnabled};
    return it->second.handler(effective, ctx);
}

DispatchResponse Dispatcher::dispatch(std::string_view method, const json& params) {
    const auto start = std::chrono::steady_clock::now();
    DispatchResponse response;
    try {
        response.result = invoke(method, params);
    } catch (...) {
        auto normalized = deepUnwrap(std::current_exception(), method);
        if (normalized.code == protocol::INTERNAL_ERROR) {
            spdlog::error("{} failed: {}", method, normalized.message);
        } else {
            spdlog::debug("{} failed with {}: {}", method, normalized.code, normalized.message);
        }
        response.error = normalized.toJson();
    }
    record(method, std::chrono::steady_clock::now() - start, !response.ok());
    return response;
}

json Dispatcher::runBatch(const json& ops) {
    json results = json::array();
    if (!ops.is_array()) {
        return results;
    }
    for (const auto& op : ops) {
        if (!op.is_object() || !op.contains("method") || !op["method"].is_string()) {
            results.push_back(json{{"error",
                                    {{"code", protocol::INVALID_REQUEST},
                                     {"message", "Batch entry must name a method"},
                                     {"data", {{"method", "batch"}}}}}});
            continue;
        }
        const auto method = op["method"].get<std::string>();
        auto response = dispatch(method, op.value("params", json::object()));
        if (response.ok()) {
            results.push_back(json{{"result", std::move(response.result)}});
        } else {
            results.push_back(json{{"error", std::move(*response.error)}});
        }
    }
    return results;
}

void Dispatcher::record(std::string_view method, std::chrono::steady_clock::duration elapsed,
                        bool failed) {
    const double ms = std::chrono::duration<double, std::milli>(elapsed).count();
    std::lock_guard<std::mutex> lock(statsMutex_);
    auto it = stats_.find(method);
    if (it == stats_.end()) {
        it = stats_.emplace(std::string(method), MethodStats{std::string(method)}).first;
    }
    auto& s = it->second;
    ++s.count;
    if (failed) {
        ++s.errors;
    }
    s.totalMs += ms;
    s.maxMs = std::max(s.maxMs, ms);
}

std::vector<MethodStats> Dispatcher::stats() const {
    std::lock_guard<std::mutex> lock(statsMutex_);
    std::vector<MethodStats> out;
    out.reserve(stats_.size());
    for (const auto& [_, s] : stats_) {
        out.push_back(s);
    }
    return out;
}

json Dispatcher::metricsSnapshot() const {
    json methods = json::array();
    for (const auto& s : stats()) {
        methods.push_back({{"method", s.method},
                           {"count", s.count},
                           {"errors", s.errors},
                           {"avgMs", s.count ? s.totalMs / static_cast<double>(s.count) : 0.0},
                           {"maxMs", s.maxMs}});
    }
    const auto v = validation_.metrics();
    return json{{"generatedAt", toIso8601(std::chrono::system_clock::now())},
                {"methods", std::move(methods)},
                {"validation",
                 {{"backend", v.backend},
                  {"declarative",
                   {{"calls", v.declarativeCalls}, {"failures", v.declarativeFailures}}},
                  {"schema", {{"calls", v.schemaCalls}, {"failures", v.schemaFailures}}},
                  {"unvalidated", v.unvalidated},
                  {"cachedValidators", v.cachedValidators}}}};
}

} // namespace govcat::mcp
