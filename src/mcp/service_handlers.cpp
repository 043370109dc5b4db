#include <govcat/core/clock.h>
#include <govcat/mcp/handlers.h>
#include <govcat/mcp/tool_registry.h>
#include <govcat/version.hpp>

#include <spdlog/spdlog.h>

namespace govcat::mcp {

void registerServiceHandlers(Dispatcher& dispatcher, ServiceHandlerEnv env) {
    dispatcher.registerHandler("health/check", [](const json&, const CallContext&) {
        return json{{"status", "ok"},
                    {"timestamp", toIso8601(std::chrono::system_clock::now())},
                    {"version", kVersion}};
    });

    dispatcher.registerHandler("meta/tools",
                               [](const json&, const CallContext&) { return registryToJson(); });

    dispatcher.registerHandler("metrics/snapshot", [&dispatcher](const json&, const CallContext&) {
        return dispatcher.metricsSnapshot();
    });

    dispatcher.registerHandler("batch", [&dispatcher](const json& p, const CallContext&) {
        auto results = dispatcher.runBatch(p.value("ops", json::array()));
        return json{{"count", results.size()}, {"results", std::move(results)}};
    });

    dispatcher.registerHandler(
        "diagnostics/handshake",
        [source = std::move(env.handshakeDiagnostics)](const json&, const CallContext&) {
            if (!source) {
                return json{{"available", false}};
            }
            json out = source();
            out["available"] = true;
            return out;
        });

    spdlog::debug("Registered service handlers");
}

} // namespace govcat::mcp
