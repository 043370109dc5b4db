#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
#include <govcat/config/server_config.h>
#include <govcat/mcp/error_handling.h>
#include <govcat/mcp/validation.h>

namespace govcat::mcp {

struct CallContext {
    std::string_view method;
    // Process-wide mutation switch at the time of the call
    bool mutationAllowed = false;
};

using Handler = std::function<json(const json& params, const CallContext& ctx)>;

struct HandlerOptions {
    // Run the handler even when mutation is disabled; it must not write unless
    // ctx.mutationAllowed is set and should fail with MutationDisabled instead
    bool noopWhenDisabled = false;
};

struct DispatcherOptions {
    bool mutationEnabled = false;
    config::ValidationBackend validationBackend = config::ValidationBackend::Declarative;
};

struct DispatchResponse {
    json result;
    std::optional<json> error; // {code, message, data}

    bool ok() const noexcept { return !error.has_value(); }
};

struct MethodStats {
    std::string method;
    uint64_t count = 0;
    uint64_t errors = 0;
    double totalMs = 0.0;
    double maxMs = 0.0;
};

/**
 * Routes a method to its handler through validation and the mutation gate,
 * and normalizes every failure into one JSON-RPC error object.
 *
 * Handlers are registered before the first dispatch and never afterwards.
 */
class Dispatcher {
public:
    explicit Dispatcher(DispatcherOptions options = {});

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    void registerHandler(std::string method, Handler handler, HandlerOptions options = {});
    bool hasHandler(std::string_view method) const;
    std::vector<std::string> methods() const;

    // Full pipeline; never throws
    DispatchResponse dispatch(std::string_view method, const json& params);

    // Same pipeline without normalization or metrics; failures propagate as exceptions
    json invoke(std::string_view method, const json& params);

    // ops: [{method, params}] -> [{result} | {error}] in order
    json runBatch(const json& ops);

    bool mutationEnabled() const noexcept { return options_.mutationEnabled; }
    ValidationService& validation() { return validation_; }

    std::vector<MethodStats> stats() const;
    // {generatedAt, methods:[{method, count, errors, avgMs, maxMs}], validation:{...}}
    json metricsSnapshot() const;

private:
    struct Registration {
        Handler handler;
        HandlerOptions options;
    };

    void record(std::string_view method, std::chrono::steady_clock::duration elapsed, bool failed);

    DispatcherOptions options_;
    ValidationService validation_;
    std::unordered_map<std::string, Registration> handlers_;

    mutable std::mutex statsMutex_;
    std::map<std::string, MethodStats, std::less<>> stats_;
};

} // namespace govcat::mcp
