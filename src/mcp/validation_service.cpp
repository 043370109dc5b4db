#include <govcat/mcp/tool_registry.h>
#include <govcat/mcp/validation.h>

#include <spdlog/spdlog.h>

namespace govcat::mcp {

ValidationService::ValidationService(config::ValidationBackend backend) : backend_(backend) {
    spdlog::debug("Validation backend: {}", config::to_string(backend_));
}

const IValidator* ValidationService::validatorFor(std::string_view method) {
    std::lock_guard<std::mutex> lock(cacheMutex_);
    auto it = cache_.find(std::string(method));
    if (it != cache_.end()) {
        return it->second.get();
    }
    std::unique_ptr<IValidator> compiled;
    if (const auto* tool = findTool(method); tool && tool->inputSchema.is_object()) {
        compiled = backend_ == config::ValidationBackend::SchemaRule
                       ? makeSchemaRuleValidator(tool->inputSchema)
                       : makeDeclarativeValidator(tool->inputSchema);
    }
    auto [pos, _] = cache_.emplace(std::string(method), std::move(compiled));
    return pos->second.get();
}

ValidationOutcome ValidationService::validate(std::string_view method, const json& params) {
    const auto* validator = validatorFor(method);
    if (!validator) {
        unvalidated_.fetch_add(1, std::memory_order_relaxed);
        ValidationOutcome ok;
        ok.backend = "none";
        return ok;
    }

    // Absent params validate as an empty object
    auto outcome = validator->validate(params.is_null() ? json::object() : params);

    const bool schemaRule = backend_ == config::ValidationBackend::SchemaRule;
    (schemaRule ? schemaCalls_ : declarativeCalls_).fetch_add(1, std::memory_order_relaxed);
    if (!outcome.ok) {
        (schemaRule ? schemaFailures_ : declarativeFailures_)
            .fetch_add(1, std::memory_order_relaxed);
        spdlog::debug("Validation failed for {} ({}): {} issue(s)", method, outcome.backend,
                      outcome.errors.size());
    }
    return outcome;
}

ValidationMetrics ValidationService::metrics() const {
    ValidationMetrics m;
    m.backend = config::to_string(backend_);
    m.declarativeCalls = declarativeCalls_.load();
    m.declarativeFailures = declarativeFailures_.load();
    m.schemaCalls = schemaCalls_.load();
    m.schemaFailures = schemaFailures_.load();
    m.unvalidated = unvalidated_.load();
    {
        std::lock_guard<std::mutex> lock(cacheMutex_);
        m.cachedValidators = cache_.size();
    }
    return m;
}

void ValidationService::clearCache() {
    std::lock_guard<std::mutex> lock(cacheMutex_);
    cache_.clear();
}

} // namespace govcat::mcp
