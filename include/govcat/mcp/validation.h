#pragma once

#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
#include <govcat/config/server_config.h>

namespace govcat::mcp {

using json = nlohmann::json;

struct ValidationIssue {
    std::string path; // JSON pointer into params, "" for the root
    std::string rule; // schema keyword that failed
    std::string message;

    json toJson() const { return json{{"path", path}, {"rule", rule}, {"message", message}}; }
};

struct ValidationOutcome {
    bool ok = true;
    std::vector<ValidationIssue> errors;
    const char* backend = "";
};

// Supported keywords: type, required, enum, properties, additionalProperties,
// items, minimum, maximum, minItems, maxItems, maxLength
class IValidator {
public:
    virtual ~IValidator() = default;
    virtual const char* name() const noexcept = 0;
    virtual ValidationOutcome validate(const json& params) const = 0;
};

// Compiles the schema into a shape tree once; reports every violation
std::unique_ptr<IValidator> makeDeclarativeValidator(const json& schema);
// Walks the schema keywords on each call; stops at the first violation
std::unique_ptr<IValidator> makeSchemaRuleValidator(const json& schema);

// JSON Schema primitive type test shared by both backends
bool jsonMatchesType(const json& value, std::string_view type);

struct ValidationMetrics {
    std::string backend;
    uint64_t declarativeCalls = 0;
    uint64_t declarativeFailures = 0;
    uint64_t schemaCalls = 0;
    uint64_t schemaFailures = 0;
    uint64_t unvalidated = 0;
    std::size_t cachedValidators = 0;
};

/**
 * Per-method parameter validation against the tool registry's input
 * schemas. One backend is active per process. Methods without a declared
 * schema pass. Never throws.
 */
class ValidationService {
public:
    explicit ValidationService(
        config::ValidationBackend backend = config::ValidationBackend::Declarative);

    ValidationOutcome validate(std::string_view method, const json& params);

    config::ValidationBackend backend() const noexcept { return backend_; }
    ValidationMetrics metrics() const;
    void clearCache();

private:
    const IValidator* validatorFor(std::string_view method);

    config::ValidationBackend backend_;

    mutable std::mutex cacheMutex_;
    // nullptr marks a method without a schema
    std::unordered_map<std::string, std::unique_ptr<IValidator>> cache_;

    std::atomic<uint64_t> declarativeCalls_{0};
    std::atomic<uint64_t> declarativeFailures_{0};
    std::atomic<uint64_t> schemaCalls_{0};
    std::atomic<uint64_t> schemaFailures_{0};
    std::atomic<uint64_t> unvalidated_{0};
};

} // namespace govcat::mcp
