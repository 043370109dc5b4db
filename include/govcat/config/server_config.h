#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <govcat/core/types.h>

namespace govcat::config {

enum class ValidationBackend { Declarative, SchemaRule };

const char* to_string(ValidationBackend backend) noexcept;
Result<ValidationBackend> parse_validation_backend(std::string_view raw);

struct ServerConfig {
    std::filesystem::path dataDir;
    std::filesystem::path instructionsDir;
    std::filesystem::path usageSnapshotPath;
    std::filesystem::path catalogSnapshotPath;
    // Mutation audit log (JSONL); disabled when auditLogEnabled is false
    std::filesystem::path auditLogPath;
    bool auditLogEnabled = true;

    bool mutationEnabled = false;
    ValidationBackend validationBackend = ValidationBackend::Declarative;
    std::size_t workerThreads = 0; // 0 => size from hardware
    bool handshakeTrace = false;
    bool strictProtocol = false;
    // Diagnostic readiness retry; never bypasses the flush gate. 0 disables.
    std::chrono::milliseconds readyRetry{0};

    std::chrono::milliseconds usageFlushDebounce{500};
    std::size_t rateLimitPerWindow = 10;
    std::chrono::milliseconds rateLimitWindow{1000};

    std::string logLevel;

    // Fill any path left empty from dataDir
    void resolvePaths();
    std::size_t effectiveWorkerThreads() const;
};

// Command line values that take precedence over environment and file
struct ConfigOverrides {
    std::string configPath;
    std::string dataDir;
    std::string instructionsDir;
    std::optional<bool> mutationEnabled;
    std::string validationBackend;
    std::string logLevel;
};

// Precedence: overrides > GOVCAT_* environment > config.toml [server] > defaults
Result<ServerConfig> loadServerConfig(const ConfigOverrides& overrides = {});

} // namespace govcat::config
