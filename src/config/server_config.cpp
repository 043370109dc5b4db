#include <govcat/config/config_helpers.h>
#include <govcat/config/server_config.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <thread>

namespace govcat::config {

namespace {

// env first, then the [server] table of the config file
std::optional<std::string> lookup(const char* envName, const std::filesystem::path& configPath,
                                  const char* tomlKey) {
    if (auto env = env_value(envName)) {
        return env;
    }
    if (!configPath.empty()) {
        std::error_code ec;
        if (std::filesystem::exists(configPath, ec)) {
            auto v = parse_config_value(configPath, "server", tomlKey);
            if (!v.empty()) {
                return v;
            }
        }
    }
    return std::nullopt;
}

void applyBool(bool& target, const std::optional<std::string>& raw, const char* name) {
    if (!raw) {
        return;
    }
    if (auto b = parse_bool(*raw)) {
        target = *b;
    } else {
        spdlog::warn("Ignoring non-boolean value '{}' for {}", *raw, name);
    }
}

void applyMs(std::chrono::milliseconds& target, const std::optional<std::string>& raw,
             long minimum) {
    if (!raw) {
        return;
    }
    auto ms = parse_ms(*raw);
    if (ms.count() >= minimum) {
        target = ms;
    }
}

} // namespace

const char* to_string(ValidationBackend backend) noexcept {
    switch (backend) {
        case ValidationBackend::Declarative:
            return "declarative";
        case ValidationBackend::SchemaRule:
            return "schema";
    }
    return "declarative";
}

Result<ValidationBackend> parse_validation_backend(std::string_view raw) {
    std::string v(raw);
    trim(v);
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "declarative" || v == "typed") {
        return ValidationBackend::Declarative;
    }
    if (v == "schema" || v == "schema-rule") {
        return ValidationBackend::SchemaRule;
    }
    return Error{ErrorCode::InvalidArgument, "Unknown validation backend: " + std::string(raw)};
}

void ServerConfig::resolvePaths() {
    if (dataDir.empty()) {
        dataDir = get_data_dir();
    }
    if (instructionsDir.empty()) {
        instructionsDir = dataDir / "instructions";
    }
    if (usageSnapshotPath.empty()) {
        usageSnapshotPath = dataDir / "usage-snapshot.json";
    }
    if (catalogSnapshotPath.empty()) {
        catalogSnapshotPath = dataDir / "catalog-snapshot.json";
    }
    if (!auditLogEnabled) {
        auditLogPath.clear();
    } else if (auditLogPath.empty()) {
        auditLogPath = dataDir / "logs" / "instruction-transactions.log.jsonl";
    }
}

std::size_t ServerConfig::effectiveWorkerThreads() const {
    if (workerThreads > 0) {
        return workerThreads;
    }
    unsigned hw = std::thread::hardware_concurrency();
    return std::clamp<std::size_t>(hw ? (hw / 4u) : 2u, 2u, 8u);
}

Result<ServerConfig> loadServerConfig(const ConfigOverrides& overrides) {
    ServerConfig cfg;
    const auto configPath = get_config_path(overrides.configPath);
    if (!overrides.configPath.empty() && !std::filesystem::exists(configPath)) {
        return Error{ErrorCode::NotFound, "Config file not found: " + configPath.string()};
    }

    if (!overrides.dataDir.empty()) {
        cfg.dataDir = expand_tilde(overrides.dataDir);
    } else if (auto v = lookup("GOVCAT_DATA_DIR", configPath, "data_dir")) {
        cfg.dataDir = expand_tilde(*v);
    }
    if (!overrides.instructionsDir.empty()) {
        cfg.instructionsDir = expand_tilde(overrides.instructionsDir);
    } else if (auto v = lookup("GOVCAT_INSTRUCTIONS_DIR", configPath, "instructions_dir")) {
        cfg.instructionsDir = expand_tilde(*v);
    }
    if (auto v = lookup("GOVCAT_USAGE_SNAPSHOT", configPath, "usage_snapshot")) {
        cfg.usageSnapshotPath = expand_tilde(*v);
    }

    // A boolean switches the log off or back to its default path; anything else is a path
    if (auto v = lookup("GOVCAT_AUDIT_LOG", configPath, "audit_log")) {
        if (auto b = parse_bool(*v)) {
            cfg.auditLogEnabled = *b;
        } else if (*v == "none" || *v == "disabled") {
            cfg.auditLogEnabled = false;
        } else if (*v != "default") {
            cfg.auditLogPath = expand_tilde(*v);
        }
    }

    applyBool(cfg.mutationEnabled, lookup("GOVCAT_ENABLE_MUTATION", configPath, "enable_mutation"),
              "enable_mutation");
    if (overrides.mutationEnabled) {
        cfg.mutationEnabled = *overrides.mutationEnabled;
    }

    std::optional<std::string> backend;
    if (!overrides.validationBackend.empty()) {
        backend = overrides.validationBackend;
    } else {
        backend = lookup("GOVCAT_VALIDATION_BACKEND", configPath, "validation_backend");
    }
    if (backend) {
        auto parsed = parse_validation_backend(*backend);
        if (!parsed) {
            return parsed.error();
        }
        cfg.validationBackend = parsed.value();
    }

    if (auto v = lookup("GOVCAT_WORKER_THREADS", configPath, "worker_threads")) {
        try {
            cfg.workerThreads = static_cast<std::size_t>(std::max(0, std::stoi(*v)));
        } catch (const std::exception&) {
            spdlog::warn("Ignoring invalid worker_threads value '{}'", *v);
        }
    }
    applyBool(cfg.handshakeTrace, lookup("GOVCAT_HANDSHAKE_TRACE", configPath, "handshake_trace"),
              "handshake_trace");
    applyBool(cfg.strictProtocol, lookup("GOVCAT_STRICT_PROTOCOL", configPath, "strict_protocol"),
              "strict_protocol");
    applyMs(cfg.readyRetry, lookup("GOVCAT_READY_RETRY_MS", configPath, "ready_retry_ms"), 0);
    applyMs(cfg.usageFlushDebounce, lookup("GOVCAT_USAGE_FLUSH_MS", configPath, "usage_flush_ms"),
            1);
    if (auto v = lookup("GOVCAT_USAGE_RATE_LIMIT", configPath, "usage_rate_limit")) {
        try {
            cfg.rateLimitPerWindow = static_cast<std::size_t>(std::max(1, std::stoi(*v)));
        } catch (const std::exception&) {
            spdlog::warn("Ignoring invalid usage_rate_limit value '{}'", *v);
        }
    }
    applyMs(cfg.rateLimitWindow, lookup("GOVCAT_USAGE_RATE_WINDOW_MS", configPath,
                                        "usage_rate_window_ms"),
            1);

    if (!overrides.logLevel.empty()) {
        cfg.logLevel = overrides.logLevel;
    } else if (auto v = lookup("GOVCAT_LOG_LEVEL", configPath, "log_level")) {
        cfg.logLevel = *v;
    }

    cfg.resolvePaths();
    return cfg;
}

} // namespace govcat::config
