#include <govcat/cli/govcat_cli.h>
#include <govcat/core/clock.h>
#include <govcat/version.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <iostream>
#include <unistd.h>

namespace govcat::cli {

void configureLogging(const std::string& level) {
    // stdout carries protocol frames and reports; logs go to stderr only
    auto logger = spdlog::get("govcat");
    if (!logger) {
        auto stderr_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        logger = std::make_shared<spdlog::logger>("govcat", stderr_sink);
        spdlog::register_logger(logger);
    }
    spdlog::set_default_logger(logger);

    spdlog::level::level_enum lvl =
        isatty(STDIN_FILENO) ? spdlog::level::info : spdlog::level::warn;
    if (!level.empty()) {
        auto parsed = spdlog::level::from_str(level);
        if (parsed == spdlog::level::off && level != "off") {
            spdlog::warn("Unknown log level '{}', keeping {}", level,
                         spdlog::level::to_string_view(lvl));
        } else {
            lvl = parsed;
        }
    }
    spdlog::set_level(lvl);
    spdlog::flush_on(spdlog::level::warn);
}

GovcatCLI::GovcatCLI(boost::asio::any_io_executor executor) : executor_(std::move(executor)) {
    spdlog::set_level(spdlog::level::warn);

    app_ = std::make_unique<CLI::App>("Governed instruction catalog", "govcat");
    app_->set_version_flag("--version", std::string(kVersion));
    app_->require_subcommand(1);
    app_->fallthrough(); // Global options may follow the subcommand

    app_->add_option("--config", overrides_.configPath, "Path to config.toml")
        ->envname("GOVCAT_CONFIG");
    app_->add_option("--data-dir", overrides_.dataDir, "Data directory");
    app_->add_option("--instructions-dir", overrides_.instructionsDir,
                     "Instruction documents directory (default <data-dir>/instructions)");
    app_->add_option("--log-level", overrides_.logLevel,
                     "Log level: trace, debug, info, warn, error, critical");

    registerCommand(createServeCommand());
    registerCommand(createVerifyCommand());
    registerCommand(createGroomCommand());
}

GovcatCLI::~GovcatCLI() = default;

void GovcatCLI::registerCommand(std::unique_ptr<ICommand> command) {
    command->registerCommand(*app_, this);
    commands_.push_back(std::move(command));
}

Result<config::ServerConfig> GovcatCLI::loadConfig() {
    auto cfg = config::loadServerConfig(overrides_);
    if (!cfg) {
        configureLogging(overrides_.logLevel);
        return cfg.error();
    }
    configureLogging(cfg.value().logLevel);
    spdlog::debug("Data directory: {}", cfg.value().dataDir.string());
    return cfg;
}

Result<CatalogRuntime> GovcatCLI::openCatalog(const config::ServerConfig& cfg,
                                              bool withExecutor) const {
    try {
        CatalogRuntime rt;
        auto clock = systemClock();
        auto store = std::make_shared<storage::FileContentStore>(
            storage::ContentStoreConfig{cfg.instructionsDir, clock});
        // Leftovers from a write interrupted in an earlier run
        if (auto cleaned = store->cleanupTempFiles(); !cleaned) {
            spdlog::warn("Temp file cleanup skipped: {}", cleaned.error().message);
        }
        rt.store = store;

        catalog::CatalogEngineConfig ec;
        ec.store = rt.store;
        ec.clock = clock;
        ec.catalogSnapshotPath = cfg.catalogSnapshotPath;
        ec.auditLogPath = cfg.auditLogPath;
        ec.usage.snapshotPath = cfg.usageSnapshotPath;
        ec.usage.clock = clock;
        ec.usage.perWindow = cfg.rateLimitPerWindow;
        ec.usage.window = cfg.rateLimitWindow;
        ec.usage.flushDebounce = cfg.usageFlushDebounce;

        std::optional<boost::asio::any_io_executor> executor;
        if (withExecutor) {
            executor = executor_;
        }
        rt.engine = std::make_unique<catalog::CatalogEngine>(std::move(ec), std::move(executor));
        return rt;
    } catch (const std::exception& e) {
        return Error{ErrorCode::InternalError, std::string("Failed to open catalog: ") + e.what()};
    }
}

int GovcatCLI::run(int argc, char* argv[]) {
    try {
        app_->parse(argc, argv);
        return exitCode_;
    } catch (const CLI::ParseError& e) {
        return app_->exit(e);
    } catch (const std::exception& e) {
        std::cerr << "[FAIL] Unexpected error: " << e.what() << "\n";
        spdlog::error("Unexpected error: {}", e.what());
        return 1;
    }
}

} // namespace govcat::cli
