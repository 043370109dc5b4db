#include <spdlog/spdlog.h>
#include <atomic>
#include <csignal>
#include <cstring>
#include <iostream>
#include <govcat/cli/govcat_cli.h>
#include <govcat/mcp/dispatcher.h>
#include <govcat/mcp/handlers.h>
#include <govcat/mcp/mcp_server.h>
#ifndef _WIN32
#include <unistd.h>
#endif

namespace govcat::cli {

static std::atomic<bool> g_shutdown{false};

class ServeCommand : public ICommand {
public:
    std::string getName() const override { return "serve"; }

    std::string getDescription() const override {
        return "Serve the catalog over JSON-RPC on stdin/stdout";
    }

    void registerCommand(CLI::App& app, GovcatCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("serve", getDescription());
        cmd->add_flag("--enable-mutation", enableMutation_,
                      "Allow add/import/remove/groom and other writes");
        cmd->add_option("--validation-backend", validationBackend_,
                        "Parameter validator: declarative or schema");
        cmd->add_flag("--strict-protocol", strictProtocol_,
                      "Reject unsupported protocol versions during initialize");
        cmd->add_flag("--handshake-trace", handshakeTrace_,
                      "Log handshake transitions at info level");

        cmd->callback([this]() {
            auto result = execute();
            if (!result) {
                spdlog::error("Command failed: {}", result.error().message);
                throw CLI::RuntimeError(1);
            }
        });
    }

    Result<void> execute() override {
        try {
            if (enableMutation_) {
                cli_->overrides().mutationEnabled = true;
            }
            if (!validationBackend_.empty()) {
                cli_->overrides().validationBackend = validationBackend_;
            }
            auto cfgResult = cli_->loadConfig();
            if (!cfgResult) {
                return cfgResult.error();
            }
            auto cfg = cfgResult.value();
            if (strictProtocol_) {
                cfg.strictProtocol = true;
            }
            if (handshakeTrace_) {
                cfg.handshakeTrace = true;
            }

            // Prevent abrupt termination on broken pipe when client disconnects early
#ifndef _WIN32
            std::signal(SIGPIPE, SIG_IGN);

            struct sigaction sa;
            std::memset(&sa, 0, sizeof(sa));
            sa.sa_handler = [](int) {
                g_shutdown = true;
                if (std::cin.fail())
                    std::cin.clear();
            };
            sa.sa_flags = 0;
            if (sigaction(SIGINT, &sa, nullptr) == -1)
                spdlog::warn("Failed to install SIGINT handler");
            if (sigaction(SIGTERM, &sa, nullptr) == -1)
                spdlog::warn("Failed to install SIGTERM handler");
#endif

            return runStdioServer(cfg);
        } catch (const std::exception& e) {
            return Error{ErrorCode::Unknown, std::string("Server error: ") + e.what()};
        }
    }

private:
    Result<void> runStdioServer(const config::ServerConfig& cfg) {
        auto runtime = cli_->openCatalog(cfg, true);
        if (!runtime) {
            return runtime.error();
        }
        auto& engine = *runtime.value().engine;

        // Materialize once so a broken directory is reported before the first request
        if (auto loaded = engine.ensureLoaded(); !loaded) {
            spdlog::warn("Catalog not loaded at startup: {}", loaded.error().message);
        }

        mcp::DispatcherOptions dopts;
        dopts.mutationEnabled = cfg.mutationEnabled;
        dopts.validationBackend = cfg.validationBackend;
        mcp::Dispatcher dispatcher(dopts);
        mcp::registerCatalogHandlers(dispatcher, engine);

        mcp::ServerOptions sopts;
        sopts.strictProtocol = cfg.strictProtocol;
        sopts.handshakeTrace = cfg.handshakeTrace;
        sopts.readyRetry = cfg.readyRetry;
        sopts.workerThreads = cfg.effectiveWorkerThreads();

        auto transport = std::make_unique<mcp::StdioTransport>();
        transport->setShutdownFlag(&g_shutdown);
        mcp::MCPServer server(std::move(transport), dispatcher, cli_->executor(), sopts,
                              &g_shutdown);

        mcp::ServiceHandlerEnv env;
        env.handshakeDiagnostics = [&server] { return server.handshakeDiagnostics(); };
        mcp::registerServiceHandlers(dispatcher, std::move(env));

        spdlog::info("govcat serving {} (mutation {}, validation {})",
                     cfg.instructionsDir.string(), cfg.mutationEnabled ? "enabled" : "disabled",
                     config::to_string(cfg.validationBackend));
        server.start();

        if (auto flushed = engine.flushUsage(); !flushed) {
            spdlog::error("Usage snapshot flush failed: {}", flushed.error().message);
        }
        spdlog::info("MCP stdio server stopped");
        return {};
    }

    GovcatCLI* cli_ = nullptr;

    bool enableMutation_ = false;
    std::string validationBackend_;
    bool strictProtocol_ = false;
    bool handshakeTrace_ = false;
};

std::unique_ptr<ICommand> createServeCommand() {
    return std::make_unique<ServeCommand>();
}

} // namespace govcat::cli
