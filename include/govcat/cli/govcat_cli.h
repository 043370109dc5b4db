#pragma once

#include <boost/asio/any_io_executor.hpp>

#include <memory>
#include <string>
#include <vector>
#include <govcat/catalog/catalog_engine.h>
#include <govcat/cli/command.h>
#include <govcat/config/server_config.h>
#include <govcat/storage/content_store.h>

namespace govcat::cli {

// Store and engine opened from one resolved configuration
struct CatalogRuntime {
    std::shared_ptr<storage::FileContentStore> store;
    std::unique_ptr<catalog::CatalogEngine> engine;
};

class GovcatCLI {
public:
    explicit GovcatCLI(boost::asio::any_io_executor executor);
    ~GovcatCLI();

    /**
     * Run the CLI with given arguments; returns the process exit code
     */
    int run(int argc, char* argv[]);

    void registerCommand(std::unique_ptr<ICommand> command);

    // Global options (--config, --data-dir, --log-level) plus per-command overrides
    config::ConfigOverrides& overrides() { return overrides_; }

    // Resolve the configuration and install the stderr logger at its level
    Result<config::ServerConfig> loadConfig();

    Result<CatalogRuntime> openCatalog(const config::ServerConfig& cfg, bool withExecutor) const;

    boost::asio::any_io_executor executor() const { return executor_; }

    // Exit code a command asks for after a successful run (verify with issues)
    void setExitCode(int code) { exitCode_ = code; }

private:
    boost::asio::any_io_executor executor_;
    std::unique_ptr<CLI::App> app_;
    std::vector<std::unique_ptr<ICommand>> commands_;
    config::ConfigOverrides overrides_;
    int exitCode_ = 0;
};

// Dedicated stderr color logger named "govcat" installed as the default logger
void configureLogging(const std::string& level);

} // namespace govcat::cli
