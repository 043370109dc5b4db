#pragma once

#include <memory>
#include <string>
#include <CLI/CLI.hpp>
#include <govcat/core/types.h>

namespace govcat::cli {

class GovcatCLI;

/**
 * Base interface for CLI commands
 */
class ICommand {
public:
    virtual ~ICommand() = default;

    /**
     * Get the command name (e.g., "serve", "verify")
     */
    virtual std::string getName() const = 0;

    /**
     * Get the command description for help text
     */
    virtual std::string getDescription() const = 0;

    /**
     * Register this command with the CLI11 app
     */
    virtual void registerCommand(CLI::App& app, GovcatCLI* cli) = 0;

    /**
     * Execute the command
     */
    virtual Result<void> execute() = 0;
};

std::unique_ptr<ICommand> createServeCommand();
std::unique_ptr<ICommand> createVerifyCommand();
std::unique_ptr<ICommand> createGroomCommand();

} // namespace govcat::cli
