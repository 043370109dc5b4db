#include <spdlog/spdlog.h>
#include <iostream>
#include <govcat/cli/govcat_cli.h>
#include <govcat/mcp/dispatcher.h>
#include <govcat/mcp/handlers.h>

namespace govcat::cli {

class VerifyCommand : public ICommand {
public:
    std::string getName() const override { return "verify"; }

    std::string getDescription() const override {
        return "Recompute every entry hash and report mismatches (exit 1 on issues)";
    }

    void registerCommand(CLI::App& app, GovcatCLI* cli) override {
        cli_ = cli;
        auto* cmd = app.add_subcommand("verify", getDescription());
        cmd->add_flag("--compact", compact_, "Print the report on one line");
        cmd->callback([this]() {
            auto result = execute();
            if (!result) {
                spdlog::error("Command failed: {}", result.error().message);
                throw CLI::RuntimeError(1);
            }
        });
    }

    Result<void> execute() override {
        auto cfg = cli_->loadConfig();
        if (!cfg) {
            return cfg.error();
        }
        auto runtime = cli_->openCatalog(cfg.value(), false);
        if (!runtime) {
            return runtime.error();
        }

        mcp::Dispatcher dispatcher;
        mcp::registerCatalogHandlers(dispatcher, *runtime.value().engine);
        auto response = dispatcher.dispatch("integrity/verify", nlohmann::json::object());
        if (!response.ok()) {
            return Error{ErrorCode::InternalError, response.error->value("message", "verify failed")};
        }

        std::cout << response.result.dump(compact_ ? -1 : 2) << std::endl;
        const auto issues = response.result.value("issueCount", std::size_t{0});
        if (issues > 0) {
            spdlog::warn("{} integrity issue(s) found", issues);
            cli_->setExitCode(1);
        }
        return {};
    }

private:
    GovcatCLI* cli_ = nullptr;
    bool compact_ = false;
};

std::unique_ptr<ICommand> createVerifyCommand() {
    return std::make_unique<VerifyCommand>();
}

} // namespace govcat::cli
