#include <spdlog/spdlog.h>
#include <iostream>
#include <govcat/cli/govcat_cli.h>
#include <govcat/mcp/dispatcher.h>
#include <govcat/mcp/handlers.h>

namespace govcat::cli {

class GroomCommand : public ICommand {
public:
    std::string getName() const override { return "groom"; }

    std::string getDescription() const override {
        return "Repair hashes, normalize categories and optionally prune the catalog";
    }

    void registerCommand(CLI::App& app, GovcatCLI* cli) override {
        cli_ = cli;
        auto* cmd = app.add_subcommand("groom", getDescription());
        auto* dry = cmd->add_flag("--dry-run", dryRun_, "Report what would change without writing");
        auto* apply = cmd->add_flag("--apply", apply_, "Write the changes");
        dry->excludes(apply);
        cmd->add_flag("--remove-deprecated", removeDeprecated_,
                      "Delete deprecated entries that are superseded");
        cmd->add_flag("--merge-duplicates", mergeDuplicates_,
                      "Merge entries whose bodies are identical");
        cmd->add_flag("--purge-legacy-scopes", purgeLegacyScopes_,
                      "Drop legacy scope:* category tokens");
        cmd->callback([this]() {
            auto result = execute();
            if (!result) {
                spdlog::error("Command failed: {}", result.error().message);
                throw CLI::RuntimeError(1);
            }
        });
    }

    Result<void> execute() override {
        if (!dryRun_ && !apply_) {
            return Error{ErrorCode::InvalidArgument, "Pass either --dry-run or --apply"};
        }
        auto cfg = cli_->loadConfig();
        if (!cfg) {
            return cfg.error();
        }
        auto runtime = cli_->openCatalog(cfg.value(), false);
        if (!runtime) {
            return runtime.error();
        }

        // Offline and explicitly requested: the mutation gate is open, dryRun keeps it read-only
        mcp::DispatcherOptions opts;
        opts.mutationEnabled = true;
        mcp::Dispatcher dispatcher(opts);
        mcp::registerCatalogHandlers(dispatcher, *runtime.value().engine);

        nlohmann::json params{{"mode",
                     {{"dryRun", !apply_},
                      {"removeDeprecated", removeDeprecated_},
                      {"mergeDuplicates", mergeDuplicates_},
                      {"purgeLegacyScopes", purgeLegacyScopes_}}}};
        auto response = dispatcher.dispatch("instructions/groom", params);
        if (!response.ok()) {
            return Error{ErrorCode::InternalError, response.error->value("message", "groom failed")};
        }
        std::cout << response.result.dump(2) << std::endl;
        return {};
    }

private:
    GovcatCLI* cli_ = nullptr;
    bool dryRun_ = false;
    bool apply_ = false;
    bool removeDeprecated_ = false;
    bool mergeDuplicates_ = false;
    bool purgeLegacyScopes_ = false;
};

std::unique_ptr<ICommand> createGroomCommand() {
    return std::make_unique<GroomCommand>();
}

} // namespace govcat::cli
