#include <nlohmann/json.hpp>
#include <pairdays/cli/command.h>
#include <pairdays/cli/command_support.h>
#include <pairdays/cli/pairdays_cli.h>
#include <pairdays/cli/ui_helpers.hpp>
#include <pairdays/engine/record_validator.h>

namespace pairdays::cli {

// Checks an input file without computing overlaps
class ValidateCommand : public ICommand {
public:
    std::string getName() const override { return "validate"; }

    std::string getDescription() const override {
        return "Check that every row of an assignments file is well formed";
    }

    void registerCommand(CLI::App& app, PairdaysCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("validate", getDescription());
        input_.addTo(cmd);

        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto today = input_.todayProvider();
        if (!today) {
            return today.error();
        }

        auto rows = input_.readRows(cli_->getConfig());
        if (!rows) {
            return rows.error();
        }

        engine::RecordValidator validator{engine::DateNormalizer{today.value()}};
        auto batch = validator.validateBatch(rows.value());
        if (!batch) {
            return batch.error();
        }

        const auto& validated = batch.value();
        if (cli_->getJsonOutput()) {
            nlohmann::json j;
            j["valid"] = true;
            j["rows"] = rows.value().size();
            j["assignments"] = validated.assignments.size();
            j["skippedRows"] = validated.skippedRows;
            cli_->out() << j.dump(2) << std::endl;
        } else {
            cli_->out() << ui::colorize("[OK] ", ui::Ansi::GREEN) << validated.assignments.size()
                        << " assignment(s) valid";
            if (validated.skippedRows > 0) {
                cli_->out() << ", " << validated.skippedRows << " short row(s) skipped";
            }
            cli_->out() << '\n';
        }
        return Result<void>();
    }

private:
    PairdaysCLI* cli_ = nullptr;
    InputOptions input_;
};

// Factory function
std::unique_ptr<ICommand> createValidateCommand() {
    return std::make_unique<ValidateCommand>();
}

} // namespace pairdays::cli
