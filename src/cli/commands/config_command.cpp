#include <nlohmann/json.hpp>
#include <string>
#include <pairdays/cli/command.h>
#include <pairdays/cli/pairdays_cli.h>
#include <pairdays/cli/ui_helpers.hpp>

namespace pairdays::cli {

namespace {

std::string delimiterLabel(char delimiter) {
    if (delimiter == '\t')
        return "\\t";
    return std::string(1, delimiter);
}

} // namespace

// Prints the effective configuration
class ConfigCommand : public ICommand {
public:
    std::string getName() const override { return "config"; }

    std::string getDescription() const override { return "Show the effective configuration"; }

    void registerCommand(CLI::App& app, PairdaysCLI* cli) override {
        cli_ = cli;
        auto* cmd = app.add_subcommand("config", getDescription());
        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        const auto& cfg = cli_->getConfig();
        const std::string source = cfg.source.empty()
                                       ? "(defaults; no file at " + cli_->getConfigPath().string() + ")"
                                       : cfg.source.string();

        if (cli_->getJsonOutput()) {
            nlohmann::json j;
            j["source"] = cfg.source.string();
            j["input"] = {{"delimiter", std::string(1, cfg.delimiter)},
                          {"skip_header", cfg.skipHeader}};
            j["report"] = {{"view", cfg.view}};
            j["output"] = {{"json", cfg.json}, {"color", cfg.color}};
            j["logging"] = {{"level", cfg.logLevel}};
            cli_->out() << j.dump(2) << std::endl;
            return Result<void>();
        }

        auto& out = cli_->out();
        out << ui::colorize("Config: ", ui::Ansi::BOLD) << source << "\n\n";
        out << "[input]\n";
        out << "delimiter = \"" << delimiterLabel(cfg.delimiter) << "\"\n";
        out << "skip_header = " << (cfg.skipHeader ? "true" : "false") << "\n\n";
        out << "[report]\n";
        out << "view = \"" << cfg.view << "\"\n\n";
        out << "[output]\n";
        out << "json = " << (cfg.json ? "true" : "false") << "\n";
        out << "color = \"" << cfg.color << "\"\n\n";
        out << "[logging]\n";
        out << "level = \"" << cfg.logLevel << "\"\n";
        return Result<void>();
    }

private:
    PairdaysCLI* cli_ = nullptr;
};

// Factory function
std::unique_ptr<ICommand> createConfigCommand() {
    return std::make_unique<ConfigCommand>();
}

} // namespace pairdays::cli
