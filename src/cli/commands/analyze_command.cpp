#include <spdlog/spdlog.h>
#include <pairdays/app/services/pair_analysis_service.h>
#include <pairdays/cli/command.h>
#include <pairdays/cli/command_support.h>
#include <pairdays/cli/pairdays_cli.h>
#include <pairdays/cli/report_renderer.h>

namespace pairdays::cli {

class AnalyzeCommand : public ICommand {
public:
    std::string getName() const override { return "analyze"; }

    std::string getDescription() const override {
        return "Compute overlapping days per employee pair and show the longest-working pair(s)";
    }

    void registerCommand(CLI::App& app, PairdaysCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("analyze", getDescription());
        input_.addTo(cmd);
        viewOpt_ = cmd->add_option("--view", view_,
                                   "Rows to show: 'top' (winning pairs) or 'all' (every pair)")
                       ->check(CLI::IsMember({"top", "all"}, CLI::ignore_case));

        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        const auto& cfg = cli_->getConfig();

        auto view = app::services::parseReportView(
            viewOpt_ && viewOpt_->count() > 0 ? view_ : cfg.view);
        if (!view) {
            return view.error();
        }

        auto today = input_.todayProvider();
        if (!today) {
            return today.error();
        }

        auto rows = input_.readRows(cfg);
        if (!rows) {
            return rows.error();
        }

        app::services::AnalysisRequest request;
        request.rows = std::move(rows).value();
        request.today = today.value();

        app::services::PairAnalysisService service;
        auto report = service.analyze(request);
        if (!report) {
            return report.error();
        }

        if (cli_->getJsonOutput()) {
            cli_->out() << ReportRenderer::toJson(report.value(), view.value()).dump(2)
                        << std::endl;
        } else {
            ReportRenderer::renderText(cli_->out(), report.value(), view.value());
        }
        return Result<void>();
    }

private:
    PairdaysCLI* cli_ = nullptr;
    InputOptions input_;
    std::string view_;
    CLI::Option* viewOpt_ = nullptr;
};

// Factory function
std::unique_ptr<ICommand> createAnalyzeCommand() {
    return std::make_unique<AnalyzeCommand>();
}

} // namespace pairdays::cli
