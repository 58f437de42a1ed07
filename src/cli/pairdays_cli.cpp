#include <spdlog/spdlog.h>
#include <cstdlib>
#include <pairdays/cli/command_registry.h>
#include <pairdays/cli/error_hints.h>
#include <pairdays/cli/pairdays_cli.h>
#include <pairdays/cli/report_renderer.h>
#include <pairdays/cli/ui_helpers.hpp>
#include <pairdays/config/config_helpers.h>
#include <pairdays/version.hpp>

namespace pairdays::cli {

void PairdaysCLI::setPendingCommand(ICommand* cmd) {
    pendingCommand_ = cmd;
}

PairdaysCLI::PairdaysCLI(std::ostream& out, std::ostream& err) : out_(out), err_(err) {
    // Set a conservative default; finalized after parsing flags in run()
    spdlog::set_level(spdlog::level::warn);

    app_ = std::make_unique<CLI::App>(
        "Find the employee pairs that worked together longest on shared projects", "pairdays");
    app_->set_version_flag("--version", PAIRDAYS_VERSION_LONG_STRING);
    app_->require_subcommand(1);

    // Global options
    app_->add_flag("-v,--verbose", verbose_, "Enable verbose output");
    app_->add_flag("--json", jsonOutput_, "Output in JSON format");
    app_->add_flag("--no-color", noColor_, "Disable ANSI colors");
    app_->add_option("--config", configOverride_, "Path to config.toml");

    CommandRegistry::registerAllCommands(this);
}

PairdaysCLI::~PairdaysCLI() = default;

void PairdaysCLI::registerCommand(std::unique_ptr<ICommand> command) {
    command->registerCommand(*app_, this);
    commands_.push_back(std::move(command));
}

std::optional<spdlog::level::level_enum> PairdaysCLI::parseLogLevel(std::string_view name) {
    const std::string v = config::to_lower(std::string(name));
    if (v == "trace")
        return spdlog::level::trace;
    if (v == "debug")
        return spdlog::level::debug;
    if (v == "info")
        return spdlog::level::info;
    if (v == "warn" || v == "warning")
        return spdlog::level::warn;
    if (v == "error" || v == "err")
        return spdlog::level::err;
    if (v == "critical" || v == "crit")
        return spdlog::level::critical;
    if (v == "off" || v == "none" || v == "silent")
        return spdlog::level::off;
    return std::nullopt;
}

void PairdaysCLI::configureLogging() {
    // Order: PAIRDAYS_LOG_LEVEL env > --verbose > logging.level > warn
    if (const char* envLvl = std::getenv("PAIRDAYS_LOG_LEVEL"); envLvl && *envLvl) {
        if (auto lvl = parseLogLevel(envLvl)) {
            spdlog::set_level(*lvl);
            return;
        }
        spdlog::warn("Ignoring unknown PAIRDAYS_LOG_LEVEL '{}'", envLvl);
    }
    if (verbose_) {
        spdlog::set_level(spdlog::level::debug);
    } else if (auto lvl = parseLogLevel(config_.logLevel)) {
        spdlog::set_level(*lvl);
    } else {
        spdlog::set_level(spdlog::level::warn);
    }
}

void PairdaysCLI::configureColors() {
    if (noColor_ || config_.color == "never") {
        ui::set_color_mode(ui::ColorMode::ForceOff);
    } else if (config_.color == "always") {
        ui::set_color_mode(ui::ColorMode::ForceOn);
    } else {
        ui::set_color_mode(ui::ColorMode::Auto);
    }
}

void PairdaysCLI::reportError(const Error& error, std::string_view command) {
    if (getJsonOutput()) {
        out_ << ReportRenderer::errorToJson(error).dump(2) << std::endl;
        return;
    }
    err_ << ui::colorize("[FAIL] ", ui::Ansi::RED)
         << formatErrorWithHint(error.code, error.message, command) << "\n";
}

int PairdaysCLI::run(int argc, char* argv[]) {
    try {
        app_->parse(argc, argv);

        configPath_ = config::get_config_path(configOverride_);
        auto cfg = config::load_app_config(configPath_);
        if (!cfg) {
            configureLogging();
            reportError(cfg.error());
            return 1;
        }
        config_ = cfg.value();

        configureLogging();
        configureColors();

        if (!pendingCommand_) {
            return 0;
        }

        spdlog::debug("Running '{}' (config: {})", pendingCommand_->getName(),
                      config_.source.empty() ? "defaults" : config_.source.string());

        auto result = pendingCommand_->execute();
        if (!result) {
            spdlog::debug("'{}' failed: {}", pendingCommand_->getName(), result.error().code);
            reportError(result.error(), pendingCommand_->getName());
            return 1;
        }
        return 0;
    } catch (const CLI::ParseError& e) {
        return app_->exit(e, out_, err_);
    } catch (const std::exception& e) {
        // Always provide a user-facing error even if logging is off
        err_ << "[FAIL] Unexpected error: " << e.what() << "\n";
        spdlog::error("Unexpected error: {}", e.what());
        return 1;
    }
}

} // namespace pairdays::cli
