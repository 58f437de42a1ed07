#pragma once

#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <CLI/CLI.hpp>
#include <spdlog/common.h>
#include <pairdays/cli/command.h>
#include <pairdays/config/app_config.h>

namespace pairdays::cli {

/**
 * Main CLI application class
 */
class PairdaysCLI {
public:
    explicit PairdaysCLI(std::ostream& out = std::cout, std::ostream& err = std::cerr);
    ~PairdaysCLI();

    /**
     * Run the CLI with given arguments
     */
    int run(int argc, char* argv[]);

    /**
     * Register a command with the CLI
     */
    void registerCommand(std::unique_ptr<ICommand> command);

    /**
     * Defer a command until parsing, logging and config are settled
     */
    void setPendingCommand(ICommand* cmd);

    /**
     * Effective configuration (file values; flags are applied by each command)
     */
    const config::AppConfig& getConfig() const { return config_; }

    /**
     * Path the configuration was resolved to (may not exist)
     */
    const std::filesystem::path& getConfigPath() const { return configPath_; }

    /**
     * JSON output: --json flag or output.json in config
     */
    bool getJsonOutput() const { return jsonOutput_ || config_.json; }

    std::ostream& out() { return out_; }
    std::ostream& err() { return err_; }

    /**
     * Report a failed command on the error stream (or as JSON on stdout)
     */
    void reportError(const Error& error, std::string_view command = "");

    static std::optional<spdlog::level::level_enum> parseLogLevel(std::string_view name);

private:
    void configureLogging();
    void configureColors();

    std::unique_ptr<CLI::App> app_;
    std::vector<std::unique_ptr<ICommand>> commands_;
    ICommand* pendingCommand_ = nullptr;

    std::ostream& out_;
    std::ostream& err_;

    config::AppConfig config_;
    std::filesystem::path configPath_;
    std::string configOverride_;
    bool verbose_ = false;
    bool jsonOutput_ = false;
    bool noColor_ = false;
};

} // namespace pairdays::cli
