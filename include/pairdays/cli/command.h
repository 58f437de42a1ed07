#pragma once

#include <memory>
#include <string>
#include <CLI/CLI.hpp>
#include <pairdays/core/types.h>

namespace pairdays::cli {

// Forward declarations
class PairdaysCLI;

/**
 * Base interface for CLI commands
 */
class ICommand {
public:
    virtual ~ICommand() = default;

    /**
     * Get the command name (e.g., "analyze", "validate")
     */
    virtual std::string getName() const = 0;

    /**
     * Get the command description for help text
     */
    virtual std::string getDescription() const = 0;

    /**
     * Register this command with the CLI11 app
     */
    virtual void registerCommand(CLI::App& app, PairdaysCLI* cli) = 0;

    /**
     * Execute the command. Runs after option parsing, logging and config setup.
     */
    virtual Result<void> execute() = 0;
};

} // namespace pairdays::cli
