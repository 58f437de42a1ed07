#pragma once

#include <memory>
#include <pairdays/cli/command.h>

namespace pairdays::cli {

// Forward declaration
class PairdaysCLI;

/**
 * Registry of all available CLI commands
 */
class CommandRegistry {
public:
    /**
     * Register all built-in commands with the CLI
     */
    static void registerAllCommands(PairdaysCLI* cli);

    /**
     * Create analyze command
     */
    static std::unique_ptr<ICommand> createAnalyzeCommand();

    /**
     * Create validate command
     */
    static std::unique_ptr<ICommand> createValidateCommand();

    /**
     * Create config command
     */
    static std::unique_ptr<ICommand> createConfigCommand();
};

} // namespace pairdays::cli
