#include <pairdays/cli/command_registry.h>
#include <pairdays/cli/pairdays_cli.h>

namespace pairdays::cli {

// External factory functions from command implementations (in this namespace)
std::unique_ptr<ICommand> createAnalyzeCommand();
std::unique_ptr<ICommand> createValidateCommand();
std::unique_ptr<ICommand> createConfigCommand();

void CommandRegistry::registerAllCommands(PairdaysCLI* cli) {
    cli->registerCommand(CommandRegistry::createAnalyzeCommand());
    cli->registerCommand(CommandRegistry::createValidateCommand());
    cli->registerCommand(CommandRegistry::createConfigCommand());
}

std::unique_ptr<ICommand> CommandRegistry::createAnalyzeCommand() {
    return ::pairdays::cli::createAnalyzeCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createValidateCommand() {
    return ::pairdays::cli::createValidateCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createConfigCommand() {
    return ::pairdays::cli::createConfigCommand();
}

} // namespace pairdays::cli
