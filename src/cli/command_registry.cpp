#include <lexsearch/cli/command_registry.h>
#include <lexsearch/cli/lexsearch_cli.h>

namespace lexsearch::cli {

// External factory functions from command implementations (in this namespace)
std::unique_ptr<ICommand> createSearchCommand();
std::unique_ptr<ICommand> createCiteCommand();

void CommandRegistry::registerAllCommands(LexsearchCLI* cli) {
    cli->registerCommand(CommandRegistry::createSearchCommand());
    cli->registerCommand(CommandRegistry::createCiteCommand());
}

std::unique_ptr<ICommand> CommandRegistry::createSearchCommand() {
    return ::lexsearch::cli::createSearchCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createCiteCommand() {
    return ::lexsearch::cli::createCiteCommand();
}

} // namespace lexsearch::cli
