#pragma once

#include <lexsearch/cli/command.h>

#include <memory>

namespace lexsearch::cli {

class LexsearchCLI;

/**
 * Registry of all available CLI commands
 */
class CommandRegistry {
public:
    /**
     * Register all built-in commands with the CLI
     */
    static void registerAllCommands(LexsearchCLI* cli);

    /**
     * Create search command
     */
    static std::unique_ptr<ICommand> createSearchCommand();

    /**
     * Create cite command (citation extraction and highlighting)
     */
    static std::unique_ptr<ICommand> createCiteCommand();
};

} // namespace lexsearch::cli
