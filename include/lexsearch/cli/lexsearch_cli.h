#pragma once

#include <lexsearch/cli/command.h>
#include <lexsearch/config/pipeline_config.h>
#include <lexsearch/core/types.h>
#include <lexsearch/search/retrieval_pipeline.h>

#include <CLI/CLI.hpp>
#include <spdlog/common.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace lexsearch::cli {

class LexsearchCLI {
public:
    LexsearchCLI();
    ~LexsearchCLI();

    /**
     * Run the CLI with given arguments
     */
    int run(int argc, char* argv[]);

    /**
     * Register a command
     */
    void registerCommand(std::unique_ptr<ICommand> command);

    /**
     * Schedule a parsed command to run once parsing and logging setup finish
     */
    void setPendingCommand(ICommand* command) { pendingCommand_ = command; }

    /**
     * Effective configuration: config file plus environment overrides.
     * Loaded once; later calls return the cached result.
     */
    Result<config::PipelineConfig> getConfig();

    /**
     * Build the retrieval pipeline on first access
     */
    Result<std::shared_ptr<search::RetrievalPipeline>> getPipeline();

    std::filesystem::path getConfigPath() const;

    bool getVerbose() const { return verbose_; }

    static std::optional<spdlog::level::level_enum> parseLogLevel(const std::string& value);

private:
    void applyLogLevel();

    std::unique_ptr<CLI::App> app_;
    std::vector<std::unique_ptr<ICommand>> commands_;
    ICommand* pendingCommand_ = nullptr;

    std::string configPath_;
    bool verbose_ = false;

    std::optional<Result<config::PipelineConfig>> config_;
    std::shared_ptr<search::RetrievalPipeline> pipeline_;
};

} // namespace lexsearch::cli
