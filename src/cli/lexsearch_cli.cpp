#include <lexsearch/cli/command_registry.h>
#include <lexsearch/cli/lexsearch_cli.h>
#include <lexsearch/config/config_helpers.h>
#include <lexsearch/search/pipeline_factory.h>

#include <spdlog/spdlog.h>

#include <cctype>
#include <cstdlib>
#include <iostream>

namespace lexsearch::cli {

LexsearchCLI::LexsearchCLI() {
    app_ = std::make_unique<CLI::App>("lexsearch - hybrid retrieval and citation linking for legal research");
    app_->require_subcommand(1);
    app_->set_version_flag("--version", "lexsearch 0.1.0");

    app_->add_option("--config", configPath_, "Path to config.toml")
        ->envname("LEXSEARCH_CONFIG");
    app_->add_flag("-v,--verbose", verbose_, "Enable verbose output");

    CommandRegistry::registerAllCommands(this);
}

LexsearchCLI::~LexsearchCLI() = default;

void LexsearchCLI::registerCommand(std::unique_ptr<ICommand> command) {
    command->registerCommand(*app_, this);
    commands_.push_back(std::move(command));
}

std::optional<spdlog::level::level_enum> LexsearchCLI::parseLogLevel(const std::string& s) {
    std::string v;
    v.reserve(s.size());
    for (char c : s)
        v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
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

void LexsearchCLI::applyLogLevel() {
    // Precedence: env LEXSEARCH_LOG_LEVEL > --verbose > [logging] level > warn
    if (const char* envLvl = std::getenv("LEXSEARCH_LOG_LEVEL"); envLvl && *envLvl) {
        if (auto lvl = parseLogLevel(envLvl)) {
            spdlog::set_level(*lvl);
            return;
        }
    }
    if (verbose_) {
        spdlog::set_level(spdlog::level::debug);
        return;
    }
    if (auto cfg = getConfig(); cfg && !cfg.value().logging.level.empty()) {
        if (auto lvl = parseLogLevel(cfg.value().logging.level)) {
            spdlog::set_level(*lvl);
            return;
        }
        spdlog::warn("Ignoring unknown logging.level '{}'", cfg.value().logging.level);
    }
    spdlog::set_level(spdlog::level::warn);
}

std::filesystem::path LexsearchCLI::getConfigPath() const {
    return config::get_config_path(configPath_);
}

Result<config::PipelineConfig> LexsearchCLI::getConfig() {
    if (!config_) {
        auto loaded = config::loadPipelineConfig(getConfigPath());
        if (loaded) {
            config::applyEnvironmentOverrides(loaded.value());
        }
        config_ = std::move(loaded);
    }
    return *config_;
}

Result<std::shared_ptr<search::RetrievalPipeline>> LexsearchCLI::getPipeline() {
    if (pipeline_) {
        return pipeline_;
    }
    auto cfg = getConfig();
    if (!cfg) {
        return cfg.error();
    }
    auto created = search::PipelineFactory::create(cfg.value());
    if (!created) {
        return created.error();
    }
    pipeline_ = std::shared_ptr<search::RetrievalPipeline>(std::move(created).value());
    return pipeline_;
}

int LexsearchCLI::run(int argc, char* argv[]) {
    try {
        app_->parse(argc, argv);

        applyLogLevel();

        if (pendingCommand_) {
            auto result = pendingCommand_->execute();
            if (!result) {
                std::cerr << "Error: " << result.error().message << "\n";
                spdlog::debug("{} failed: {} ({})", pendingCommand_->getName(),
                              result.error().message, errorToString(result.error().code));
                return result.error().code == ErrorCode::InvalidArgument ? 2 : 1;
            }
        }
        return 0;
    } catch (const CLI::ParseError& e) {
        return app_->exit(e);
    } catch (const std::exception& e) {
        // Always provide a user-facing error even if logging is off
        std::cerr << "Unexpected error: " << e.what() << "\n";
        spdlog::error("Unexpected error: {}", e.what());
        return 1;
    }
}

} // namespace lexsearch::cli
