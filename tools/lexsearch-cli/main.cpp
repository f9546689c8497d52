#include <lexsearch/cli/lexsearch_cli.h>

#include <spdlog/sinks/stderr_color_sinks.h>
#include <spdlog/spdlog.h>

int main(int argc, char* argv[]) {
    try {
        // Logs go to stderr so --json output on stdout stays machine-readable
        auto logger = spdlog::stderr_color_mt("lexsearch");
        spdlog::set_default_logger(logger);

        // Conservative default; LexsearchCLI::run() adjusts based on flags and config
        spdlog::set_level(spdlog::level::warn);
        spdlog::set_pattern("[%H:%M:%S] [%l] %v");

        lexsearch::cli::LexsearchCLI cli;
        return cli.run(argc, argv);
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
