#include <lexsearch/citation/citation_extractor.h>
#include <lexsearch/cli/command.h>
#include <lexsearch/cli/lexsearch_cli.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <iostream>
#include <iterator>
#include <sstream>

namespace lexsearch::cli {

class CiteCommand : public ICommand {
public:
    std::string getName() const override { return "cite"; }

    std::string getDescription() const override {
        return "Extract legal citations from text and link them to the lookup service";
    }

    void registerCommand(CLI::App& app, LexsearchCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand(getName(), getDescription());
        cmd->add_option("text", textWords_, "Text to scan (reads stdin when omitted)");
        cmd->add_option("-f,--format", format_, "Output format: markdown, html or plain")
            ->default_val("markdown")
            ->check(CLI::IsMember({"markdown", "md", "html", "plain", "text"}));
        cmd->add_flag("--json", jsonOutput_, "Output citations and case names as JSON");

        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto format = citation::parseHighlightFormat(format_);
        if (!format) {
            return Error{ErrorCode::InvalidArgument, "Unknown format: " + format_};
        }

        citation::CitationExtractorConfig extractorConfig;
        if (auto cfg = cli_->getConfig(); cfg) {
            extractorConfig.maxPerPassage = cfg.value().citations.maxPerPassage;
            extractorConfig.lookupBaseUrl = cfg.value().citations.lookupBaseUrl;
        } else {
            return cfg.error();
        }
        const citation::CitationExtractor extractor(extractorConfig);

        std::string text;
        if (textWords_.empty()) {
            text.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
        } else {
            std::ostringstream joiner;
            for (size_t i = 0; i < textWords_.size(); ++i) {
                if (i)
                    joiner << ' ';
                joiner << textWords_[i];
            }
            text = joiner.str();
        }
        if (text.empty()) {
            return Error{ErrorCode::InvalidArgument, "No text given"};
        }

        auto matches = extractor.extractAll(text);
        auto caseNames = extractor.extractCaseNames(text);
        spdlog::debug("Found {} citations and {} case names", matches.size(), caseNames.size());

        if (jsonOutput_) {
            nlohmann::json output;
            nlohmann::json cites = nlohmann::json::array();
            for (const auto& m : matches) {
                nlohmann::json c;
                c["raw_text"] = m.rawText;
                c["reporter"] = m.reporter;
                c["volume"] = m.volume;
                c["page"] = m.page;
                c["url"] = m.normalizedUrl;
                c["position"] = m.position;
                cites.push_back(std::move(c));
            }
            output["citations"] = std::move(cites);
            nlohmann::json cases = nlohmann::json::array();
            for (const auto& n : caseNames) {
                cases.push_back({{"plaintiff", n.plaintiff},
                                 {"defendant", n.defendant},
                                 {"name", n.fullName}});
            }
            output["case_names"] = std::move(cases);
            output["highlighted"] = extractor.highlight(text, *format);
            std::cout << output.dump(2) << std::endl;
            return Result<void>();
        }

        if (*format != citation::HighlightFormat::Plain) {
            std::cout << extractor.highlight(text, *format) << std::endl;
            return Result<void>();
        }

        if (matches.empty()) {
            std::cout << "(no citations)" << std::endl;
        }
        for (const auto& m : matches) {
            std::cout << m.rawText << "\t" << m.normalizedUrl << "\n";
        }
        for (const auto& n : caseNames) {
            std::cout << "case: " << n.fullName << "\n";
        }
        std::cout.flush();
        return Result<void>();
    }

private:
    LexsearchCLI* cli_ = nullptr;
    std::vector<std::string> textWords_;
    std::string format_ = "markdown";
    bool jsonOutput_ = false;
};

// Factory function
std::unique_ptr<ICommand> createCiteCommand() {
    return std::make_unique<CiteCommand>();
}

} // namespace lexsearch::cli
