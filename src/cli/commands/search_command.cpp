#include <lexsearch/cli/command.h>
#include <lexsearch/cli/lexsearch_cli.h>
#include <lexsearch/config/config_helpers.h>
#include <lexsearch/search/envelope_json.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace lexsearch::cli {

namespace {

std::string truncateSnippet(const std::string& text, size_t maxLen) {
    std::string flat;
    flat.reserve(std::min(text.size(), maxLen + 3));
    for (char c : text) {
        if (flat.size() >= maxLen)
            break;
        flat.push_back(c == '\n' || c == '\r' || c == '\t' ? ' ' : c);
    }
    if (text.size() > maxLen) {
        flat += "...";
    }
    return config::sanitize_for_terminal(flat);
}

} // namespace

class SearchCommand : public ICommand {
public:
    std::string getName() const override { return "search"; }

    std::string getDescription() const override {
        return "Search legal passages with hybrid retrieval and reranking";
    }

    void registerCommand(CLI::App& app, LexsearchCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand(getName(), getDescription());
        cmd->add_option("query", queryWords_, "Search query")->required();
        cmd->add_option("-c,--collection", collection_, "Collection: contracts, cases, both or auto")
            ->default_val("both")
            ->check(CLI::IsMember({"contracts", "cases", "both", "auto"}));
        cmd->add_option("-n,--limit", limit_, "Number of results (default from config)");
        cmd->add_option("--alpha", alpha_, "Dense weight for score fusion")
            ->check(CLI::Range(0.0, 1.0));
        cmd->add_flag("--no-hybrid", noHybrid_, "Dense retrieval only");
        cmd->add_flag("--no-rerank", noRerank_, "Skip cross-encoder reranking");
        cmd->add_flag("--no-citations", noCitations_, "Skip citation extraction");
        cmd->add_flag("--expand", expand_, "Expand legal abbreviations and synonyms");
        cmd->add_option("--court", court_, "Only passages from this court");
        cmd->add_option("--from", dateFrom_, "Earliest filing date (YYYY-MM-DD)");
        cmd->add_option("--to", dateTo_, "Latest filing date (YYYY-MM-DD)");
        cmd->add_flag("--json", jsonOutput_, "Output in JSON format");

        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto pipeline = cli_->getPipeline();
        if (!pipeline) {
            return pipeline.error();
        }
        const auto& engine = *pipeline.value();

        std::ostringstream joiner;
        for (size_t i = 0; i < queryWords_.size(); ++i) {
            if (i)
                joiner << ' ';
            joiner << queryWords_[i];
        }

        auto request = engine.makeRequest(joiner.str());
        if (auto scope = search::parseCollectionScope(collection_)) {
            request.collectionScope = *scope;
        }
        if (limit_) {
            request.resultLimit = *limit_;
        }
        request.alpha = alpha_;
        request.flags.useHybrid = !noHybrid_;
        request.flags.useReranking = !noRerank_;
        request.flags.extractCitations = !noCitations_;
        request.flags.expandQuery = expand_;
        request.filters.court = court_;
        request.filters.dateFrom = dateFrom_;
        request.filters.dateTo = dateTo_;

        auto response = engine.search(request);
        if (!response) {
            return response.error();
        }
        const auto& envelope = response.value();

        if (jsonOutput_) {
            std::cout << search::envelopeToJson(envelope).dump(2) << std::endl;
            return Result<void>();
        }

        printHuman(envelope);
        return Result<void>();
    }

private:
    void printHuman(const search::ResultEnvelope& envelope) const {
        if (!envelope.hasResults()) {
            std::cout << "(no results)" << std::endl;
        }

        const bool withCitations = !envelope.citations.empty();
        for (size_t i = 0; i < envelope.rankedCandidates.size(); ++i) {
            const auto& c = envelope.rankedCandidates[i];
            std::cout << (i + 1) << ". " << (c.metadata.title.empty() ? c.id : c.metadata.title);
            if (!c.metadata.court.empty() || !c.metadata.date.empty()) {
                std::cout << " [" << c.metadata.court
                          << (c.metadata.court.empty() || c.metadata.date.empty() ? "" : ", ")
                          << c.metadata.date << "]";
            }
            std::cout << "\n    score " << std::fixed << std::setprecision(4)
                      << c.authoritativeScore() << " (fused " << c.fusedScore;
            if (c.rerankScore) {
                std::cout << ", rerank " << *c.rerankScore;
            }
            std::cout << ")\n";
            std::cout << "    " << truncateSnippet(c.text, 200) << "\n";
            if (withCitations && i < envelope.citations.size()) {
                for (const auto& m : envelope.citations[i]) {
                    std::cout << "    " << m.rawText << " -> " << m.normalizedUrl << "\n";
                }
            }
        }

        if (envelope.degraded.any()) {
            std::cout << "Degraded:";
            for (const auto& reason : envelope.degraded.reasons) {
                std::cout << "\n  - " << reason;
            }
            std::cout << "\n";
        }

        std::cout << "Showing " << envelope.rankedCandidates.size() << " of "
                  << envelope.totalCandidates << " candidates ("
                  << search::collectionScopeToString(envelope.query.resolvedScope) << ", "
                  << envelope.query.queryType << ") in " << (envelope.totalTimeMicros / 1000)
                  << "ms" << std::endl;
    }

    LexsearchCLI* cli_ = nullptr;
    std::vector<std::string> queryWords_;
    std::string collection_ = "both";
    std::optional<int> limit_;
    std::optional<double> alpha_;
    bool noHybrid_ = false;
    bool noRerank_ = false;
    bool noCitations_ = false;
    bool expand_ = false;
    std::optional<std::string> court_;
    std::optional<std::string> dateFrom_;
    std::optional<std::string> dateTo_;
    bool jsonOutput_ = false;
};

// Factory function
std::unique_ptr<ICommand> createSearchCommand() {
    return std::make_unique<SearchCommand>();
}

} // namespace lexsearch::cli
