#include <lexsearch/search/envelope_json.h>

namespace lexsearch::search {

nlohmann::json citationToJson(const citation::CitationMatch& match) {
    nlohmann::json out;
    out["raw_text"] = match.rawText;
    out["reporter"] = match.reporter;
    out["volume"] = match.volume;
    out["page"] = match.page;
    out["url"] = match.normalizedUrl;
    out["family"] = match.family;
    return out;
}

nlohmann::json candidateToJson(const Candidate& candidate) {
    nlohmann::json out;
    out["id"] = candidate.id;
    out["text"] = candidate.text;

    nlohmann::json meta;
    meta["title"] = candidate.metadata.title;
    meta["court"] = candidate.metadata.court;
    meta["date"] = candidate.metadata.date;
    meta["collection"] = candidate.metadata.collection;
    for (const auto& [key, value] : candidate.metadata.extra) {
        meta[key] = value;
    }
    out["metadata"] = std::move(meta);

    out["dense_score"] = candidate.denseScore;
    out["sparse_score"] = candidate.sparseScore;
    out["fused_score"] = candidate.fusedScore;
    if (candidate.rerankScore) {
        out["rerank_score"] = *candidate.rerankScore;
    }
    out["score"] = candidate.authoritativeScore();
    return out;
}

nlohmann::json envelopeToJson(const ResultEnvelope& envelope) {
    nlohmann::json output;

    nlohmann::json query;
    query["processed"] = envelope.query.processedQuery;
    query["collection"] = collectionScopeToString(envelope.query.resolvedScope);
    query["type"] = envelope.query.queryType;
    query["jurisdiction"] = envelope.query.jurisdiction ? nlohmann::json(*envelope.query.jurisdiction)
                                                        : nlohmann::json(nullptr);
    output["query"] = std::move(query);

    const bool withCitations = !envelope.citations.empty();
    nlohmann::json results = nlohmann::json::array();
    for (size_t i = 0; i < envelope.rankedCandidates.size(); ++i) {
        auto doc = candidateToJson(envelope.rankedCandidates[i]);
        doc["rank"] = i + 1;
        if (withCitations && i < envelope.citations.size()) {
            nlohmann::json cites = nlohmann::json::array();
            for (const auto& m : envelope.citations[i]) {
                cites.push_back(citationToJson(m));
            }
            doc["citations"] = std::move(cites);
        }
        results.push_back(std::move(doc));
    }
    output["results"] = std::move(results);
    output["total_candidates"] = envelope.totalCandidates;

    nlohmann::json timings = nlohmann::json::object();
    for (const auto& [stage, micros] : envelope.stageTimingMicros) {
        timings[stage] = micros;
    }
    output["timings_us"] = std::move(timings);
    output["total_time_us"] = envelope.totalTimeMicros;

    const auto& d = envelope.degraded;
    output["degraded"] = {{"retrieval", d.retrieval},
                          {"sparse", d.sparse},
                          {"reranking", d.reranking},
                          {"citations", d.citations},
                          {"reasons", d.reasons}};
    return output;
}

} // namespace lexsearch::search
