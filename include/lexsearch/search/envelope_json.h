#pragma once

#include <lexsearch/citation/citation_match.h>
#include <lexsearch/search/search_types.h>

#include <nlohmann/json.hpp>

namespace lexsearch::search {

nlohmann::json citationToJson(const citation::CitationMatch& match);

nlohmann::json candidateToJson(const Candidate& candidate);

/**
 * @brief Serialize a response envelope
 *
 * Layout:
 *   { "query": {...}, "results": [ {candidate..., "citations": [...]} ],
 *     "total_candidates", "timings_us": {stage: us}, "total_time_us",
 *     "degraded": {"retrieval", "sparse", "reranking", "citations", "reasons"} }
 *
 * A result carries a "citations" array only when extraction ran.
 */
nlohmann::json envelopeToJson(const ResultEnvelope& envelope);

} // namespace lexsearch::search
