#include <lexsearch/search/sparse_retriever.h>

#include <spdlog/spdlog.h>

namespace lexsearch::search {

namespace {

std::vector<SparseHit> collectHits(const Bm25Index& index,
                                   const std::vector<Bm25Index::Hit>& hits) {
    std::vector<SparseHit> out;
    out.reserve(hits.size());
    for (const auto& hit : hits) {
        const auto& doc = index.documents()[hit.document];
        out.push_back(SparseHit{doc.id, doc.text, doc.metadata, hit.score});
    }
    return out;
}

} // namespace

Result<std::vector<SparseHit>>
CandidatePoolBm25Retriever::search(const std::vector<std::string>& queryTokens,
                                   const std::vector<Candidate>& densePool, size_t topN) {
    if (queryTokens.empty() || densePool.empty()) {
        return std::vector<SparseHit>{};
    }

    std::vector<SparseDocument> docs;
    docs.reserve(densePool.size());
    for (const auto& c : densePool) {
        docs.push_back(SparseDocument{c.id, c.text, c.metadata});
    }

    Bm25Index index(std::move(docs), params_);
    auto hits = index.search(queryTokens, topN);
    spdlog::debug("BM25 over candidate pool: {} documents, {} hits", index.size(), hits.size());
    return collectHits(index, hits);
}

Result<std::vector<SparseHit>>
StaticBm25Retriever::search(const std::vector<std::string>& queryTokens,
                            const std::vector<Candidate>& /*densePool*/, size_t topN) {
    if (!index_) {
        return Error{ErrorCode::NotInitialized, "Sparse index not loaded"};
    }
    auto hits = index_->search(queryTokens, topN);
    spdlog::debug("BM25 over shared index: {} documents, {} hits", index_->size(), hits.size());
    return collectHits(*index_, hits);
}

} // namespace lexsearch::search
