#include <lexsearch/vector/in_memory_vector_index.h>

#include "payload_fields.h"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <fstream>

namespace lexsearch::vector {

double cosineSimilarity(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.size() != b.size() || a.empty()) {
        return 0.0;
    }
    double dot = 0.0;
    double normA = 0.0;
    double normB = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * b[i];
        normA += static_cast<double>(a[i]) * a[i];
        normB += static_cast<double>(b[i]) * b[i];
    }
    if (normA <= 0.0 || normB <= 0.0) {
        return 0.0;
    }
    return dot / (std::sqrt(normA) * std::sqrt(normB));
}

bool matchesFilters(const search::SourceMetadata& metadata, const search::SearchFilters& filters) {
    if (filters.court && metadata.court != *filters.court) {
        return false;
    }
    if (filters.dateFrom && (metadata.date.empty() || metadata.date < *filters.dateFrom)) {
        return false;
    }
    if (filters.dateTo && (metadata.date.empty() || metadata.date > *filters.dateTo)) {
        return false;
    }
    return true;
}

InMemoryVectorIndex::InMemoryVectorIndex(std::vector<VectorRecord> records)
    : records_(std::move(records)) {
    if (!records_.empty()) {
        dimension_ = records_.front().embedding.size();
    }
}

Result<std::shared_ptr<InMemoryVectorIndex>>
InMemoryVectorIndex::loadJsonLines(const std::filesystem::path& path,
                                   const std::string& contractsCollection,
                                   const std::string& casesCollection) {
    std::ifstream in(path);
    if (!in) {
        return Error{ErrorCode::NotFound, "Cannot open corpus file: " + path.string()};
    }

    auto lineError = [&path](size_t lineNo, const std::string& what) {
        return Error{ErrorCode::InvalidData,
                     path.string() + ":" + std::to_string(lineNo) + ": " + what};
    };

    std::vector<VectorRecord> records;
    std::string line;
    size_t lineNo = 0;
    size_t dimension = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }
        auto obj = nlohmann::json::parse(line, nullptr, /*allow_exceptions=*/false);
        if (obj.is_discarded() || !obj.is_object()) {
            return lineError(lineNo, "not a JSON object");
        }

        VectorRecord record;
        record.id = detail::scalarToString(obj.value("id", nlohmann::json()));
        if (record.id.empty()) {
            record.id = detail::scalarToString(obj.value("chunk_id", nlohmann::json()));
        }
        if (record.id.empty()) {
            return lineError(lineNo, "missing id");
        }
        record.text = obj.value("text", std::string{});

        auto emb = obj.find("embedding");
        if (emb == obj.end() || !emb->is_array() || emb->empty()) {
            return lineError(lineNo, "missing embedding");
        }
        record.embedding.reserve(emb->size());
        for (const auto& v : *emb) {
            if (!v.is_number()) {
                return lineError(lineNo, "embedding contains a non-number");
            }
            record.embedding.push_back(v.get<float>());
        }
        if (dimension == 0) {
            dimension = record.embedding.size();
        } else if (record.embedding.size() != dimension) {
            return lineError(lineNo, "embedding dimension " + std::to_string(record.embedding.size()) +
                                         " differs from " + std::to_string(dimension));
        }

        const auto collection = obj.value("collection", std::string{});
        std::string collectionName;
        if (collection == "contracts" || collection == contractsCollection) {
            record.collection = search::CollectionScope::Contracts;
            collectionName = contractsCollection;
        } else if (collection == "cases" || collection == casesCollection) {
            record.collection = search::CollectionScope::Cases;
            collectionName = casesCollection;
        } else {
            return lineError(lineNo, "unknown collection '" + collection + "'");
        }
        record.metadata = detail::metadataFromPayload(obj, collectionName);
        records.push_back(std::move(record));
    }

    spdlog::info("Loaded {} passages ({} dimensions) from {}", records.size(), dimension,
                 path.string());
    return std::make_shared<InMemoryVectorIndex>(std::move(records));
}

Result<VectorSearchResult> InMemoryVectorIndex::search(const std::vector<float>& embedding,
                                                       size_t topN, search::CollectionScope scope,
                                                       const search::SearchFilters& filters) {
    if (embedding.empty()) {
        return Error{ErrorCode::InvalidArgument, "Empty query embedding"};
    }
    if (dimension_ != 0 && embedding.size() != dimension_) {
        return Error{ErrorCode::InvalidArgument,
                     "Query embedding has " + std::to_string(embedding.size()) +
                         " dimensions, index has " + std::to_string(dimension_)};
    }

    const bool anyCollection =
        scope == search::CollectionScope::Both || scope == search::CollectionScope::Auto;

    VectorSearchResult out;
    for (const auto& record : records_) {
        if (!anyCollection && record.collection != scope) {
            continue;
        }
        if (!matchesFilters(record.metadata, filters)) {
            continue;
        }
        out.hits.push_back(VectorHit{record.id, record.text, record.metadata,
                                     cosineSimilarity(embedding, record.embedding)});
    }

    std::sort(out.hits.begin(), out.hits.end(), [](const VectorHit& a, const VectorHit& b) {
        if (a.similarity != b.similarity) {
            return a.similarity > b.similarity;
        }
        return a.id < b.id;
    });
    if (out.hits.size() > topN) {
        out.hits.resize(topN);
    }
    return out;
}

} // namespace lexsearch::vector
