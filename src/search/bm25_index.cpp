#include <lexsearch/search/bm25_index.h>

#include <algorithm>
#include <cmath>

namespace lexsearch::search {

Bm25Index::Bm25Index(std::vector<SparseDocument> documents)
    : Bm25Index(std::move(documents), Params{}) {}

Bm25Index::Bm25Index(std::vector<SparseDocument> documents, Params params)
    : params_(params), documents_(std::move(documents)) {
    build();
}

std::vector<std::string> Bm25Index::tokenize(std::string_view text) {
    std::vector<std::string> tokens;
    std::string current;
    for (char ch : text) {
        const auto c = static_cast<unsigned char>(ch);
        if ((c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')) {
            current.push_back(static_cast<char>(c));
        } else if (c >= 'A' && c <= 'Z') {
            current.push_back(static_cast<char>(c - 'A' + 'a'));
        } else if (!current.empty()) {
            tokens.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty()) {
        tokens.push_back(std::move(current));
    }
    return tokens;
}

void Bm25Index::build() {
    termFrequencies_.reserve(documents_.size());
    docLengths_.reserve(documents_.size());

    std::unordered_map<std::string, size_t> documentFrequency;
    size_t totalLength = 0;
    for (const auto& doc : documents_) {
        std::unordered_map<std::string, size_t> tf;
        auto tokens = tokenize(doc.text);
        for (auto& token : tokens) {
            ++tf[token];
        }
        for (const auto& [term, count] : tf) {
            ++documentFrequency[term];
        }
        totalLength += tokens.size();
        docLengths_.push_back(tokens.size());
        termFrequencies_.push_back(std::move(tf));
    }

    if (documents_.empty()) {
        return;
    }
    avgDocLength_ = static_cast<double>(totalLength) / static_cast<double>(documents_.size());

    const double n = static_cast<double>(documents_.size());
    double idfSum = 0.0;
    std::vector<std::string> negative;
    for (const auto& [term, df] : documentFrequency) {
        const double freq = static_cast<double>(df);
        const double value = std::log(n - freq + 0.5) - std::log(freq + 0.5);
        idf_[term] = value;
        idfSum += value;
        if (value < 0.0) {
            negative.push_back(term);
        }
    }

    const double averageIdf = idfSum / static_cast<double>(idf_.size());
    const double floor = params_.epsilon * averageIdf;
    for (const auto& term : negative) {
        idf_[term] = floor;
    }
}

double Bm25Index::idf(const std::string& term) const {
    auto it = idf_.find(term);
    return it != idf_.end() ? it->second : 0.0;
}

double Bm25Index::score(const std::vector<std::string>& queryTokens, size_t document) const {
    if (document >= documents_.size()) {
        return 0.0;
    }
    const auto& tf = termFrequencies_[document];
    const double avgdl = avgDocLength_ > 0.0 ? avgDocLength_ : 1.0;
    const double lengthNorm =
        1.0 - params_.b + params_.b * static_cast<double>(docLengths_[document]) / avgdl;

    double total = 0.0;
    for (const auto& term : queryTokens) {
        auto it = tf.find(term);
        if (it == tf.end()) {
            continue;
        }
        const double freq = static_cast<double>(it->second);
        total += idf(term) * (freq * (params_.k1 + 1.0)) / (freq + params_.k1 * lengthNorm);
    }
    return std::isfinite(total) ? std::max(total, 0.0) : 0.0;
}

std::vector<Bm25Index::Hit> Bm25Index::search(const std::vector<std::string>& queryTokens,
                                              size_t topN) const {
    std::vector<Hit> hits;
    if (queryTokens.empty() || topN == 0) {
        return hits;
    }
    for (size_t i = 0; i < documents_.size(); ++i) {
        const double s = score(queryTokens, i);
        if (s > 0.0) {
            hits.push_back(Hit{i, s});
        }
    }

    auto better = [this](const Hit& a, const Hit& b) {
        if (a.score != b.score) {
            return a.score > b.score;
        }
        return documents_[a.document].id < documents_[b.document].id;
    };
    if (hits.size() > topN) {
        std::partial_sort(hits.begin(), hits.begin() + static_cast<ptrdiff_t>(topN), hits.end(),
                          better);
        hits.resize(topN);
    } else {
        std::sort(hits.begin(), hits.end(), better);
    }
    return hits;
}

} // namespace lexsearch::search
