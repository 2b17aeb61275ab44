#include "weights/similarity_source.hpp"

#include <algorithm>
#include <cmath>

namespace linksim {

void EmbeddingSimilarity::setEmbedding(PageId page, std::vector<float> embedding) {
    embeddings_[page] = std::move(embedding);
}

double EmbeddingSimilarity::cosine(PageId a, PageId b) const {
    auto ia = embeddings_.find(a);
    auto ib = embeddings_.find(b);
    if (ia == embeddings_.end() || ib == embeddings_.end()) return 0.0;

    const auto& va = ia->second;
    const auto& vb = ib->second;
    size_t n = std::min(va.size(), vb.size());

    double dot = 0.0, norm_a = 0.0, norm_b = 0.0;
    for (size_t i = 0; i < n; i++) {
        dot += static_cast<double>(va[i]) * vb[i];
        norm_a += static_cast<double>(va[i]) * va[i];
        norm_b += static_cast<double>(vb[i]) * vb[i];
    }
    if (norm_a == 0.0 || norm_b == 0.0) return 0.0;

    double sim = dot / (std::sqrt(norm_a) * std::sqrt(norm_b));
    return std::max(0.0, std::min(1.0, sim));
}

std::vector<double> EmbeddingSimilarity::similarity(const std::vector<PagePair>& pairs) {
    std::vector<double> scores;
    scores.reserve(pairs.size());
    for (const auto& p : pairs) {
        scores.push_back(cosine(p.a, p.b));
    }
    return scores;
}

} // namespace linksim
