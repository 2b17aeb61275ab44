#pragma once

#include "graph/page.hpp"

#include <unordered_map>
#include <vector>

namespace linksim {

struct PagePair {
    PageId a = 0;
    PageId b = 0;
};

/// Pairwise semantic relevance in [0, 1], supplied from outside the core.
/// Embedding computation and caching belong to the implementation.
class SimilaritySource {
public:
    virtual ~SimilaritySource() = default;

    /// One score per pair, in input order.
    virtual std::vector<double> similarity(const std::vector<PagePair>& pairs) = 0;
};

/// Cosine similarity over caller-provided page embeddings, clamped to
/// [0, 1]. Pages without an embedding, or with a zero vector, score 0.
class EmbeddingSimilarity : public SimilaritySource {
public:
    void setEmbedding(PageId page, std::vector<float> embedding);
    size_t embeddingCount() const { return embeddings_.size(); }

    double cosine(PageId a, PageId b) const;

    std::vector<double> similarity(const std::vector<PagePair>& pairs) override;

private:
    std::unordered_map<PageId, std::vector<float>> embeddings_;
};

} // namespace linksim
