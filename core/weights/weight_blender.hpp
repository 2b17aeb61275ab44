#pragma once

#include "graph/edge.hpp"
#include "weights/similarity_source.hpp"

#include <vector>

namespace linksim {

struct WeightConfig {
    bool use_semantic = false;        // false = legacy uniform position weights
    double semantic_threshold = 0.4;  // similarity below this contributes 0
};

/// Position weight table. Links higher on the page carry more weight.
double positionWeight(LinkPosition position);

/// Weight of a link that existed before the run.
constexpr double kExistingLinkWeight = 1.0;

struct BlendStats {
    size_t edges = 0;
    size_t relevant_links = 0;  // links with a non-zero semantic contribution
};

/// Assigns each edge a scalar weight:
///   position only:   w = position_weight
///   with relevance:  w = (position_weight + s) / 2, s = 0 below threshold
class WeightBlender {
public:
    explicit WeightBlender(WeightConfig config = {}, SimilaritySource* similarity = nullptr);

    /// Returns `edges` with `weight` filled in. Throws ValidationError if
    /// relevance is enabled without a similarity source, LinksimError if
    /// the source returns the wrong number of scores.
    std::vector<Edge> blend(const std::vector<Edge>& edges, BlendStats* stats = nullptr) const;

    const WeightConfig& config() const { return config_; }

private:
    WeightConfig config_;
    SimilaritySource* similarity_;  // non-owning
};

} // namespace linksim
