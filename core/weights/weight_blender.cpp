#include "weights/weight_blender.hpp"
#include "common/errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

namespace linksim {

double positionWeight(LinkPosition position) {
    switch (position) {
        case LinkPosition::Header:        return 1.0;
        case LinkPosition::ContentTop:    return 0.95;
        case LinkPosition::Content:       return 0.80;
        case LinkPosition::ContentBottom: return 0.60;
        case LinkPosition::Sidebar:       return 0.40;
        case LinkPosition::Footer:        return 0.20;
    }
    return 0.80;
}

WeightBlender::WeightBlender(WeightConfig config, SimilaritySource* similarity)
    : config_(config), similarity_(similarity) {}

std::vector<Edge> WeightBlender::blend(const std::vector<Edge>& edges, BlendStats* stats) const {
    std::vector<Edge> out = edges;
    for (Edge& e : out) {
        e.weight = e.position ? positionWeight(*e.position) : kExistingLinkWeight;
    }

    BlendStats local;
    local.edges = out.size();

    if (!config_.use_semantic) {
        spdlog::info("Using position weights only for {} links (semantic relevance disabled)",
                     out.size());
        if (stats) *stats = local;
        return out;
    }

    if (!similarity_) {
        throw ValidationError("Semantic weighting enabled without a similarity source");
    }

    std::vector<PagePair> pairs;
    pairs.reserve(out.size());
    for (const Edge& e : out) {
        pairs.push_back({e.from, e.to});
    }

    std::vector<double> scores = similarity_->similarity(pairs);
    if (scores.size() != pairs.size()) {
        throw LinksimError("Similarity source returned " + std::to_string(scores.size()) +
                           " scores for " + std::to_string(pairs.size()) + " links");
    }

    for (size_t i = 0; i < out.size(); i++) {
        double s = scores[i];
        if (!std::isfinite(s)) s = 0.0;
        s = std::max(0.0, std::min(1.0, s));
        if (s < config_.semantic_threshold) s = 0.0;
        if (s > 0.0) local.relevant_links++;
        out[i].weight = (out[i].weight + s) / 2.0;
    }

    spdlog::info("Applied semantic relevance to {} of {} links (threshold {:.2f})",
                 local.relevant_links, local.edges, config_.semantic_threshold);
    if (stats) *stats = local;
    return out;
}

} // namespace linksim
