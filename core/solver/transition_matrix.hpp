#pragma once

#include "graph/edge.hpp"
#include "graph/page.hpp"

#include <unordered_map>
#include <vector>

namespace linksim {

// ─── TransitionMatrix ─────────────────────────────────────────
// Column-stochastic transition operator M stored by destination row:
// row j lists every (source i, probability i -> j). A source's
// probabilities are its outgoing weights divided by their sum.
//
// Dangling sources (zero out-weight) spread their mass uniformly.
// An outflow cap c on a source with positive out-weight keeps only the
// fraction c on its links and routes 1 - c to a self-loop.

class TransitionMatrix {
public:
    /// Edges with unknown endpoints are skipped. Throws ValidationError
    /// on a negative or non-finite weight, or a cap outside (0, 1].
    TransitionMatrix(const std::vector<PageId>& page_ids,
                     const std::vector<Edge>& edges,
                     const std::unordered_map<PageId, double>& outflow_caps = {});

    size_t size() const { return n_; }
    size_t nonZeros() const { return sources_.size(); }
    size_t danglingCount() const { return dangling_.size(); }
    size_t skippedEdges() const { return skipped_edges_; }

    /// out = M p. Rows are split into contiguous blocks across
    /// `num_threads` workers; all workers join before returning.
    void multiply(const std::vector<double>& p, std::vector<double>& out,
                  size_t num_threads = 1) const;

    /// Column sums of M (1.0 for every source); used by tests.
    std::vector<double> columnSums() const;

private:
    void multiplyRows(const std::vector<double>& p, std::vector<double>& out,
                      size_t row_begin, size_t row_end, double dangling_share) const;

    size_t n_ = 0;
    std::vector<size_t> row_start_;   // CSR offsets, size n + 1
    std::vector<size_t> sources_;
    std::vector<double> probs_;
    std::vector<size_t> dangling_;
    size_t skipped_edges_ = 0;
};

} // namespace linksim
