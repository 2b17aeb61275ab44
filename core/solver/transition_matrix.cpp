#include "solver/transition_matrix.hpp"
#include "common/errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <system_error>
#include <thread>

namespace linksim {

TransitionMatrix::TransitionMatrix(const std::vector<PageId>& page_ids,
                                   const std::vector<Edge>& edges,
                                   const std::unordered_map<PageId, double>& outflow_caps)
    : n_(page_ids.size()) {
    std::unordered_map<PageId, size_t> index;
    index.reserve(n_);
    for (size_t i = 0; i < n_; ++i) {
        index.emplace(page_ids[i], i);
    }

    std::vector<double> out_weight(n_, 0.0);
    struct Entry { size_t from; size_t to; double weight; bool cap_loop; };
    std::vector<Entry> entries;
    entries.reserve(edges.size());

    for (const Edge& e : edges) {
        if (!std::isfinite(e.weight) || e.weight < 0.0) {
            throw ValidationError("Invalid edge weight " + std::to_string(e.weight) +
                                  " on " + std::to_string(e.from) + " -> " + std::to_string(e.to));
        }
        auto f = index.find(e.from);
        auto t = index.find(e.to);
        if (f == index.end() || t == index.end()) {
            skipped_edges_++;
            continue;
        }
        if (e.weight == 0.0) continue;
        entries.push_back({f->second, t->second, e.weight, false});
        out_weight[f->second] += e.weight;
    }

    // Fraction of each source's mass that follows its links.
    std::vector<double> keep(n_, 1.0);
    for (const auto& [id, cap] : outflow_caps) {
        if (!(cap > 0.0 && cap <= 1.0)) {
            throw ValidationError("Outflow cap must be in (0, 1], got " + std::to_string(cap));
        }
        auto it = index.find(id);
        if (it == index.end()) continue;
        keep[it->second] = cap;
    }

    for (size_t i = 0; i < n_; ++i) {
        if (out_weight[i] <= 0.0) dangling_.push_back(i);
    }

    // Self-loops for capped sources with positive out-weight.
    for (size_t i = 0; i < n_; ++i) {
        if (out_weight[i] > 0.0 && keep[i] < 1.0) {
            entries.push_back({i, i, 0.0, true});
        }
    }

    std::vector<size_t> counts(n_ + 1, 0);
    for (const Entry& en : entries) counts[en.to + 1]++;
    for (size_t j = 0; j < n_; ++j) counts[j + 1] += counts[j];
    row_start_ = counts;

    sources_.assign(entries.size(), 0);
    probs_.assign(entries.size(), 0.0);
    std::vector<size_t> cursor(row_start_.begin(), row_start_.end() - 1);
    for (const Entry& en : entries) {
        double p = en.cap_loop
            ? 1.0 - keep[en.from]
            : keep[en.from] * en.weight / out_weight[en.from];
        size_t slot = cursor[en.to]++;
        sources_[slot] = en.from;
        probs_[slot] = p;
    }

    if (skipped_edges_ > 0) {
        spdlog::warn("TransitionMatrix: skipped {} edges with unknown endpoints", skipped_edges_);
    }
    spdlog::debug("TransitionMatrix: {} pages, {} non-zeros, {} dangling",
                  n_, sources_.size(), dangling_.size());
}

void TransitionMatrix::multiplyRows(const std::vector<double>& p, std::vector<double>& out,
                                    size_t row_begin, size_t row_end,
                                    double dangling_share) const {
    for (size_t j = row_begin; j < row_end; ++j) {
        double sum = dangling_share;
        for (size_t k = row_start_[j]; k < row_start_[j + 1]; ++k) {
            sum += probs_[k] * p[sources_[k]];
        }
        out[j] = sum;
    }
}

void TransitionMatrix::multiply(const std::vector<double>& p, std::vector<double>& out,
                                size_t num_threads) const {
    out.assign(n_, 0.0);
    if (n_ == 0) return;

    double dangling_mass = 0.0;
    for (size_t i : dangling_) dangling_mass += p[i];
    double share = dangling_mass / static_cast<double>(n_);

    size_t workers = std::max<size_t>(1, std::min(num_threads, n_));
    if (workers == 1) {
        multiplyRows(p, out, 0, n_, share);
        return;
    }

    // Each worker owns a contiguous row block; no two write the same slot.
    std::vector<std::thread> threads;
    threads.reserve(workers);
    size_t block = (n_ + workers - 1) / workers;
    try {
        for (size_t w = 0; w < workers; ++w) {
            size_t begin = w * block;
            size_t end = std::min(n_, begin + block);
            if (begin >= end) break;
            threads.emplace_back([this, &p, &out, begin, end, share]() {
                multiplyRows(p, out, begin, end, share);
            });
        }
    } catch (const std::system_error&) {
        // Workers already started still reference p and out.
        for (auto& t : threads) {
            if (t.joinable()) t.join();
        }
        throw;
    }
    for (auto& t : threads) {
        t.join();
    }
}

std::vector<double> TransitionMatrix::columnSums() const {
    std::vector<double> sums(n_, 0.0);
    for (size_t k = 0; k < sources_.size(); ++k) {
        sums[sources_[k]] += probs_[k];
    }
    for (size_t i : dangling_) {
        sums[i] += 1.0;
    }
    return sums;
}

} // namespace linksim
