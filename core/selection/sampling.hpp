#pragma once

#include <algorithm>
#include <iterator>
#include <random>
#include <vector>

namespace linksim {

/// Uniform sample of min(k, |pool|) elements without replacement.
/// Relative order of the pool is preserved in the result.
template <typename T>
std::vector<T> sampleWithoutReplacement(const std::vector<T>& pool, size_t k,
                                        std::mt19937_64& rng) {
    if (pool.size() <= k) return pool;
    std::vector<T> out;
    out.reserve(k);
    std::sample(pool.begin(), pool.end(), std::back_inserter(out), k, rng);
    return out;
}

} // namespace linksim
