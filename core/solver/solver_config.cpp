#include "solver/solver_config.hpp"

namespace linksim {

std::string toString(SolverMode mode) {
    switch (mode) {
        case SolverMode::Fast:  return "fast";
        case SolverMode::Exact: return "exact";
    }
    return "fast";
}

std::unordered_map<PageId, double> SolverResult::scoreMap() const {
    std::unordered_map<PageId, double> out;
    out.reserve(page_ids.size());
    for (size_t i = 0; i < page_ids.size(); ++i) {
        out.emplace(page_ids[i], scores[i]);
    }
    return out;
}

} // namespace linksim
