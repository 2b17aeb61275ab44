#pragma once

#include <cstdint>
#include <string>

namespace linksim {

using PageId = uint64_t;

/// A page of the site being simulated.
/// Every caller-supplied page representation is converted to this
/// value type before it reaches the rule engine or the solver.
struct Page {
    PageId id = 0;
    std::string url;
    std::string type;       // free-form label, e.g. "product"
    std::string category;   // free-form grouping key, e.g. "/electronics/"
    double baseline_score = 0.0;

    Page() = default;
    Page(PageId id, std::string url, std::string type, std::string category,
         double baseline_score = 0.0)
        : id(id), url(std::move(url)), type(std::move(type)),
          category(std::move(category)), baseline_score(baseline_score) {}
};

} // namespace linksim
