#include "selection/selector_table.hpp"
#include "selection/category_selector.hpp"
#include "selection/relevance_mix_selector.hpp"
#include "selection/random_selector.hpp"
#include "selection/rank_selector.hpp"
#include "selection/cross_category_selector.hpp"
#include "selection/popular_selector.hpp"
#include "common/text.hpp"

#include <spdlog/spdlog.h>

namespace linksim {

SelectionMethod parseSelectionMethod(const std::string& name) {
    std::string key = toLower(name);
    if (key == "category") return SelectionMethod::Category;
    if (key == "semantic" || key == "relevance_mix") return SelectionMethod::RelevanceMix;
    if (key == "random") return SelectionMethod::Random;
    if (key == "pagerank_high" || key == "rank_high") return SelectionMethod::RankHigh;
    if (key == "pagerank_low" || key == "rank_low") return SelectionMethod::RankLow;
    if (key == "cross_sell" || key == "cross_category") return SelectionMethod::CrossCategory;
    if (key == "popular_products" || key == "popular") return SelectionMethod::Popular;
    spdlog::warn("Unknown selection method '{}', falling back to category", name);
    return SelectionMethod::Category;
}

std::string toString(SelectionMethod method) {
    switch (method) {
        case SelectionMethod::Category:       return "category";
        case SelectionMethod::RelevanceMix:   return "semantic";
        case SelectionMethod::Random:         return "random";
        case SelectionMethod::RankHigh:       return "pagerank_high";
        case SelectionMethod::RankLow:        return "pagerank_low";
        case SelectionMethod::CrossCategory:  return "cross_sell";
        case SelectionMethod::Popular:        return "popular_products";
    }
    return "category";
}

std::unique_ptr<SelectionStrategy> makeSelectionStrategy(SelectionMethod method) {
    switch (method) {
        case SelectionMethod::Category:
            return std::make_unique<CategorySelector>();
        case SelectionMethod::RelevanceMix:
            return std::make_unique<RelevanceMixSelector>();
        case SelectionMethod::Random:
            return std::make_unique<RandomSelector>();
        case SelectionMethod::RankHigh:
            return std::make_unique<RankSelector>(true);
        case SelectionMethod::RankLow:
            return std::make_unique<RankSelector>(false);
        case SelectionMethod::CrossCategory:
            return std::make_unique<CrossCategorySelector>();
        case SelectionMethod::Popular:
            return std::make_unique<PopularSelector>();
    }
    return std::make_unique<CategorySelector>();
}

SelectorTable::SelectorTable() {
    const SelectionMethod all[kMethodCount] = {
        SelectionMethod::Category, SelectionMethod::RelevanceMix, SelectionMethod::Random,
        SelectionMethod::RankHigh, SelectionMethod::RankLow, SelectionMethod::CrossCategory,
        SelectionMethod::Popular
    };
    for (SelectionMethod m : all) {
        strategies_[static_cast<size_t>(m)] = makeSelectionStrategy(m);
    }
}

const SelectionStrategy& SelectorTable::get(SelectionMethod method) const {
    size_t slot = static_cast<size_t>(method);
    if (slot >= kMethodCount) {
        return *strategies_[static_cast<size_t>(SelectionMethod::Category)];
    }
    return *strategies_[slot];
}

std::vector<const SelectionStrategy*> SelectorTable::getAll() const {
    std::vector<const SelectionStrategy*> result;
    for (const auto& s : strategies_) {
        result.push_back(s.get());
    }
    return result;
}

} // namespace linksim
