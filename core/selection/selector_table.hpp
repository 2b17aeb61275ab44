#pragma once

#include "selection/selection_strategy.hpp"

#include <array>
#include <memory>
#include <vector>

namespace linksim {

/// Build the strategy for one method.
std::unique_ptr<SelectionStrategy> makeSelectionStrategy(SelectionMethod method);

/// Static dispatch table from SelectionMethod to strategy instance.
/// Filled once at construction; never mutated afterwards.
class SelectorTable {
public:
    static constexpr size_t kMethodCount = 7;

    SelectorTable();

    const SelectionStrategy& get(SelectionMethod method) const;

    std::vector<const SelectionStrategy*> getAll() const;

    size_t count() const { return strategies_.size(); }

private:
    std::array<std::unique_ptr<SelectionStrategy>, kMethodCount> strategies_;
};

} // namespace linksim
