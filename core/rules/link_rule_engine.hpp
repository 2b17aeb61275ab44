#pragma once

#include "graph/link_graph.hpp"
#include "rules/rule_spec.hpp"
#include "selection/selector_table.hpp"

#include <random>
#include <string>
#include <unordered_set>
#include <vector>

namespace linksim {

/// Per-rule outcome, in rule order.
struct RuleReport {
    std::string description;
    size_t sources = 0;
    size_t targets = 0;
    size_t added = 0;               // new edges emitted by this rule
    size_t removal_candidates = 0;  // edges marked for exclusion
};

// ─── LinkRuleEngine ────────────────────────────────────────────
// Applies an ordered rule list to a page/edge snapshot and produces an
// edit script. Rules are cumulative: later rules see the edges emitted
// by earlier ones, and no edge is ever emitted twice. Removals are
// collected across all rules and applied last, against existing plus
// newly added edges.

class LinkRuleEngine {
public:
    explicit LinkRuleEngine(std::mt19937_64& rng) : rng_(rng) {}

    /// Reject malformed rules (negative link counts, structural rules
    /// without target URLs). Throws ValidationError.
    static void validate(const std::vector<LinkRule>& rules);

    EdgeEditScript apply(const std::vector<Page>& pages,
                         const std::vector<Edge>& existing_edges,
                         const std::vector<LinkRule>& rules,
                         std::vector<RuleReport>* reports = nullptr);

private:
    using KeySet = std::unordered_set<EdgeKey, EdgeKeyHash>;

    RuleReport applyCumulative(const std::vector<Page>& pages,
                               const RuleSpec& rule,
                               KeySet& present,
                               std::vector<Edge>& added);

    RuleReport applyStructural(const std::vector<Page>& pages,
                               const StructuralRuleSpec& rule,
                               KeySet& present,
                               std::vector<Edge>& added,
                               std::vector<EdgeKey>& removals);

    SelectorTable selectors_;
    std::mt19937_64& rng_;
};

} // namespace linksim
