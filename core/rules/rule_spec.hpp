#pragma once

#include "graph/edge.hpp"
#include "graph/page.hpp"
#include "selection/selection_strategy.hpp"

#include <string>
#include <variant>
#include <vector>

namespace linksim {

/// Page attribute filter. Matching is case-insensitive; an empty list
/// places no restriction on that attribute.
struct PageFilter {
    std::vector<std::string> types;
    std::vector<std::string> categories;

    bool matches(const Page& page) const;
};

// ─── Cumulative rule ───────────────────────────────────────────
// Links every filtered source page to up to `links_per_page`
// filtered targets chosen by the selection strategy.

struct RuleSpec {
    PageFilter source_filter;
    PageFilter target_filter;
    SelectionMethod selection_method = SelectionMethod::Category;
    int links_per_page = 3;
    bool bidirectional = false;
    bool avoid_self_links = true;
    LinkPosition link_position = LinkPosition::Content;
};

// ─── Structural rule ───────────────────────────────────────────
// Menu and footer edits. Targets are resolved by URL (exact match or
// substring containment). Menu rules act from every page; footer rules
// act from pages whose type is in `source_types`.

enum class StructuralAction { Add, Remove };
enum class StructuralZone { Menu, Footer };

struct StructuralRuleSpec {
    StructuralZone zone = StructuralZone::Menu;
    StructuralAction action = StructuralAction::Add;
    std::vector<std::string> target_urls;
    std::vector<std::string> source_types;  // footer only; empty = product, category
};

using LinkRule = std::variant<RuleSpec, StructuralRuleSpec>;

/// Footer rules without explicit source types act from these.
const std::vector<std::string>& defaultFooterSourceTypes();

/// "add" / "remove". Throws ValidationError otherwise.
StructuralAction parseStructuralAction(const std::string& name);

/// "header", "content_top", "content", "content_bottom", "sidebar",
/// "footer". Throws ValidationError otherwise.
LinkPosition parseLinkPosition(const std::string& name);

std::string toString(LinkPosition position);

/// Human-readable summary of a rule.
std::string describe(const LinkRule& rule);

} // namespace linksim
