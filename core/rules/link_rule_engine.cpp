#include "rules/link_rule_engine.hpp"
#include "common/errors.hpp"
#include "common/text.hpp"

#include <spdlog/spdlog.h>

namespace linksim {

namespace {

std::vector<const Page*> filterPages(const std::vector<Page>& pages, const PageFilter& filter) {
    std::vector<const Page*> out;
    for (const Page& p : pages) {
        if (filter.matches(p)) out.push_back(&p);
    }
    return out;
}

bool urlMatches(const std::string& page_url, const std::vector<std::string>& target_urls) {
    for (const auto& target : target_urls) {
        if (target.empty()) continue;
        if (page_url == target || page_url.find(target) != std::string::npos) return true;
    }
    return false;
}

} // namespace

void LinkRuleEngine::validate(const std::vector<LinkRule>& rules) {
    for (size_t i = 0; i < rules.size(); i++) {
        if (const auto* r = std::get_if<RuleSpec>(&rules[i])) {
            if (r->links_per_page < 0) {
                throw ValidationError("Rule " + std::to_string(i + 1) +
                                      ": links_per_page must be >= 0");
            }
        } else {
            const auto& s = std::get<StructuralRuleSpec>(rules[i]);
            if (s.target_urls.empty()) {
                throw ValidationError("Rule " + std::to_string(i + 1) +
                                      ": structural rule requires target URLs");
            }
        }
    }
}

EdgeEditScript LinkRuleEngine::apply(const std::vector<Page>& pages,
                                     const std::vector<Edge>& existing_edges,
                                     const std::vector<LinkRule>& rules,
                                     std::vector<RuleReport>* reports) {
    validate(rules);

    KeySet present;
    present.reserve(existing_edges.size());
    for (const Edge& e : existing_edges) {
        present.insert(keyOf(e));
    }

    std::vector<Edge> added;
    std::vector<EdgeKey> removals;

    spdlog::info("Applying {} rules to {} pages, {} existing links",
                 rules.size(), pages.size(), existing_edges.size());

    for (size_t i = 0; i < rules.size(); i++) {
        RuleReport report;
        if (const auto* r = std::get_if<RuleSpec>(&rules[i])) {
            report = applyCumulative(pages, *r, present, added);
        } else {
            report = applyStructural(pages, std::get<StructuralRuleSpec>(rules[i]),
                                     present, added, removals);
        }
        report.description = describe(rules[i]);
        spdlog::debug("Rule {}/{} '{}': {} sources, {} targets, {} added, {} marked for removal",
                      i + 1, rules.size(), report.description, report.sources,
                      report.targets, report.added, report.removal_candidates);
        if (reports) reports->push_back(std::move(report));
    }

    EdgeEditScript script;
    if (removals.empty()) {
        script.added_edges = std::move(added);
    } else {
        KeySet removal_set(removals.begin(), removals.end());
        for (Edge& e : added) {
            if (!removal_set.count(keyOf(e))) script.added_edges.push_back(std::move(e));
        }
        for (const Edge& e : existing_edges) {
            if (removal_set.count(keyOf(e))) script.removed_edges.push_back(e);
        }
    }

    spdlog::info("Rule engine: {} links added, {} links removed",
                 script.added_edges.size(), script.removed_edges.size());
    if (script.empty()) {
        spdlog::warn("Rules produced no edge changes; scores will match the baseline");
    }
    return script;
}

RuleReport LinkRuleEngine::applyCumulative(const std::vector<Page>& pages,
                                           const RuleSpec& rule,
                                           KeySet& present,
                                           std::vector<Edge>& added) {
    RuleReport report;
    auto sources = filterPages(pages, rule.source_filter);
    auto targets = filterPages(pages, rule.target_filter);
    report.sources = sources.size();
    report.targets = targets.size();

    if (rule.links_per_page <= 0) return report;

    const SelectionStrategy& strategy = selectors_.get(rule.selection_method);
    const size_t k = static_cast<size_t>(rule.links_per_page);

    auto emit = [&](PageId from, PageId to) {
        if (from == to && rule.avoid_self_links) return;
        EdgeKey key{from, to};
        if (present.count(key)) return;
        present.insert(key);
        added.emplace_back(from, to, rule.link_position);
        report.added++;
    };

    for (const Page* source : sources) {
        std::vector<const Page*> candidates;
        if (rule.avoid_self_links) {
            candidates.reserve(targets.size());
            for (const Page* t : targets) {
                if (t->id != source->id) candidates.push_back(t);
            }
        } else {
            candidates = targets;
        }

        for (const Page* target : strategy.select(*source, candidates, k, rng_)) {
            emit(source->id, target->id);
            if (rule.bidirectional) emit(target->id, source->id);
        }
    }
    return report;
}

RuleReport LinkRuleEngine::applyStructural(const std::vector<Page>& pages,
                                           const StructuralRuleSpec& rule,
                                           KeySet& present,
                                           std::vector<Edge>& added,
                                           std::vector<EdgeKey>& removals) {
    RuleReport report;

    std::vector<PageId> target_ids;
    for (const Page& p : pages) {
        if (urlMatches(p.url, rule.target_urls)) target_ids.push_back(p.id);
    }
    report.targets = target_ids.size();
    if (target_ids.empty()) {
        spdlog::warn("Structural rule matched no page for {} target URLs", rule.target_urls.size());
        return report;
    }

    std::vector<const Page*> sources;
    if (rule.zone == StructuralZone::Menu) {
        for (const Page& p : pages) sources.push_back(&p);
    } else {
        const auto& types = rule.source_types.empty() ? defaultFooterSourceTypes()
                                                      : rule.source_types;
        for (const Page& p : pages) {
            if (matchesAnyIgnoreCase(p.type, types)) sources.push_back(&p);
        }
    }
    report.sources = sources.size();

    const LinkPosition position = rule.zone == StructuralZone::Menu ? LinkPosition::Header
                                                                    : LinkPosition::Footer;

    for (const Page* source : sources) {
        for (PageId target : target_ids) {
            if (source->id == target) continue;
            EdgeKey key{source->id, target};
            if (rule.action == StructuralAction::Remove) {
                removals.push_back(key);
                report.removal_candidates++;
            } else if (!present.count(key)) {
                present.insert(key);
                added.emplace_back(source->id, target, position);
                report.added++;
            }
        }
    }
    return report;
}

} // namespace linksim
