#pragma once

#include "graph/edge.hpp"
#include "graph/page.hpp"
#include "rules/link_rule_engine.hpp"
#include "rules/rule_spec.hpp"
#include "solver/solver_config.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace linksim {

using RunId = uint64_t;

/// pending -> running -> {completed, failed}. Both end states are final.
enum class RunStatus { Pending, Running, Completed, Failed };

std::string toString(RunStatus status);

/// Push `url` toward target_factor x its baseline score.
struct BoostSpec {
    std::string url;
    double target_factor = 1.0;
};

/// Positive factor: floor = factor x baseline.
/// Negative factor: lose at most |factor| of the current score.
struct ProtectSpec {
    std::string url;
    double protection_factor = 0.0;
};

struct PageScore {
    PageId page_id = 0;
    double score = 0.0;
};

struct PageResult {
    PageId page_id = 0;
    double new_score = 0.0;
    double delta = 0.0;
};

/// A result row joined with the page it belongs to.
struct DetailedResult {
    PageId page_id = 0;
    std::string url;
    std::string type;
    std::string category;
    double current_score = 0.0;
    double new_score = 0.0;
    double delta = 0.0;
    double percent_change = 0.0;  // 0 when the current score is 0
};

struct SimulationRun {
    RunId id = 0;
    std::string project_id;
    std::string name;
    RunStatus status = RunStatus::Pending;
    std::vector<LinkRule> rules;
    std::vector<BoostSpec> boosts;
    std::vector<ProtectSpec> protections;
    std::vector<PageResult> results;
    std::string error;
};

struct SummaryStats {
    size_t total_pages = 0;
    size_t new_links_added = 0;
    size_t links_removed = 0;
    size_t pages_with_positive_change = 0;
    size_t pages_with_negative_change = 0;
    size_t pages_with_no_change = 0;
    double average_delta = 0.0;
    double max_positive_delta = 0.0;
    double max_negative_delta = 0.0;
    double total_redistribution = 0.0;  // sum of |delta|
    std::string rule_description;
};

struct RunSummary {
    RunId run_id = 0;
    RunStatus status = RunStatus::Pending;
    size_t new_links_count = 0;
    SummaryStats stats;
    std::vector<RuleReport> rule_reports;
    SolverDiagnostics diagnostics;
    bool baseline_recomputed = false;
};

struct PreviewLink {
    PageId from = 0;
    PageId to = 0;
    std::string from_url;
    std::string to_url;
    LinkPosition position = LinkPosition::Content;
};

struct RulePreview {
    size_t rules_applied = 0;
    size_t total_new_links = 0;
    size_t total_removed_links = 0;
    std::vector<PreviewLink> sample_links;
    bool truncated = false;
    std::vector<RuleReport> rule_reports;
};

/// Rows with |delta| at or below this count as unchanged.
constexpr double kUnchangedDelta = 1e-12;

} // namespace linksim
