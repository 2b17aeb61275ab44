#include "simulation/simulation_orchestrator.hpp"
#include "common/errors.hpp"
#include "graph/link_graph.hpp"
#include "rules/link_rule_engine.hpp"
#include "weights/weight_blender.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <unordered_map>

namespace linksim {

namespace {

uint64_t seedFrom(const SimulationSettings& settings) {
    if (settings.rng_seed) return *settings.rng_seed;
    std::random_device rd;
    return (static_cast<uint64_t>(rd()) << 32) ^ rd();
}

std::string joinDescriptions(const std::vector<LinkRule>& rules) {
    std::string out;
    for (size_t i = 0; i < rules.size(); i++) {
        if (i > 0) out += "; ";
        out += describe(rules[i]);
    }
    return out;
}

} // namespace

SimulationOrchestrator::SimulationOrchestrator(SimulationStore& store,
                                               SimulationSettings settings,
                                               SimilaritySource* similarity,
                                               SolverControl control)
    : store_(store), settings_(settings), similarity_(similarity),
      control_(std::move(control)), rng_(seedFrom(settings)) {
    ConstrainedSolver::validate(solverConfig());
    if (settings_.use_semantic_weights && !similarity_) {
        throw ValidationError("Semantic weights enabled without a similarity source");
    }
}

SolverConfig SimulationOrchestrator::solverConfig() const {
    SolverConfig config;
    config.damping = settings_.damping;
    config.tolerance = settings_.tolerance;
    config.max_iter = settings_.max_iter;
    config.eta_protect = settings_.eta_protect;
    config.eta_boost = settings_.eta_boost;
    config.num_threads = settings_.num_threads > 0 ? static_cast<size_t>(settings_.num_threads) : 0;
    return config;
}

GraphStats SimulationOrchestrator::graphStats(const std::vector<Page>& pages,
                                              const std::vector<Edge>& edges) {
    return computeGraphStats(pages, edges);
}

// ─── Input checks ─────────────────────────────────────────────

void SimulationOrchestrator::validateSpecs(const std::vector<BoostSpec>& boosts,
                                           const std::vector<ProtectSpec>& protections) {
    for (const BoostSpec& b : boosts) {
        if (b.url.empty()) throw ValidationError("Boost spec without URL");
        if (!std::isfinite(b.target_factor) || b.target_factor <= 0.0) {
            throw ValidationError("Boost target factor must be positive for " + b.url);
        }
    }
    for (const ProtectSpec& p : protections) {
        if (p.url.empty()) throw ValidationError("Protect spec without URL");
        if (!std::isfinite(p.protection_factor) || p.protection_factor < -1.0) {
            throw ValidationError("Protection factor must be a finite value >= -1 for " + p.url);
        }
    }
}

std::vector<Page> SimulationOrchestrator::loadPages(const std::string& project_id) {
    std::vector<Page> pages = store_.getPages(project_id);
    if (pages.empty()) {
        throw ValidationError("Project " + project_id + " has no pages");
    }
    return pages;
}

// ─── Constraint conversion ────────────────────────────────────

SolverConstraints SimulationOrchestrator::buildConstraints(
        const std::vector<Page>& pages,
        const std::vector<BoostSpec>& boosts,
        const std::vector<ProtectSpec>& protections) {
    std::unordered_map<std::string, const Page*> by_url;
    for (const Page& p : pages) by_url.emplace(p.url, &p);

    SolverConstraints constraints;
    for (const BoostSpec& b : boosts) {
        constraints.boost[b.url] = b.target_factor;
    }
    for (const ProtectSpec& spec : protections) {
        if (spec.protection_factor >= 0.0) {
            constraints.protect[spec.url] = ProtectFloor::factor(spec.protection_factor);
            continue;
        }
        auto it = by_url.find(spec.url);
        if (it == by_url.end()) {
            spdlog::warn("Protect spec for unknown URL {} skipped", spec.url);
            continue;
        }
        double current = it->second->baseline_score;
        if (current <= 0.0) {
            spdlog::warn("Protect spec for {} skipped: current score is zero", spec.url);
            continue;
        }
        double floor = current * (1.0 - std::fabs(spec.protection_factor));
        constraints.protect[spec.url] = ProtectFloor::fixed(floor);
        spdlog::debug("Protect {}: max loss {:.0f}% -> floor {:.6f}",
                      spec.url, std::fabs(spec.protection_factor) * 100.0, floor);
    }
    return constraints;
}

// ─── Summary ──────────────────────────────────────────────────

SummaryStats SimulationOrchestrator::summarize(const std::vector<PageResult>& results,
                                               size_t links_added, size_t links_removed) {
    SummaryStats stats;
    stats.total_pages = results.size();
    stats.new_links_added = links_added;
    stats.links_removed = links_removed;

    double sum = 0.0;
    for (const PageResult& r : results) {
        sum += r.delta;
        stats.total_redistribution += std::fabs(r.delta);
        if (r.delta > kUnchangedDelta) {
            stats.pages_with_positive_change++;
        } else if (r.delta < -kUnchangedDelta) {
            stats.pages_with_negative_change++;
        } else {
            stats.pages_with_no_change++;
        }
        stats.max_positive_delta = std::max(stats.max_positive_delta, r.delta);
        stats.max_negative_delta = std::min(stats.max_negative_delta, r.delta);
    }
    if (!results.empty()) {
        stats.average_delta = sum / static_cast<double>(results.size());
    }
    return stats;
}

// ─── Runs ─────────────────────────────────────────────────────

bool SimulationOrchestrator::ensureBaseline(const std::string& project_id,
                                            std::vector<Page>& pages,
                                            const std::vector<Edge>& edges) {
    bool missing = std::any_of(pages.begin(), pages.end(),
                               [](const Page& p) { return p.baseline_score <= 0.0; });
    if (!missing) return false;

    spdlog::info("Project {} has pages without a baseline score; computing baseline", project_id);
    LinkGraph graph(pages, edges);
    ConstrainedSolver solver(solverConfig(), control_);
    SolverResult baseline = solver.solveBaseline(pages, graph.edges());

    std::vector<PageScore> scores;
    scores.reserve(pages.size());
    for (size_t i = 0; i < pages.size(); i++) {
        pages[i].baseline_score = baseline.scores[i];
        scores.push_back({pages[i].id, baseline.scores[i]});
    }
    store_.bulkUpdateScores(project_id, scores);
    return true;
}

RunSummary SimulationOrchestrator::runSimulation(const std::string& project_id,
                                                 const std::string& name,
                                                 const std::vector<LinkRule>& rules,
                                                 const std::vector<BoostSpec>& boosts,
                                                 const std::vector<ProtectSpec>& protections) {
    LinkRuleEngine::validate(rules);
    validateSpecs(boosts, protections);
    std::vector<Page> pages = loadPages(project_id);

    SimulationRun record;
    record.project_id = project_id;
    record.name = name;
    record.rules = rules;
    record.boosts = boosts;
    record.protections = protections;
    RunId run_id = store_.createRun(record);
    spdlog::info("Run {} '{}' created for project {} ({} rules, {} boosts, {} protections)",
                 run_id, name, project_id, rules.size(), boosts.size(), protections.size());

    try {
        store_.updateRunStatus(run_id, RunStatus::Running);
        RunSummary summary = execute(run_id, project_id, std::move(pages),
                                     rules, boosts, protections);
        store_.updateRunStatus(run_id, RunStatus::Completed);
        summary.status = RunStatus::Completed;
        spdlog::info("Run {} completed: {} new links, redistribution {:.6f}",
                     run_id, summary.new_links_count, summary.stats.total_redistribution);
        return summary;
    } catch (const LinksimError& e) {
        markFailed(run_id, e.what());
        throw;
    } catch (const std::exception& e) {
        markFailed(run_id, e.what());
        throw RunFailure(std::string("Run ") + std::to_string(run_id) + " failed: " + e.what());
    }
}

// A failed run keeps no results, even when it got as far as saving them.
void SimulationOrchestrator::markFailed(RunId run_id, const std::string& error) {
    spdlog::error("Run {} failed: {}", run_id, error);
    store_.saveRunResults(run_id, {});
    store_.updateRunStatus(run_id, RunStatus::Failed, error);
}

RunSummary SimulationOrchestrator::execute(RunId run_id, const std::string& project_id,
                                           std::vector<Page> pages,
                                           const std::vector<LinkRule>& rules,
                                           const std::vector<BoostSpec>& boosts,
                                           const std::vector<ProtectSpec>& protections) {
    RunSummary summary;
    summary.run_id = run_id;
    summary.status = RunStatus::Running;

    std::vector<Edge> existing = store_.getEdges(project_id);
    summary.baseline_recomputed = ensureBaseline(project_id, pages, existing);

    LinkRuleEngine engine(rng_);
    EdgeEditScript script = engine.apply(pages, existing, rules, &summary.rule_reports);

    LinkGraph graph(pages, existing);
    graph.applyEditScript(script);
    summary.new_links_count = script.added_edges.size();

    WeightConfig weight_config;
    weight_config.use_semantic = settings_.use_semantic_weights;
    weight_config.semantic_threshold = settings_.semantic_threshold;
    WeightBlender blender(weight_config, similarity_);
    std::vector<Edge> weighted = blender.blend(graph.edges());

    SolverConstraints constraints = buildConstraints(pages, boosts, protections);
    ConstrainedSolver solver(solverConfig(), control_);
    SolverResult solved = solver.solve(graph.pages(), weighted, constraints);
    summary.diagnostics = solved.diagnostics;

    std::vector<PageResult> results;
    results.reserve(pages.size());
    for (size_t i = 0; i < pages.size(); i++) {
        double current = pages[i].baseline_score;
        results.push_back({pages[i].id, solved.scores[i], solved.scores[i] - current});
    }

    summary.stats = summarize(results, script.added_edges.size(), script.removed_edges.size());
    summary.stats.rule_description = joinDescriptions(rules);

    if (settings_.apply_scores_on_completion) {
        std::vector<PageScore> scores;
        scores.reserve(results.size());
        for (const PageResult& r : results) scores.push_back({r.page_id, r.new_score});
        store_.bulkUpdateScores(project_id, scores);
        spdlog::info("Run {}: applied {} new scores as baseline", run_id, scores.size());
    }
    store_.saveRunResults(run_id, results);
    return summary;
}

// ─── Preview and reporting ────────────────────────────────────

RulePreview SimulationOrchestrator::previewRules(const std::string& project_id,
                                                 const std::vector<LinkRule>& rules,
                                                 size_t preview_count) {
    LinkRuleEngine::validate(rules);
    std::vector<Page> pages = loadPages(project_id);
    std::vector<Edge> existing = store_.getEdges(project_id);

    RulePreview preview;
    LinkRuleEngine engine(rng_);
    EdgeEditScript script = engine.apply(pages, existing, rules, &preview.rule_reports);

    std::unordered_map<PageId, const Page*> by_id;
    for (const Page& p : pages) by_id.emplace(p.id, &p);

    preview.rules_applied = rules.size();
    preview.total_new_links = script.added_edges.size();
    preview.total_removed_links = script.removed_edges.size();
    preview.truncated = script.added_edges.size() > preview_count;

    size_t shown = std::min(preview_count, script.added_edges.size());
    preview.sample_links.reserve(shown);
    for (size_t i = 0; i < shown; i++) {
        const Edge& e = script.added_edges[i];
        PreviewLink link;
        link.from = e.from;
        link.to = e.to;
        link.from_url = by_id.at(e.from)->url;
        link.to_url = by_id.at(e.to)->url;
        link.position = e.position.value_or(LinkPosition::Content);
        preview.sample_links.push_back(std::move(link));
    }
    return preview;
}

std::vector<DetailedResult> SimulationOrchestrator::detailedResults(const std::string& project_id,
                                                                    RunId run_id) {
    std::optional<SimulationRun> run = store_.getRun(run_id);
    if (!run || run->project_id != project_id) {
        throw ValidationError("Run " + std::to_string(run_id) + " not found in project " + project_id);
    }
    std::vector<Page> pages = store_.getPages(project_id);
    std::unordered_map<PageId, const Page*> by_id;
    for (const Page& p : pages) by_id.emplace(p.id, &p);

    std::vector<DetailedResult> out;
    out.reserve(run->results.size());
    for (const PageResult& r : run->results) {
        DetailedResult row;
        row.page_id = r.page_id;
        auto it = by_id.find(r.page_id);
        if (it != by_id.end()) {
            row.url = it->second->url;
            row.type = it->second->type;
            row.category = it->second->category;
        }
        row.new_score = r.new_score;
        row.delta = r.delta;
        row.current_score = r.new_score - r.delta;
        row.percent_change = row.current_score > 0.0 ? r.delta / row.current_score * 100.0 : 0.0;
        out.push_back(std::move(row));
    }
    std::sort(out.begin(), out.end(), [](const DetailedResult& a, const DetailedResult& b) {
        return a.delta > b.delta;
    });
    return out;
}

} // namespace linksim
