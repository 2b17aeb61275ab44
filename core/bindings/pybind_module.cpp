// PyBind11 bindings for the linksim core.
// Exposes the page/link model, rule preview, solver and simulation runs
// to the Python service layer.

// NOTE: Requires pybind11 to be installed.
// Build with: cmake -DLINKSIM_BUILD_PYTHON_BINDINGS=ON

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/functional.h>

#include "common/logging.hpp"
#include "common/settings.hpp"
#include "graph/graph_stats.hpp"
#include "rules/rule_spec.hpp"
#include "simulation/simulation_orchestrator.hpp"
#include "simulation/simulation_store.hpp"
#include "solver/constrained_solver.hpp"
#include "weights/similarity_source.hpp"

namespace py = pybind11;

PYBIND11_MODULE(linksim_bindings, m) {
    m.doc() = "linksim C++ core bindings";

    m.def("setup_logging", [](const std::string& level, const std::string& log_file) {
        linksim::LoggingOptions options;
        options.level = linksim::parseLogLevel(level);
        options.log_file = log_file;
        linksim::setupLogging(options);
    }, py::arg("level") = "info", py::arg("log_file") = "");

    // ── Model ──
    py::class_<linksim::Page>(m, "Page")
        .def(py::init<>())
        .def(py::init<linksim::PageId, std::string, std::string, std::string, double>(),
             py::arg("id"), py::arg("url"), py::arg("type"), py::arg("category"),
             py::arg("baseline_score") = 0.0)
        .def_readwrite("id", &linksim::Page::id)
        .def_readwrite("url", &linksim::Page::url)
        .def_readwrite("type", &linksim::Page::type)
        .def_readwrite("category", &linksim::Page::category)
        .def_readwrite("baseline_score", &linksim::Page::baseline_score);

    py::enum_<linksim::LinkPosition>(m, "LinkPosition")
        .value("HEADER", linksim::LinkPosition::Header)
        .value("CONTENT_TOP", linksim::LinkPosition::ContentTop)
        .value("CONTENT", linksim::LinkPosition::Content)
        .value("CONTENT_BOTTOM", linksim::LinkPosition::ContentBottom)
        .value("SIDEBAR", linksim::LinkPosition::Sidebar)
        .value("FOOTER", linksim::LinkPosition::Footer);

    py::class_<linksim::Edge>(m, "Edge")
        .def(py::init<>())
        .def(py::init<linksim::PageId, linksim::PageId, double>(),
             py::arg("source"), py::arg("target"), py::arg("weight") = 1.0)
        .def_readwrite("source", &linksim::Edge::from)
        .def_readwrite("target", &linksim::Edge::to)
        .def_readwrite("weight", &linksim::Edge::weight)
        .def_readwrite("position", &linksim::Edge::position);

    py::class_<linksim::GraphStats>(m, "GraphStats")
        .def_readonly("num_nodes", &linksim::GraphStats::num_nodes)
        .def_readonly("num_edges", &linksim::GraphStats::num_edges)
        .def_readonly("density", &linksim::GraphStats::density)
        .def_readonly("weakly_connected_components",
                      &linksim::GraphStats::weakly_connected_components)
        .def_readonly("strongly_connected_components",
                      &linksim::GraphStats::strongly_connected_components)
        .def_readonly("is_strongly_connected", &linksim::GraphStats::is_strongly_connected);

    m.def("graph_stats", &linksim::SimulationOrchestrator::graphStats);

    // ── Rules ──
    py::class_<linksim::PageFilter>(m, "PageFilter")
        .def(py::init<>())
        .def_readwrite("types", &linksim::PageFilter::types)
        .def_readwrite("categories", &linksim::PageFilter::categories);

    py::class_<linksim::RuleSpec>(m, "RuleSpec")
        .def(py::init<>())
        .def_readwrite("source_filter", &linksim::RuleSpec::source_filter)
        .def_readwrite("target_filter", &linksim::RuleSpec::target_filter)
        .def_property("selection_method",
            [](const linksim::RuleSpec& r) { return linksim::toString(r.selection_method); },
            [](linksim::RuleSpec& r, const std::string& name) {
                r.selection_method = linksim::parseSelectionMethod(name);
            })
        .def_property("link_position",
            [](const linksim::RuleSpec& r) { return linksim::toString(r.link_position); },
            [](linksim::RuleSpec& r, const std::string& name) {
                r.link_position = linksim::parseLinkPosition(name);
            })
        .def_readwrite("links_per_page", &linksim::RuleSpec::links_per_page)
        .def_readwrite("bidirectional", &linksim::RuleSpec::bidirectional)
        .def_readwrite("avoid_self_links", &linksim::RuleSpec::avoid_self_links);

    py::class_<linksim::StructuralRuleSpec>(m, "StructuralRuleSpec")
        .def(py::init<>())
        .def_property("zone",
            [](const linksim::StructuralRuleSpec& r) {
                return std::string(r.zone == linksim::StructuralZone::Menu ? "menu" : "footer");
            },
            [](linksim::StructuralRuleSpec& r, const std::string& zone) {
                r.zone = zone == "footer" ? linksim::StructuralZone::Footer
                                          : linksim::StructuralZone::Menu;
            })
        .def_property("action",
            [](const linksim::StructuralRuleSpec& r) {
                return std::string(r.action == linksim::StructuralAction::Add ? "add" : "remove");
            },
            [](linksim::StructuralRuleSpec& r, const std::string& name) {
                r.action = linksim::parseStructuralAction(name);
            })
        .def_readwrite("target_urls", &linksim::StructuralRuleSpec::target_urls)
        .def_readwrite("source_types", &linksim::StructuralRuleSpec::source_types);

    py::class_<linksim::RuleReport>(m, "RuleReport")
        .def_readonly("description", &linksim::RuleReport::description)
        .def_readonly("sources", &linksim::RuleReport::sources)
        .def_readonly("targets", &linksim::RuleReport::targets)
        .def_readonly("added", &linksim::RuleReport::added)
        .def_readonly("removal_candidates", &linksim::RuleReport::removal_candidates);

    // ── Runs ──
    py::class_<linksim::BoostSpec>(m, "BoostSpec")
        .def(py::init<>())
        .def_readwrite("url", &linksim::BoostSpec::url)
        .def_readwrite("target_factor", &linksim::BoostSpec::target_factor);

    py::class_<linksim::ProtectSpec>(m, "ProtectSpec")
        .def(py::init<>())
        .def_readwrite("url", &linksim::ProtectSpec::url)
        .def_readwrite("protection_factor", &linksim::ProtectSpec::protection_factor);

    py::class_<linksim::SolverDiagnostics>(m, "SolverDiagnostics")
        .def_readonly("converged", &linksim::SolverDiagnostics::converged)
        .def_readonly("iterations_run", &linksim::SolverDiagnostics::iterations_run)
        .def_readonly("final_l1_residual", &linksim::SolverDiagnostics::final_l1_residual)
        .def_readonly("budget_clamped", &linksim::SolverDiagnostics::budget_clamped)
        .def_readonly("protect_budget_used", &linksim::SolverDiagnostics::protect_budget_used)
        .def_readonly("boost_budget_used", &linksim::SolverDiagnostics::boost_budget_used)
        .def_readonly("degenerate_projections",
                      &linksim::SolverDiagnostics::degenerate_projections)
        .def_readonly("estimated_seconds", &linksim::SolverDiagnostics::estimated_seconds)
        .def_readonly("elapsed_seconds", &linksim::SolverDiagnostics::elapsed_seconds)
        .def_property_readonly("selected_mode", [](const linksim::SolverDiagnostics& d) {
            return linksim::toString(d.selected_mode);
        });

    py::class_<linksim::SummaryStats>(m, "SummaryStats")
        .def_readonly("total_pages", &linksim::SummaryStats::total_pages)
        .def_readonly("new_links_added", &linksim::SummaryStats::new_links_added)
        .def_readonly("links_removed", &linksim::SummaryStats::links_removed)
        .def_readonly("pages_with_positive_change",
                      &linksim::SummaryStats::pages_with_positive_change)
        .def_readonly("pages_with_negative_change",
                      &linksim::SummaryStats::pages_with_negative_change)
        .def_readonly("pages_with_no_change", &linksim::SummaryStats::pages_with_no_change)
        .def_readonly("average_delta", &linksim::SummaryStats::average_delta)
        .def_readonly("max_positive_delta", &linksim::SummaryStats::max_positive_delta)
        .def_readonly("max_negative_delta", &linksim::SummaryStats::max_negative_delta)
        .def_readonly("total_redistribution", &linksim::SummaryStats::total_redistribution)
        .def_readonly("rule_description", &linksim::SummaryStats::rule_description);

    py::class_<linksim::RunSummary>(m, "RunSummary")
        .def_readonly("run_id", &linksim::RunSummary::run_id)
        .def_property_readonly("status", [](const linksim::RunSummary& s) {
            return linksim::toString(s.status);
        })
        .def_readonly("new_links_count", &linksim::RunSummary::new_links_count)
        .def_readonly("stats", &linksim::RunSummary::stats)
        .def_readonly("rule_reports", &linksim::RunSummary::rule_reports)
        .def_readonly("diagnostics", &linksim::RunSummary::diagnostics);

    py::class_<linksim::PreviewLink>(m, "PreviewLink")
        .def_readonly("source_url", &linksim::PreviewLink::from_url)
        .def_readonly("target_url", &linksim::PreviewLink::to_url)
        .def_property_readonly("position", [](const linksim::PreviewLink& l) {
            return linksim::toString(l.position);
        });

    py::class_<linksim::RulePreview>(m, "RulePreview")
        .def_readonly("rules_applied", &linksim::RulePreview::rules_applied)
        .def_readonly("total_new_links", &linksim::RulePreview::total_new_links)
        .def_readonly("total_removed_links", &linksim::RulePreview::total_removed_links)
        .def_readonly("sample_links", &linksim::RulePreview::sample_links)
        .def_readonly("truncated", &linksim::RulePreview::truncated);

    py::class_<linksim::DetailedResult>(m, "DetailedResult")
        .def_readonly("page_id", &linksim::DetailedResult::page_id)
        .def_readonly("url", &linksim::DetailedResult::url)
        .def_readonly("type", &linksim::DetailedResult::type)
        .def_readonly("category", &linksim::DetailedResult::category)
        .def_readonly("current_score", &linksim::DetailedResult::current_score)
        .def_readonly("new_score", &linksim::DetailedResult::new_score)
        .def_readonly("delta", &linksim::DetailedResult::delta)
        .def_readonly("percent_change", &linksim::DetailedResult::percent_change);

    // ── Store + orchestrator ──
    py::class_<linksim::SimulationStore>(m, "SimulationStore");

    py::class_<linksim::InMemoryStore, linksim::SimulationStore>(m, "InMemoryStore")
        .def(py::init<>())
        .def("add_project", &linksim::InMemoryStore::addProject)
        .def("has_project", &linksim::InMemoryStore::hasProject)
        .def("get_pages", &linksim::InMemoryStore::getPages);

    py::class_<linksim::EmbeddingSimilarity>(m, "EmbeddingSimilarity")
        .def(py::init<>())
        .def("set_embedding", &linksim::EmbeddingSimilarity::setEmbedding)
        .def("cosine", &linksim::EmbeddingSimilarity::cosine);

    py::class_<linksim::SimulationSettings>(m, "SimulationSettings")
        .def(py::init<>())
        .def_static("from_environment", &linksim::SimulationSettings::fromEnvironment)
        .def_readwrite("damping", &linksim::SimulationSettings::damping)
        .def_readwrite("max_iter", &linksim::SimulationSettings::max_iter)
        .def_readwrite("tolerance", &linksim::SimulationSettings::tolerance)
        .def_readwrite("eta_protect", &linksim::SimulationSettings::eta_protect)
        .def_readwrite("eta_boost", &linksim::SimulationSettings::eta_boost)
        .def_readwrite("use_semantic_weights", &linksim::SimulationSettings::use_semantic_weights)
        .def_readwrite("semantic_threshold", &linksim::SimulationSettings::semantic_threshold)
        .def_readwrite("apply_scores_on_completion",
                       &linksim::SimulationSettings::apply_scores_on_completion)
        .def_readwrite("num_threads", &linksim::SimulationSettings::num_threads)
        .def_readwrite("rng_seed", &linksim::SimulationSettings::rng_seed);

    py::class_<linksim::SimulationOrchestrator>(m, "SimulationOrchestrator")
        .def(py::init([](linksim::InMemoryStore& store, const linksim::SimulationSettings& settings,
                         linksim::EmbeddingSimilarity* similarity) {
                 return new linksim::SimulationOrchestrator(store, settings, similarity);
             }),
             py::arg("store"), py::arg("settings") = linksim::SimulationSettings{},
             py::arg("similarity") = nullptr,
             py::keep_alive<1, 2>(), py::keep_alive<1, 4>())
        .def("run_simulation", &linksim::SimulationOrchestrator::runSimulation,
             py::arg("project_id"), py::arg("name"), py::arg("rules"),
             py::arg("boosts") = std::vector<linksim::BoostSpec>{},
             py::arg("protections") = std::vector<linksim::ProtectSpec>{},
             py::call_guard<py::gil_scoped_release>())
        .def("preview_rules", &linksim::SimulationOrchestrator::previewRules,
             py::arg("project_id"), py::arg("rules"), py::arg("preview_count") = 10)
        .def("detailed_results", &linksim::SimulationOrchestrator::detailedResults);
}
