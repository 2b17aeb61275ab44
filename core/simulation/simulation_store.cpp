#include "simulation/simulation_store.hpp"
#include "common/errors.hpp"

#include <spdlog/spdlog.h>

#include <unordered_set>

namespace linksim {

std::string toString(RunStatus status) {
    switch (status) {
        case RunStatus::Pending:   return "pending";
        case RunStatus::Running:   return "running";
        case RunStatus::Completed: return "completed";
        case RunStatus::Failed:    return "failed";
    }
    return "pending";
}

void InMemoryStore::addProject(const std::string& project_id,
                               std::vector<Page> pages, std::vector<Edge> edges) {
    std::lock_guard<std::mutex> lock(mutex_);
    projects_[project_id] = Project{std::move(pages), std::move(edges)};
}

bool InMemoryStore::hasProject(const std::string& project_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return projects_.count(project_id) > 0;
}

const InMemoryStore::Project& InMemoryStore::requireProject(const std::string& project_id) const {
    auto it = projects_.find(project_id);
    if (it == projects_.end()) {
        throw ValidationError("Unknown project: " + project_id);
    }
    return it->second;
}

SimulationRun& InMemoryStore::requireRun(RunId run_id) {
    auto it = runs_.find(run_id);
    if (it == runs_.end()) {
        throw ValidationError("Unknown run: " + std::to_string(run_id));
    }
    return it->second;
}

std::vector<Page> InMemoryStore::getPages(const std::string& project_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return requireProject(project_id).pages;
}

std::vector<Edge> InMemoryStore::getEdges(const std::string& project_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return requireProject(project_id).edges;
}

void InMemoryStore::bulkUpdateScores(const std::string& project_id,
                                     const std::vector<PageScore>& scores) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = projects_.find(project_id);
    if (it == projects_.end()) {
        throw ValidationError("Unknown project: " + project_id);
    }
    std::unordered_map<PageId, double> by_id;
    by_id.reserve(scores.size());
    for (const PageScore& s : scores) by_id[s.page_id] = s.score;

    // Validate the whole batch before touching any page.
    std::unordered_set<PageId> known;
    for (const Page& p : it->second.pages) known.insert(p.id);
    for (const PageScore& s : scores) {
        if (!known.count(s.page_id)) {
            throw ValidationError("Score update for unknown page " + std::to_string(s.page_id));
        }
    }
    for (Page& p : it->second.pages) {
        auto s = by_id.find(p.id);
        if (s != by_id.end()) p.baseline_score = s->second;
    }
    score_batches_++;
    spdlog::debug("Store: updated {} scores for project {}", scores.size(), project_id);
}

RunId InMemoryStore::createRun(const SimulationRun& run) {
    std::lock_guard<std::mutex> lock(mutex_);
    RunId id = next_run_id_++;
    SimulationRun stored = run;
    stored.id = id;
    runs_.emplace(id, std::move(stored));
    return id;
}

void InMemoryStore::saveRunResults(RunId run_id, const std::vector<PageResult>& results) {
    std::lock_guard<std::mutex> lock(mutex_);
    requireRun(run_id).results = results;
}

void InMemoryStore::updateRunStatus(RunId run_id, RunStatus status, const std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    SimulationRun& run = requireRun(run_id);
    run.status = status;
    run.error = error;
}

std::optional<SimulationRun> InMemoryStore::getRun(RunId run_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = runs_.find(run_id);
    if (it == runs_.end()) return std::nullopt;
    return it->second;
}

std::vector<SimulationRun> InMemoryStore::listRuns(const std::string& project_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SimulationRun> out;
    for (const auto& [id, run] : runs_) {
        if (run.project_id == project_id) out.push_back(run);
    }
    return out;
}

size_t InMemoryStore::scoreBatches() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return score_batches_;
}

} // namespace linksim
