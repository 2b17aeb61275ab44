#pragma once

#include "simulation/run_types.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace linksim {

// ─── SimulationStore ──────────────────────────────────────────
// Persistence seen from the core. Every call is atomic on its own.
// Unknown projects raise ValidationError.

class SimulationStore {
public:
    virtual ~SimulationStore() = default;

    virtual std::vector<Page> getPages(const std::string& project_id) = 0;
    virtual std::vector<Edge> getEdges(const std::string& project_id) = 0;

    /// Replace baseline scores in one batch.
    virtual void bulkUpdateScores(const std::string& project_id,
                                  const std::vector<PageScore>& scores) = 0;

    /// Store a new run record and return its id.
    virtual RunId createRun(const SimulationRun& run) = 0;
    virtual void saveRunResults(RunId run_id, const std::vector<PageResult>& results) = 0;
    virtual void updateRunStatus(RunId run_id, RunStatus status,
                                 const std::string& error = "") = 0;
    virtual std::optional<SimulationRun> getRun(RunId run_id) = 0;
};

/// Thread-safe store backed by process memory.
class InMemoryStore : public SimulationStore {
public:
    void addProject(const std::string& project_id,
                    std::vector<Page> pages, std::vector<Edge> edges);
    bool hasProject(const std::string& project_id) const;

    std::vector<Page> getPages(const std::string& project_id) override;
    std::vector<Edge> getEdges(const std::string& project_id) override;
    void bulkUpdateScores(const std::string& project_id,
                          const std::vector<PageScore>& scores) override;

    RunId createRun(const SimulationRun& run) override;
    void saveRunResults(RunId run_id, const std::vector<PageResult>& results) override;
    void updateRunStatus(RunId run_id, RunStatus status, const std::string& error = "") override;
    std::optional<SimulationRun> getRun(RunId run_id) override;

    std::vector<SimulationRun> listRuns(const std::string& project_id) const;
    size_t scoreBatches() const;

private:
    struct Project {
        std::vector<Page> pages;
        std::vector<Edge> edges;
    };

    const Project& requireProject(const std::string& project_id) const;
    SimulationRun& requireRun(RunId run_id);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Project> projects_;
    std::map<RunId, SimulationRun> runs_;
    RunId next_run_id_ = 1;
    size_t score_batches_ = 0;
};

} // namespace linksim
