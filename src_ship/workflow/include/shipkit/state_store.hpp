#pragma once

#include "workflow_types.hpp"
#include "shipkit/diagnostics.hpp"
#include "shipkit/timestamp.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace shipkit::workflow {

inline constexpr const char* kStateFileName = "workflow-state.json";
inline constexpr const char* kHistoryFileName = "workflow-history.json";
inline constexpr std::size_t kHistoryLimit = 10;
inline constexpr std::chrono::hours kResumeWindow{24};

/**
 * \brief Durable progress and history of ship runs for one project.
 *
 * Files live under `<project>/.ship-toolkit/`:
 *   - `workflow-state.json`: the latest WorkflowState, overwritten on every save.
 *   - `workflow-history.json`: array of HistoryEntry, newest first, at most 10.
 *
 * Persistence is best effort. Reads of a missing or corrupt file degrade to
 * "no state" / "no history" and writes report failure through the return
 * value; all of them raise a diagnostic on the configured sink and none of
 * them throw. There is no locking: one run per project at a time.
 */
class StateStore {
public:
    struct Config {
        std::filesystem::path project_root{};
        DiagnosticSink sink{};
        ClockFn clock{};
    };

    explicit StateStore(Config config);

    [[nodiscard]] std::filesystem::path state_path() const;
    [[nodiscard]] std::filesystem::path history_path() const;

    /// New in-progress run; throws std::invalid_argument when `total_steps` is not positive.
    [[nodiscard]] WorkflowState create(int total_steps, const WorkflowConfig& config) const;

    /**
     * \brief Upserts `step` by id and recomputes progress.
     *
     * `current_step` becomes the number of terminal steps. Once it reaches
     * `total_steps` the run is `failed` if any step failed, `completed`
     * otherwise. `last_update` is always refreshed.
     */
    [[nodiscard]] WorkflowState update(WorkflowState state, const WorkflowStep& step) const;

    /// Overwrites the state file with `state`.
    bool save(const WorkflowState& state) const;

    [[nodiscard]] std::optional<WorkflowState> load() const;

    /// In progress, not finished, and touched less than 24 hours ago.
    [[nodiscard]] bool can_resume(const WorkflowState& state) const;

    /// Removes the state file if present.
    bool clear() const;

    /// Prepends a summary of `result`, keeps the newest kHistoryLimit entries.
    bool append_to_history(const WorkflowResult& result) const;

    [[nodiscard]] std::vector<HistoryEntry> load_history() const;

private:
    Config config_;
};

[[nodiscard]] bool can_resume(const WorkflowState& state, Timestamp now);

/// Index of the first step a resumed run still has to execute.
[[nodiscard]] inline int next_step(const WorkflowState& state) noexcept { return state.current_step; }

[[nodiscard]] HistoryEntry make_history_entry(const WorkflowResult& result, Timestamp when);

[[nodiscard]] std::string generate_workflow_id(Timestamp when);

}  // namespace shipkit::workflow
