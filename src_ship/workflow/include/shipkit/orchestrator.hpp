#pragma once

#include "ship_steps.hpp"
#include "state_store.hpp"
#include "step_runner.hpp"
#include "workflow_types.hpp"
#include "shipkit/diagnostics.hpp"
#include "shipkit/timestamp.hpp"

#include <filesystem>
#include <functional>
#include <optional>
#include <vector>

namespace shipkit::workflow {

/// Builds the step plan for a run configuration.
using PlanFactory = std::function<std::vector<StepDefinition>(const WorkflowConfig& config)>;

/**
 * \brief Runs a ship workflow with persistence, resume and history.
 *
 * A fresh run creates a WorkflowState sized to the plan and saves it. With
 * `resume` set, the persisted state is loaded and, if StateStore::can_resume()
 * accepts it, the plan is rebuilt from the persisted configuration and the
 * recorded terminal steps are carried over instead of executed again.
 *
 * State is updated and saved after every executed step. Once every step is
 * terminal the run is appended to the history; the final state file stays in
 * place for auditing and is no longer resumable.
 */
class Orchestrator {
public:
    struct Config {
        std::filesystem::path project_root{};
        WorkflowConfig workflow{};
        bool resume{false};
        DiagnosticSink sink{};
        ClockFn clock{};
        StepRunner::StepHook on_step_started{};
        StepRunner::StepHook on_step_finished{};
    };

    Orchestrator(Config config, PlanFactory plan_factory);

    /**
     * \brief Executes the workflow.
     *
     * Always returns a result once the plan is valid; step failures are
     * recorded in it. Configuration errors throw std::invalid_argument.
     */
    [[nodiscard]] WorkflowResult run();

    /// State after the last run(); empty before.
    [[nodiscard]] const std::optional<WorkflowState>& state() const noexcept { return state_; }

    /// True when the last run() continued a persisted state.
    [[nodiscard]] bool resumed() const noexcept { return resumed_; }

private:
    [[nodiscard]] std::optional<WorkflowState> resumable_state(const StateStore& store) const;

    Config config_;
    PlanFactory plan_factory_;
    std::optional<WorkflowState> state_;
    bool resumed_{false};
};

/// Default plan: plan_ship_workflow() over default_ship_steps().
[[nodiscard]] PlanFactory default_plan_factory(const readiness::Evaluator::Config& evaluator_config = {});

/// Convenience wrapper running the default plan.
[[nodiscard]] WorkflowResult run_complete_workflow(const std::filesystem::path& project_root,
                                                   const WorkflowConfig& config = {},
                                                   const DiagnosticSink& sink = {});

}  // namespace shipkit::workflow
