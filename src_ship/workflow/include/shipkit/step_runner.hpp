#pragma once

#include "workflow_types.hpp"
#include "shipkit/diagnostics.hpp"
#include "shipkit/timestamp.hpp"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <vector>

namespace shipkit::workflow {

/**
 * \brief Executes step definitions sequentially, recording status and timing.
 *
 * Each step moves pending -> running -> completed | failed | skipped. A step
 * that throws is recorded as failed and the run continues with the next one;
 * `overall_success` is true only when every step completed or was skipped.
 * A step whose `skip_if` predicate returns a reason goes straight to skipped
 * without being invoked.
 *
 * The runner does no I/O of its own. Persistence hangs off the hooks, which
 * fire synchronously around every executed step.
 */
class StepRunner {
public:
    using StepHook = std::function<void(const WorkflowStep& step, std::size_t index, std::size_t total)>;

    struct Config {
        ClockFn clock{};
        DiagnosticSink sink{};
        StepHook on_step_started{};
        StepHook on_step_finished{};
    };

    StepRunner();
    explicit StepRunner(Config config);

    /**
     * \brief Runs `steps` in order.
     *
     * Entries of `carried_over` with a terminal status are reused as-is for the
     * step with the same id instead of executing it again (resume).
     *
     * Throws std::invalid_argument for an empty plan, an empty or duplicate
     * step id, a step without a function, or an invalid `config`.
     */
    [[nodiscard]] WorkflowResult run(const std::vector<StepDefinition>& steps,
                                     const std::filesystem::path& project_root,
                                     const WorkflowConfig& config,
                                     const std::vector<WorkflowStep>& carried_over = {}) const;

private:
    [[nodiscard]] WorkflowStep execute(const StepDefinition& definition,
                                       const std::filesystem::path& project_root,
                                       const WorkflowConfig& config,
                                       const std::vector<WorkflowStep>& previous,
                                       std::size_t index,
                                       std::size_t total) const;

    Config config_;
};

/// Throws std::invalid_argument describing the first problem found in `steps`.
void validate_plan(const std::vector<StepDefinition>& steps);

}  // namespace shipkit::workflow
