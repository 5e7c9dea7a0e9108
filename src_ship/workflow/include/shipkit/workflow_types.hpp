#pragma once

#include "shipkit/checklist.hpp"
#include "shipkit/timestamp.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace shipkit::workflow {

enum class StepStatus {
    pending,
    running,
    completed,
    failed,
    skipped,
};

[[nodiscard]] const char* to_string(StepStatus status) noexcept;
[[nodiscard]] std::optional<StepStatus> parse_step_status(std::string_view text) noexcept;

/// completed, failed and skipped are final within a run.
[[nodiscard]] constexpr bool is_terminal(StepStatus status) noexcept {
    return status == StepStatus::completed || status == StepStatus::failed || status == StepStatus::skipped;
}

enum class RunStatus {
    in_progress,
    completed,
    failed,
    cancelled,
};

[[nodiscard]] const char* to_string(RunStatus status) noexcept;
[[nodiscard]] std::optional<RunStatus> parse_run_status(std::string_view text) noexcept;

// Step payloads, one per step kind.

struct AssetReport {
    int assets_generated{0};
    std::int64_t total_savings{0};

    bool operator==(const AssetReport&) const = default;
};

struct SeoReport {
    int seo_score{0};
    int items_found{0};
    int items_total{0};

    bool operator==(const SeoReport&) const = default;
};

struct PerformanceReport {
    int performance_score{0};
    int images_optimized{0};
    std::int64_t bytes_saved{0};

    bool operator==(const PerformanceReport&) const = default;
};

struct DeploymentReport {
    std::string platform{};
    std::optional<std::string> url{};
    bool production{false};
    bool skipped{false};

    bool operator==(const DeploymentReport&) const = default;
};

/**
 * \brief Result a step hands back to the runner, stored verbatim in WorkflowStep::result.
 *
 * std::monostate means "no payload" (failed steps, steps skipped before running).
 */
using StepPayload = std::variant<std::monostate,
                                 AssetReport,
                                 SeoReport,
                                 PerformanceReport,
                                 readiness::LaunchChecklist,
                                 DeploymentReport>;

[[nodiscard]] const char* payload_kind(const StepPayload& payload) noexcept;

struct WorkflowStep {
    std::string id;
    std::string name;
    std::string description;
    StepStatus status{StepStatus::pending};
    std::optional<Timestamp> start_time{};
    std::optional<Timestamp> end_time{};
    std::optional<std::int64_t> duration_ms{};
    std::optional<std::string> error{};
    StepPayload result{};

    bool operator==(const WorkflowStep&) const = default;
};

/**
 * \brief Parameters of one ship run, handed unchanged to every step.
 */
struct WorkflowConfig {
    bool skip_assets{false};
    bool skip_seo{false};
    bool skip_perf{false};
    bool skip_deploy{true};
    bool auto_fix{true};
    int target_score{90};
    bool production{false};
    std::string deploy_platform{};

    /// Throws std::invalid_argument when target_score lies outside 0..100.
    void validate() const;

    bool operator==(const WorkflowConfig&) const = default;
};

/**
 * \brief What a step returns: a payload, optionally flagged as skipped.
 *
 * A step that decides there is nothing to do returns skip(); throwing marks
 * the step failed.
 */
struct StepOutcome {
    StepPayload payload{};
    bool skipped{false};
    std::string note{};

    [[nodiscard]] static StepOutcome done(StepPayload payload, std::string note = {});
    [[nodiscard]] static StepOutcome skip(StepPayload payload, std::string note = {});
};

using StepFunction =
    std::function<StepOutcome(const std::filesystem::path& project_root, const WorkflowConfig& config)>;

/// Returns a reason when the step must be skipped given the steps recorded so far.
using SkipPredicate = std::function<std::optional<std::string>(const std::vector<WorkflowStep>& previous)>;

struct StepDefinition {
    std::string id;
    std::string name;
    std::string description;
    StepFunction run;
    SkipPredicate skip_if{};
};

struct WorkflowSummary {
    int assets_generated{0};
    int seo_score{0};
    int performance_score{0};
    int launch_score{0};
    bool ready_to_launch{false};

    bool operator==(const WorkflowSummary&) const = default;
};

struct WorkflowResult {
    std::vector<WorkflowStep> steps;
    bool overall_success{false};
    std::int64_t total_duration_ms{0};
    std::optional<readiness::LaunchChecklist> launch_checklist{};
    std::optional<std::string> deployment_url{};
    WorkflowSummary summary{};
};

/**
 * \brief Derives the summary and the checklist / deployment shortcuts from step payloads.
 *
 * Payloads are matched by kind, so a plan without (say) the asset step still
 * reads the right figures.
 */
void summarize(WorkflowResult& result);

/**
 * \brief Durable progress record of one run.
 *
 * `current_step` counts the terminal entries of `steps`.
 */
struct WorkflowState {
    std::string id;
    std::filesystem::path project_root;
    Timestamp start_time{};
    Timestamp last_update{};
    RunStatus status{RunStatus::in_progress};
    int current_step{0};
    int total_steps{0};
    std::vector<WorkflowStep> steps;
    WorkflowConfig config{};

    bool operator==(const WorkflowState&) const = default;
};

struct StepSummary {
    std::string id;
    std::string name;
    StepStatus status{StepStatus::pending};
    std::optional<std::int64_t> duration_ms{};

    bool operator==(const StepSummary&) const = default;
};

/// One line of the run history.
struct HistoryEntry {
    Timestamp timestamp{};
    std::int64_t duration_ms{0};
    bool success{false};
    WorkflowSummary summary{};
    std::vector<StepSummary> steps;

    bool operator==(const HistoryEntry&) const = default;
};

}  // namespace shipkit::workflow
