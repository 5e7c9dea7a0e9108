#include "shipkit/workflow_types.hpp"

#include <stdexcept>
#include <type_traits>
#include <utility>

namespace shipkit::workflow {

const char* to_string(StepStatus status) noexcept {
    switch (status) {
        case StepStatus::pending:   return "pending";
        case StepStatus::running:   return "running";
        case StepStatus::completed: return "completed";
        case StepStatus::failed:    return "failed";
        case StepStatus::skipped:   return "skipped";
    }
    return "pending";
}

std::optional<StepStatus> parse_step_status(std::string_view text) noexcept {
    if (text == "pending") return StepStatus::pending;
    if (text == "running") return StepStatus::running;
    if (text == "completed") return StepStatus::completed;
    if (text == "failed") return StepStatus::failed;
    if (text == "skipped") return StepStatus::skipped;
    return std::nullopt;
}

const char* to_string(RunStatus status) noexcept {
    switch (status) {
        case RunStatus::in_progress: return "in-progress";
        case RunStatus::completed:   return "completed";
        case RunStatus::failed:      return "failed";
        case RunStatus::cancelled:   return "cancelled";
    }
    return "in-progress";
}

std::optional<RunStatus> parse_run_status(std::string_view text) noexcept {
    if (text == "in-progress") return RunStatus::in_progress;
    if (text == "completed") return RunStatus::completed;
    if (text == "failed") return RunStatus::failed;
    if (text == "cancelled") return RunStatus::cancelled;
    return std::nullopt;
}

const char* payload_kind(const StepPayload& payload) noexcept {
    return std::visit(
        [](const auto& value) -> const char* {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, AssetReport>) {
                return "assets";
            } else if constexpr (std::is_same_v<T, SeoReport>) {
                return "seo";
            } else if constexpr (std::is_same_v<T, PerformanceReport>) {
                return "performance";
            } else if constexpr (std::is_same_v<T, readiness::LaunchChecklist>) {
                return "launch-checklist";
            } else if constexpr (std::is_same_v<T, DeploymentReport>) {
                return "deployment";
            } else {
                return "none";
            }
        },
        payload);
}

void WorkflowConfig::validate() const {
    if (target_score < 0 || target_score > 100) {
        throw std::invalid_argument("WorkflowConfig.target_score must lie in 0..100, got " +
                                    std::to_string(target_score));
    }
}

StepOutcome StepOutcome::done(StepPayload payload, std::string note) {
    return StepOutcome{std::move(payload), false, std::move(note)};
}

StepOutcome StepOutcome::skip(StepPayload payload, std::string note) {
    return StepOutcome{std::move(payload), true, std::move(note)};
}

void summarize(WorkflowResult& result) {
    result.summary = WorkflowSummary{};
    result.launch_checklist.reset();
    result.deployment_url.reset();

    for (const auto& step : result.steps) {
        if (const auto* assets = std::get_if<AssetReport>(&step.result)) {
            result.summary.assets_generated = assets->assets_generated;
        } else if (const auto* seo = std::get_if<SeoReport>(&step.result)) {
            result.summary.seo_score = seo->seo_score;
        } else if (const auto* perf = std::get_if<PerformanceReport>(&step.result)) {
            result.summary.performance_score = perf->performance_score;
        } else if (const auto* checklist = std::get_if<readiness::LaunchChecklist>(&step.result)) {
            result.launch_checklist = *checklist;
            result.summary.launch_score = checklist->overall_score;
            result.summary.ready_to_launch = checklist->ready_to_launch;
        } else if (const auto* deploy = std::get_if<DeploymentReport>(&step.result)) {
            result.deployment_url = deploy->url;
        }
    }
}

}  // namespace shipkit::workflow
