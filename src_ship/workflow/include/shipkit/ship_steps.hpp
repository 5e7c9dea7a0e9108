#pragma once

#include "workflow_types.hpp"
#include "shipkit/evaluator.hpp"

#include <vector>

namespace shipkit::workflow {

inline constexpr const char* kAssetsStepId = "assets";
inline constexpr const char* kSeoStepId = "seo";
inline constexpr const char* kPerformanceStepId = "performance";
inline constexpr const char* kLaunchChecklistStepId = "launch-checklist";
inline constexpr const char* kDeploymentStepId = "deployment";

/**
 * \brief The five steps of a ship run.
 *
 * The defaults only inspect the project tree; the actual optimisers and
 * deployers are separate tools whose outputs these steps observe. Replace
 * any member to plug in a real collaborator.
 */
struct ShipSteps {
    StepDefinition assets;
    StepDefinition seo;
    StepDefinition performance;
    StepDefinition launch_checklist;
    StepDefinition deployment;
};

[[nodiscard]] StepDefinition asset_step();
[[nodiscard]] StepDefinition seo_step();
[[nodiscard]] StepDefinition performance_step();
[[nodiscard]] StepDefinition launch_checklist_step(readiness::Evaluator evaluator,
                                                   std::vector<readiness::NamedProvider> providers);
[[nodiscard]] StepDefinition deployment_step();

/// Default steps, with the launch checklist running the built-in providers.
[[nodiscard]] ShipSteps default_ship_steps(const readiness::Evaluator::Config& evaluator_config = {});

/**
 * \brief Orders and filters the steps for `config`.
 *
 * Skip flags drop the matching step; the launch checklist is always planned.
 * Deployment is planned only when `skip_deploy` is false and is skipped at run
 * time unless the launch checklist reported the project ready.
 */
[[nodiscard]] std::vector<StepDefinition> plan_ship_workflow(const WorkflowConfig& config, ShipSteps steps);

/// Readiness verdict of the launch-checklist payload among `previous`, if any.
[[nodiscard]] bool reported_ready(const std::vector<WorkflowStep>& previous);

}  // namespace shipkit::workflow
