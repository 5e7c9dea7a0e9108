#include "shipkit/ship_steps.hpp"
#include "shipkit/builtin_providers.hpp"
#include "shipkit/framework.hpp"
#include "shipkit/project_files.hpp"

#include <memory>
#include <string>
#include <utility>

namespace fs = std::filesystem;

namespace {

using shipkit::readiness::Framework;
using shipkit::readiness::ProjectFiles;

constexpr const char* kImagePattern = "*.{png,jpg,jpeg,webp,avif,svg,ico}";

}  // namespace

namespace shipkit::workflow {

StepDefinition asset_step() {
    StepDefinition step;
    step.id = kAssetsStepId;
    step.name = "Asset Generation";
    step.description = "Generate favicons, OG images, and PWA icons";
    step.run = [](const fs::path& project_root, const WorkflowConfig&) {
        const ProjectFiles files(project_root);
        const auto images = static_cast<int>(files.count("public", kImagePattern, true));
        if (images == 0) {
            return StepOutcome::skip(AssetReport{}, "no assets found, run /ship-assets to generate them");
        }
        return StepOutcome::done(AssetReport{images, 0}, std::to_string(images) + " asset image(s) present");
    };
    return step;
}

StepDefinition seo_step() {
    StepDefinition step;
    step.id = kSeoStepId;
    step.name = "SEO Optimization";
    step.description = "Optimize meta tags, sitemap, and robots.txt";
    step.run = [](const fs::path& project_root, const WorkflowConfig&) {
        const ProjectFiles files(project_root);
        const auto detection = readiness::detect_framework(project_root);

        SeoReport report;
        report.items_total = 4;
        auto tally = [&report](bool present) {
            if (present) {
                ++report.items_found;
                report.seo_score += 25;
            }
        };

        tally(detection.framework == Framework::next_app ? files.exists("app/sitemap.ts")
                                                         : files.exists("public/sitemap.xml"));
        tally(files.exists("public/robots.txt"));
        tally(files.exists("public/manifest.json"));
        tally(detection.framework == Framework::next_app && files.exists("app/layout.tsx"));

        return StepOutcome::done(report, std::to_string(report.items_found) + "/4 SEO items configured");
    };
    return step;
}

StepDefinition performance_step() {
    StepDefinition step;
    step.id = kPerformanceStepId;
    step.name = "Performance Optimization";
    step.description = "Optimize images, bundle, and configuration";
    step.run = [](const fs::path& project_root, const WorkflowConfig&) {
        const ProjectFiles files(project_root);

        PerformanceReport report;
        report.images_optimized = static_cast<int>(files.count("public", "*.{webp,avif}", true));
        report.performance_score = 70;
        if (report.images_optimized > 0) {
            report.performance_score += 10;
        }
        if (files.any_exists({".next", "dist", "build"})) {
            report.performance_score += 10;
        }
        return StepOutcome::done(report, "estimated performance score " +
                                             std::to_string(report.performance_score) + "/100");
    };
    return step;
}

StepDefinition launch_checklist_step(readiness::Evaluator evaluator,
                                     std::vector<readiness::NamedProvider> providers) {
    StepDefinition step;
    step.id = kLaunchChecklistStepId;
    step.name = "Launch Checklist";
    step.description = "Validate project readiness for launch";

    auto shared_evaluator = std::make_shared<const readiness::Evaluator>(std::move(evaluator));
    auto shared_providers = std::make_shared<const std::vector<readiness::NamedProvider>>(std::move(providers));
    step.run = [shared_evaluator, shared_providers](const fs::path& project_root, const WorkflowConfig&) {
        auto checklist = shared_evaluator->run(*shared_providers, project_root);
        const auto note = "launch score " + std::to_string(checklist.overall_score) + "/100, " +
                          (checklist.ready_to_launch ? "ready" : "not ready");
        return StepOutcome::done(std::move(checklist), note);
    };
    return step;
}

StepDefinition deployment_step() {
    StepDefinition step;
    step.id = kDeploymentStepId;
    step.name = "Deployment";
    step.description = "Deploy to the configured platform";
    step.run = [](const fs::path&, const WorkflowConfig& config) {
        DeploymentReport report;
        report.platform = config.deploy_platform.empty() ? "manual" : config.deploy_platform;
        report.production = config.production;
        report.skipped = true;
        return StepOutcome::skip(report, std::string("deploy with the ") + report.platform +
                                             (config.production ? " production" : " preview") +
                                             " pipeline, then run /ship-deploy to record it");
    };
    return step;
}

ShipSteps default_ship_steps(const readiness::Evaluator::Config& evaluator_config) {
    return ShipSteps{
        asset_step(),
        seo_step(),
        performance_step(),
        launch_checklist_step(readiness::Evaluator(evaluator_config), readiness::default_providers()),
        deployment_step(),
    };
}

bool reported_ready(const std::vector<WorkflowStep>& previous) {
    for (const auto& step : previous) {
        if (const auto* checklist = std::get_if<readiness::LaunchChecklist>(&step.result)) {
            return checklist->ready_to_launch;
        }
    }
    return false;
}

std::vector<StepDefinition> plan_ship_workflow(const WorkflowConfig& config, ShipSteps steps) {
    std::vector<StepDefinition> plan;
    if (!config.skip_assets) {
        plan.push_back(std::move(steps.assets));
    }
    if (!config.skip_seo) {
        plan.push_back(std::move(steps.seo));
    }
    if (!config.skip_perf) {
        plan.push_back(std::move(steps.performance));
    }
    plan.push_back(std::move(steps.launch_checklist));
    if (!config.skip_deploy) {
        auto deploy = std::move(steps.deployment);
        deploy.skip_if = [](const std::vector<WorkflowStep>& previous) -> std::optional<std::string> {
            if (reported_ready(previous)) {
                return std::nullopt;
            }
            return std::string("launch checklist did not report the project ready");
        };
        plan.push_back(std::move(deploy));
    }
    return plan;
}

}  // namespace shipkit::workflow
