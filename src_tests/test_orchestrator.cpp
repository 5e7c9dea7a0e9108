/**
 * @file test_orchestrator.cpp
 * @brief End-to-end ship runs: persistence, resume, history and deployment gating.
 *
 * @author shipkit contributors
 * @date 2026
 * @copyright MIT License
 */

// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 shipkit contributors

#include <catch2/catch.hpp>

#include "shipkit/orchestrator.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <chrono>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using shipkit::testing::CollectingSink;
using shipkit::testing::ManualClock;
using shipkit::testing::TempProject;
using shipkit::workflow::Orchestrator;
using shipkit::workflow::PlanFactory;
using shipkit::workflow::RunStatus;
using shipkit::workflow::StateStore;
using shipkit::workflow::StepDefinition;
using shipkit::workflow::StepOutcome;
using shipkit::workflow::StepStatus;
using shipkit::workflow::WorkflowConfig;
using shipkit::workflow::WorkflowResult;
using shipkit::workflow::WorkflowStep;

namespace {

using CallLog = std::shared_ptr<std::map<std::string, int>>;

/// Three counting steps; `failing` names one that throws.
PlanFactory counting_plan(CallLog calls, std::string failing = {}) {
    return [calls, failing](const WorkflowConfig&) {
        std::vector<StepDefinition> plan;
        for (const char* id : {"a", "b", "c"}) {
            StepDefinition step;
            step.id = id;
            step.name = std::string("Step ") + id;
            step.run = [calls, failing, name = std::string(id)](const std::filesystem::path&, const WorkflowConfig&) {
                ++(*calls)[name];
                if (name == failing) {
                    throw std::runtime_error(name + " failed");
                }
                return StepOutcome::done(shipkit::workflow::SeoReport{60, 3, 5});
            };
            plan.push_back(std::move(step));
        }
        return plan;
    };
}

Orchestrator::Config base_config(const TempProject& project, const ManualClock& clock) {
    Orchestrator::Config config;
    config.project_root = project.root();
    config.clock = clock.fn();
    return config;
}

const WorkflowStep* find_step(const WorkflowResult& result, const std::string& id) {
    const auto it = std::find_if(result.steps.begin(), result.steps.end(),
                                 [&](const WorkflowStep& step) { return step.id == id; });
    return it == result.steps.end() ? nullptr : &*it;
}

void make_launchable_next_app(const TempProject& project) {
    project.write("package.json", R"({"dependencies": {"next": "14.1.0"}})");
    project.write("app/layout.tsx", "export const metadata = { description: 'shop' };");
    project.write("app/sitemap.ts", "export default function sitemap() { return []; }");
    project.write("public/favicon.ico");
    project.write("public/og-image.png");
    project.write("public/robots.txt", "User-agent: *");
    project.write(".gitignore", ".env\n");
    project.mkdir(".next");
}

}  // namespace

TEST_CASE("a fresh run persists state and history", "[orchestrator]") {
    TempProject project;
    ManualClock clock;
    auto calls = std::make_shared<std::map<std::string, int>>();

    Orchestrator orchestrator(base_config(project, clock), counting_plan(calls));
    const auto result = orchestrator.run();

    REQUIRE(result.overall_success);
    REQUIRE(result.steps.size() == 3);
    REQUIRE(result.summary.seo_score == 60);
    REQUIRE((*calls)["a"] == 1);
    REQUIRE((*calls)["c"] == 1);
    REQUIRE_FALSE(orchestrator.resumed());

    REQUIRE(orchestrator.state().has_value());
    REQUIRE(orchestrator.state()->status == RunStatus::completed);
    REQUIRE(orchestrator.state()->current_step == 3);

    const StateStore store(StateStore::Config{.project_root = project.root(), .clock = clock.fn()});
    const auto persisted = store.load();
    REQUIRE(persisted.has_value());
    REQUIRE(persisted->status == RunStatus::completed);
    REQUIRE(persisted->steps.size() == 3);
    REQUIRE_FALSE(store.can_resume(*persisted));

    const auto history = store.load_history();
    REQUIRE(history.size() == 1);
    REQUIRE(history.front().success);
    REQUIRE(history.front().steps.size() == 3);
}

TEST_CASE("a failing step marks the run failed and keeps going", "[orchestrator]") {
    TempProject project;
    ManualClock clock;
    auto calls = std::make_shared<std::map<std::string, int>>();

    Orchestrator orchestrator(base_config(project, clock), counting_plan(calls, "b"));
    const auto result = orchestrator.run();

    REQUIRE_FALSE(result.overall_success);
    REQUIRE((*calls)["c"] == 1);
    REQUIRE(find_step(result, "b")->status == StepStatus::failed);
    REQUIRE(orchestrator.state()->status == RunStatus::failed);

    const StateStore store(StateStore::Config{.project_root = project.root()});
    const auto history = store.load_history();
    REQUIRE(history.size() == 1);
    REQUIRE_FALSE(history.front().success);
}

TEST_CASE("resume continues an interrupted run", "[orchestrator][resume]") {
    TempProject project;
    ManualClock clock;
    auto calls = std::make_shared<std::map<std::string, int>>();

    // A run that finished step "a" and died while "b" was running.
    const StateStore store(StateStore::Config{.project_root = project.root(), .clock = clock.fn()});
    auto interrupted = store.create(3, WorkflowConfig{});
    WorkflowStep a;
    a.id = "a";
    a.name = "Step a";
    a.status = StepStatus::completed;
    a.duration_ms = 5;
    a.result = shipkit::workflow::AssetReport{4, 0};
    interrupted = store.update(interrupted, a);
    WorkflowStep b;
    b.id = "b";
    b.name = "Step b";
    b.status = StepStatus::running;
    interrupted = store.update(interrupted, b);
    REQUIRE(store.save(interrupted));

    clock.advance(std::chrono::hours{2});

    auto config = base_config(project, clock);
    config.resume = true;

    SECTION("within the window") {
        Orchestrator orchestrator(config, counting_plan(calls));
        const auto result = orchestrator.run();

        REQUIRE(orchestrator.resumed());
        REQUIRE(orchestrator.state()->id == interrupted.id);
        REQUIRE(calls->count("a") == 0);
        REQUIRE((*calls)["b"] == 1);
        REQUIRE((*calls)["c"] == 1);
        REQUIRE(result.steps.size() == 3);
        REQUIRE(find_step(result, "a")->duration_ms == 5);
        REQUIRE(result.summary.assets_generated == 4);
        REQUIRE(orchestrator.state()->status == RunStatus::completed);
    }

    SECTION("stale state starts over") {
        clock.advance(std::chrono::hours{23});
        Orchestrator orchestrator(config, counting_plan(calls));
        const auto result = orchestrator.run();

        REQUIRE_FALSE(orchestrator.resumed());
        REQUIRE(orchestrator.state()->id != interrupted.id);
        REQUIRE((*calls)["a"] == 1);
    }

    SECTION("plan of a different size starts over") {
        auto grown = store.create(4, WorkflowConfig{});
        grown.steps = interrupted.steps;
        grown.current_step = 1;
        REQUIRE(store.save(grown));

        Orchestrator orchestrator(config, counting_plan(calls));
        (void)orchestrator.run();
        REQUIRE_FALSE(orchestrator.resumed());
        REQUIRE((*calls)["a"] == 1);
    }
}

TEST_CASE("a step error with invalid UTF-8 still yields a persisted result", "[orchestrator][state]") {
    TempProject project;
    ManualClock clock;
    CollectingSink sink;

    PlanFactory plan = [](const WorkflowConfig&) {
        StepDefinition ok;
        ok.id = "a";
        ok.name = "Step a";
        ok.run = [](const std::filesystem::path&, const WorkflowConfig&) {
            return StepOutcome::done(shipkit::workflow::SeoReport{60, 3, 5});
        };
        StepDefinition latin1 = ok;
        latin1.id = "b";
        latin1.name = "Step b";
        latin1.run = [](const std::filesystem::path&, const WorkflowConfig&) -> StepOutcome {
            throw std::runtime_error("cannot read caf\xe9.png");
        };
        StepDefinition last = ok;
        last.id = "c";
        last.name = "Step c";
        return std::vector<StepDefinition>{ok, latin1, last};
    };

    auto config = base_config(project, clock);
    config.sink = sink.fn();
    Orchestrator orchestrator(config, plan);

    WorkflowResult result;
    REQUIRE_NOTHROW(result = orchestrator.run());
    REQUIRE(result.steps.size() == 3);
    REQUIRE(find_step(result, "b")->status == StepStatus::failed);
    REQUIRE(find_step(result, "c")->status == StepStatus::completed);

    const StateStore store(StateStore::Config{.project_root = project.root(), .clock = clock.fn()});
    const auto persisted = store.load();
    REQUIRE(persisted.has_value());
    REQUIRE(persisted->status == RunStatus::failed);
    REQUIRE(persisted->steps.size() == 3);
    REQUIRE(store.load_history().size() == 1);
}

TEST_CASE("a persisted state with an invalid configuration is not resumed", "[orchestrator][resume]") {
    TempProject project;
    ManualClock clock;
    CollectingSink sink;
    auto calls = std::make_shared<std::map<std::string, int>>();

    const StateStore store(StateStore::Config{.project_root = project.root(), .clock = clock.fn()});
    WorkflowConfig corrupt;
    corrupt.target_score = 500;
    REQUIRE(store.save(store.create(3, corrupt)));

    auto config = base_config(project, clock);
    config.resume = true;
    config.sink = sink.fn();
    Orchestrator orchestrator(config, counting_plan(calls));

    WorkflowResult result;
    REQUIRE_NOTHROW(result = orchestrator.run());
    REQUIRE(result.overall_success);
    REQUIRE_FALSE(orchestrator.resumed());
    REQUIRE((*calls)["a"] == 1);
    REQUIRE(orchestrator.state()->config.target_score == 90);
    REQUIRE(sink.contains(shipkit::Severity::warn, "orchestrator"));
}

TEST_CASE("resume without state starts fresh", "[orchestrator][resume]") {
    TempProject project;
    ManualClock clock;
    CollectingSink sink;
    auto calls = std::make_shared<std::map<std::string, int>>();

    auto config = base_config(project, clock);
    config.resume = true;
    config.sink = sink.fn();

    Orchestrator orchestrator(config, counting_plan(calls));
    const auto result = orchestrator.run();
    REQUIRE(result.overall_success);
    REQUIRE_FALSE(orchestrator.resumed());
    REQUIRE(sink.contains(shipkit::Severity::info, "orchestrator"));
}

TEST_CASE("default pipeline on an empty project", "[orchestrator][pipeline]") {
    TempProject project;
    ManualClock clock;

    auto config = base_config(project, clock);
    config.workflow.skip_deploy = false;

    Orchestrator orchestrator(config, shipkit::workflow::default_plan_factory());
    const auto result = orchestrator.run();

    REQUIRE(result.steps.size() == 5);
    REQUIRE(result.steps[0].id == "assets");
    REQUIRE(result.steps[0].status == StepStatus::skipped);
    REQUIRE(result.steps[1].id == "seo");
    REQUIRE(result.steps[2].id == "performance");
    REQUIRE(result.steps[3].id == "launch-checklist");
    REQUIRE(result.launch_checklist.has_value());
    REQUIRE_FALSE(result.summary.ready_to_launch);
    REQUIRE(result.summary.performance_score == 70);
    REQUIRE(result.summary.seo_score == 0);

    const auto& deploy = result.steps[4];
    REQUIRE(deploy.id == "deployment");
    REQUIRE(deploy.status == StepStatus::skipped);
    REQUIRE(std::holds_alternative<std::monostate>(deploy.result));
    REQUIRE(result.overall_success);
}

TEST_CASE("default pipeline honours skip flags", "[orchestrator][pipeline]") {
    TempProject project;
    ManualClock clock;

    auto config = base_config(project, clock);
    config.workflow.skip_assets = true;
    config.workflow.skip_perf = true;

    Orchestrator orchestrator(config, shipkit::workflow::default_plan_factory());
    const auto result = orchestrator.run();

    REQUIRE(result.steps.size() == 2);
    REQUIRE(result.steps[0].id == "seo");
    REQUIRE(result.steps[1].id == "launch-checklist");
    REQUIRE(orchestrator.state()->total_steps == 2);
    REQUIRE(orchestrator.state()->config.skip_perf);
}

TEST_CASE("deployment runs once the project is ready", "[orchestrator][pipeline]") {
    TempProject project;
    make_launchable_next_app(project);
    ManualClock clock;

    auto config = base_config(project, clock);
    config.workflow.skip_deploy = false;
    config.workflow.deploy_platform = "vercel";
    config.workflow.production = true;

    Orchestrator orchestrator(config, shipkit::workflow::default_plan_factory());
    const auto result = orchestrator.run();

    REQUIRE(result.summary.ready_to_launch);
    const auto* deploy = find_step(result, "deployment");
    REQUIRE(deploy != nullptr);
    REQUIRE(deploy->status == StepStatus::skipped);
    const auto* report = std::get_if<shipkit::workflow::DeploymentReport>(&deploy->result);
    REQUIRE(report != nullptr);
    REQUIRE(report->platform == "vercel");
    REQUIRE(report->production);
    REQUIRE_FALSE(result.deployment_url.has_value());
}

TEST_CASE("an invalid configuration is rejected", "[orchestrator][config]") {
    TempProject project;
    ManualClock clock;
    auto calls = std::make_shared<std::map<std::string, int>>();

    auto config = base_config(project, clock);
    config.workflow.target_score = -5;
    Orchestrator orchestrator(config, counting_plan(calls));
    REQUIRE_THROWS_AS(orchestrator.run(), std::invalid_argument);
    REQUIRE(calls->empty());
    REQUIRE_FALSE(std::filesystem::exists(project.root() / ".ship-toolkit" / "workflow-state.json"));
}
