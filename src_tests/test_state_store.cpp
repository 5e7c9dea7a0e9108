/**
 * @file test_state_store.cpp
 * @brief Persistence of workflow state and history under `.ship-toolkit/`.
 *
 * @author shipkit contributors
 * @date 2026
 * @copyright MIT License
 */

// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 shipkit contributors

#include <catch2/catch.hpp>

#include "shipkit/state_store.hpp"
#include "shipkit/workflow_json.hpp"
#include "test_support.hpp"

#include <chrono>
#include <filesystem>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

using shipkit::testing::CollectingSink;
using shipkit::testing::ManualClock;
using shipkit::testing::TempProject;
using shipkit::workflow::RunStatus;
using shipkit::workflow::StateStore;
using shipkit::workflow::StepStatus;
using shipkit::workflow::WorkflowConfig;
using shipkit::workflow::WorkflowResult;
using shipkit::workflow::WorkflowStep;

namespace {

WorkflowStep step(const std::string& id, StepStatus status) {
    WorkflowStep out;
    out.id = id;
    out.name = "Step " + id;
    out.description = "desc";
    out.status = status;
    return out;
}

WorkflowResult result_with_score(int launch_score) {
    WorkflowResult result;
    result.steps.push_back(step("launch-checklist", StepStatus::completed));
    result.steps.back().duration_ms = 42;
    result.overall_success = true;
    result.total_duration_ms = 1000 + launch_score;
    result.summary.launch_score = launch_score;
    return result;
}

}  // namespace

TEST_CASE("create starts an in-progress run", "[state]") {
    TempProject project;
    ManualClock clock;
    const StateStore store(StateStore::Config{.project_root = project.root(), .clock = clock.fn()});

    WorkflowConfig config;
    config.skip_seo = true;
    const auto state = store.create(3, config);

    REQUIRE(state.id.rfind("workflow-" + std::to_string(clock.now().time_since_epoch().count()) + "-", 0) == 0);
    REQUIRE(state.id.size() == std::string("workflow-").size() + 13 + 1 + 9);
    REQUIRE(state.status == RunStatus::in_progress);
    REQUIRE(state.current_step == 0);
    REQUIRE(state.total_steps == 3);
    REQUIRE(state.start_time == clock.now());
    REQUIRE(state.config == config);
    REQUIRE(state.project_root == project.root());

    REQUIRE_THROWS_AS(store.create(0, config), std::invalid_argument);
}

TEST_CASE("update upserts steps and finishes the run", "[state]") {
    TempProject project;
    ManualClock clock;
    const StateStore store(StateStore::Config{.project_root = project.root(), .clock = clock.fn()});

    auto state = store.create(2, WorkflowConfig{});

    state = store.update(state, step("a", StepStatus::running));
    REQUIRE(state.steps.size() == 1);
    REQUIRE(state.current_step == 0);
    REQUIRE(state.status == RunStatus::in_progress);

    clock.advance(std::chrono::seconds{3});
    state = store.update(state, step("a", StepStatus::completed));
    REQUIRE(state.steps.size() == 1);
    REQUIRE(state.current_step == 1);
    REQUIRE(state.last_update == clock.now());

    SECTION("all completed") {
        state = store.update(state, step("b", StepStatus::skipped));
        REQUIRE(state.current_step == 2);
        REQUIRE(state.status == RunStatus::completed);
    }

    SECTION("one failed") {
        state = store.update(state, step("b", StepStatus::failed));
        REQUIRE(state.status == RunStatus::failed);
    }
}

TEST_CASE("state survives save and load", "[state]") {
    TempProject project;
    ManualClock clock;
    const StateStore store(StateStore::Config{.project_root = project.root(), .clock = clock.fn()});

    auto state = store.create(5, WorkflowConfig{});
    auto seo = step("seo", StepStatus::completed);
    seo.start_time = clock.now();
    seo.end_time = clock.now() + std::chrono::milliseconds{1500};
    seo.duration_ms = 1500;
    seo.result = shipkit::workflow::SeoReport{75, 3, 4};
    state = store.update(state, seo);

    auto failed = step("performance", StepStatus::failed);
    failed.error = "no build";
    state = store.update(state, failed);

    REQUIRE(store.save(state));
    REQUIRE(std::filesystem::exists(project.root() / ".ship-toolkit" / "workflow-state.json"));

    const auto loaded = store.load();
    REQUIRE(loaded.has_value());
    REQUIRE(*loaded == state);

    SECTION("document uses interchange keys") {
        const auto document = nlohmann::json(state);
        REQUIRE(document.at("status") == "in-progress");
        REQUIRE(document.at("currentStep") == 2);
        REQUIRE(document.at("totalSteps") == 5);
        REQUIRE(document.at("steps").at(0).at("result").at("kind") == "seo");
        REQUIRE(document.at("config").at("skipDeploy") == true);
    }
}

TEST_CASE("messages with invalid UTF-8 are still persisted", "[state]") {
    TempProject project;
    ManualClock clock;
    CollectingSink sink;
    const StateStore store(
        StateStore::Config{.project_root = project.root(), .sink = sink.fn(), .clock = clock.fn()});

    auto state = store.create(1, WorkflowConfig{});
    auto failed = step("seo", StepStatus::failed);
    failed.error = "cannot read caf\xe9.png";
    state = store.update(state, failed);

    REQUIRE(store.save(state));
    const auto loaded = store.load();
    REQUIRE(loaded.has_value());
    REQUIRE(loaded->steps.at(0).error.has_value());
    REQUIRE(loaded->steps.at(0).error->rfind("cannot read caf", 0) == 0);

    WorkflowResult result;
    result.steps.push_back(failed);
    REQUIRE(store.append_to_history(result));
    REQUIRE(store.load_history().size() == 1);
}

TEST_CASE("corrupt or missing state loads as nothing", "[state]") {
    TempProject project;
    CollectingSink sink;
    const StateStore store(StateStore::Config{.project_root = project.root(), .sink = sink.fn()});

    SECTION("missing") {
        REQUIRE_FALSE(store.load().has_value());
        REQUIRE(sink.events->empty());
    }

    SECTION("not JSON") {
        project.write(".ship-toolkit/workflow-state.json", "{{{");
        REQUIRE_FALSE(store.load().has_value());
        REQUIRE(sink.contains(shipkit::Severity::warn, "state-store"));
    }

    SECTION("wrong shape") {
        project.write(".ship-toolkit/workflow-state.json", R"({"id": 12})");
        REQUIRE_FALSE(store.load().has_value());
        REQUIRE(sink.contains(shipkit::Severity::warn, "state-store"));
    }
}

TEST_CASE("resume window is 24 hours of inactivity", "[state]") {
    TempProject project;
    ManualClock clock;
    const StateStore store(StateStore::Config{.project_root = project.root(), .clock = clock.fn()});

    auto state = store.create(5, WorkflowConfig{});
    state = store.update(state, step("a", StepStatus::completed));

    clock.advance(std::chrono::hours{23});
    REQUIRE(store.can_resume(state));

    clock.advance(std::chrono::hours{2});
    REQUIRE_FALSE(store.can_resume(state));

    SECTION("finished runs never resume") {
        auto finished = state;
        finished.last_update = clock.now();
        finished.status = RunStatus::completed;
        REQUIRE_FALSE(store.can_resume(finished));

        finished.status = RunStatus::in_progress;
        finished.current_step = finished.total_steps;
        REQUIRE_FALSE(store.can_resume(finished));
    }
}

TEST_CASE("history keeps the ten newest runs", "[state][history]") {
    TempProject project;
    ManualClock clock;
    const StateStore store(StateStore::Config{.project_root = project.root(), .clock = clock.fn()});

    REQUIRE(store.load_history().empty());

    for (int run = 0; run < 11; ++run) {
        clock.advance(std::chrono::minutes{1});
        REQUIRE(store.append_to_history(result_with_score(run)));
    }

    const auto history = store.load_history();
    REQUIRE(history.size() == 10);
    REQUIRE(history.front().summary.launch_score == 10);
    REQUIRE(history.front().timestamp == clock.now());
    REQUIRE(history.back().summary.launch_score == 1);
    REQUIRE(history.front().steps.size() == 1);
    REQUIRE(history.front().steps[0].duration_ms == 42);
    REQUIRE(history.front().duration_ms == 1010);
}

TEST_CASE("unreadable history is treated as empty", "[state][history]") {
    TempProject project;
    CollectingSink sink;
    const StateStore store(StateStore::Config{.project_root = project.root(), .sink = sink.fn()});

    SECTION("not JSON") {
        project.write(".ship-toolkit/workflow-history.json", "[{");
    }

    SECTION("not an array") {
        project.write(".ship-toolkit/workflow-history.json", R"({"timestamp": "x"})");
    }

    REQUIRE(store.load_history().empty());
    REQUIRE(sink.contains(shipkit::Severity::warn, "state-store"));

    REQUIRE(store.append_to_history(result_with_score(80)));
    REQUIRE(store.load_history().size() == 1);
}

TEST_CASE("clear removes the state file", "[state]") {
    TempProject project;
    const StateStore store(StateStore::Config{.project_root = project.root()});

    REQUIRE(store.clear());

    const auto state = store.create(1, WorkflowConfig{});
    REQUIRE(store.save(state));
    REQUIRE(store.clear());
    REQUIRE_FALSE(std::filesystem::exists(store.state_path()));
    REQUIRE_FALSE(store.load().has_value());
}
