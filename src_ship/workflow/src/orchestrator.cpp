#include "shipkit/orchestrator.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace {

constexpr const char* kSource = "orchestrator";

}  // namespace

namespace shipkit::workflow {

Orchestrator::Orchestrator(Config config, PlanFactory plan_factory)
    : config_(std::move(config)), plan_factory_(std::move(plan_factory)) {
    if (!plan_factory_) {
        throw std::invalid_argument("Orchestrator requires a plan factory");
    }
    if (!config_.clock) {
        config_.clock = system_clock_fn();
    }
}

std::optional<WorkflowState> Orchestrator::resumable_state(const StateStore& store) const {
    auto loaded = store.load();
    if (!loaded) {
        emit(config_.sink, Severity::info, kSource, "No resumable workflow state, starting fresh");
        return std::nullopt;
    }
    if (!store.can_resume(*loaded)) {
        emit(config_.sink, Severity::info, kSource,
             "Workflow " + loaded->id + " is " + to_string(loaded->status) +
                 " or stale, starting fresh");
        return std::nullopt;
    }
    try {
        loaded->config.validate();
    } catch (const std::invalid_argument& ex) {
        emit(config_.sink, Severity::warn, kSource,
             "Workflow " + loaded->id + " has an invalid persisted configuration (" + ex.what() +
                 "), starting fresh");
        return std::nullopt;
    }
    return loaded;
}

WorkflowResult Orchestrator::run() {
    config_.workflow.validate();
    resumed_ = false;

    StateStore store(StateStore::Config{config_.project_root, config_.sink, config_.clock});

    std::optional<WorkflowState> resumed;
    if (config_.resume) {
        resumed = resumable_state(store);
    }

    const WorkflowConfig run_config = resumed ? resumed->config : config_.workflow;
    auto plan = plan_factory_(run_config);
    validate_plan(plan);

    if (resumed && resumed->total_steps != static_cast<int>(plan.size())) {
        emit(config_.sink, Severity::warn, kSource,
             "Persisted workflow has " + std::to_string(resumed->total_steps) + " steps, plan has " +
                 std::to_string(plan.size()) + ", starting fresh");
        resumed.reset();
    }

    WorkflowState state;
    std::vector<WorkflowStep> carried;
    if (resumed) {
        state = std::move(*resumed);
        carried = state.steps;
        resumed_ = true;
        emit(config_.sink, Severity::info, kSource,
             "Resuming workflow " + state.id + " at step " + std::to_string(next_step(state) + 1) + "/" +
                 std::to_string(state.total_steps));
    } else {
        state = store.create(static_cast<int>(plan.size()), run_config);
        store.save(state);
    }

    StepRunner::Config runner_config;
    runner_config.clock = config_.clock;
    runner_config.sink = config_.sink;
    runner_config.on_step_started = config_.on_step_started;
    runner_config.on_step_finished = [&](const WorkflowStep& step, std::size_t index, std::size_t total) {
        state = store.update(std::move(state), step);
        store.save(state);
        if (config_.on_step_finished) {
            config_.on_step_finished(step, index, total);
        }
    };

    const StepRunner runner(std::move(runner_config));
    auto result = runner.run(plan, config_.project_root, run_config, carried);

    if (state.status != RunStatus::in_progress) {
        store.append_to_history(result);
    }
    state_ = std::move(state);
    return result;
}

PlanFactory default_plan_factory(const readiness::Evaluator::Config& evaluator_config) {
    return [evaluator_config](const WorkflowConfig& config) {
        return plan_ship_workflow(config, default_ship_steps(evaluator_config));
    };
}

WorkflowResult run_complete_workflow(const std::filesystem::path& project_root,
                                     const WorkflowConfig& config,
                                     const DiagnosticSink& sink) {
    Orchestrator::Config orchestrator_config;
    orchestrator_config.project_root = project_root;
    orchestrator_config.workflow = config;
    orchestrator_config.sink = sink;

    readiness::Evaluator::Config evaluator_config;
    evaluator_config.sink = sink;

    Orchestrator orchestrator(std::move(orchestrator_config), default_plan_factory(evaluator_config));
    return orchestrator.run();
}

}  // namespace shipkit::workflow
