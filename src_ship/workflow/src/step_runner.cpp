#include "shipkit/step_runner.hpp"

#include <algorithm>
#include <exception>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>

namespace {

constexpr const char* kSource = "runner";

const shipkit::workflow::WorkflowStep* find_carried(const std::vector<shipkit::workflow::WorkflowStep>& carried,
                                                    const std::string& id) {
    auto it = std::find_if(carried.begin(), carried.end(), [&](const auto& step) {
        return step.id == id && shipkit::workflow::is_terminal(step.status);
    });
    return it == carried.end() ? nullptr : &*it;
}

}  // namespace

namespace shipkit::workflow {

void validate_plan(const std::vector<StepDefinition>& steps) {
    if (steps.empty()) {
        throw std::invalid_argument("Workflow plan has no steps");
    }
    std::set<std::string> seen;
    for (const auto& step : steps) {
        if (step.id.empty()) {
            throw std::invalid_argument("Workflow step '" + step.name + "' has an empty id");
        }
        if (!seen.insert(step.id).second) {
            throw std::invalid_argument("Duplicate workflow step id '" + step.id + "'");
        }
        if (!step.run) {
            throw std::invalid_argument("Workflow step '" + step.id + "' has no function");
        }
    }
}

StepRunner::StepRunner() : StepRunner(Config{}) {}

StepRunner::StepRunner(Config config) : config_(std::move(config)) {
    if (!config_.clock) {
        config_.clock = system_clock_fn();
    }
}

WorkflowResult StepRunner::run(const std::vector<StepDefinition>& steps,
                               const std::filesystem::path& project_root,
                               const WorkflowConfig& config,
                               const std::vector<WorkflowStep>& carried_over) const {
    validate_plan(steps);
    config.validate();

    const Timestamp started = config_.clock();
    WorkflowResult result;
    result.steps.reserve(steps.size());

    for (std::size_t index = 0; index < steps.size(); ++index) {
        const auto& definition = steps[index];
        if (const auto* carried = find_carried(carried_over, definition.id)) {
            emit(config_.sink, Severity::debug, kSource, "Reusing recorded step '" + definition.id + "'");
            result.steps.push_back(*carried);
            continue;
        }
        result.steps.push_back(execute(definition, project_root, config, result.steps, index, steps.size()));
    }

    result.overall_success = std::all_of(result.steps.begin(), result.steps.end(), [](const auto& step) {
        return step.status == StepStatus::completed || step.status == StepStatus::skipped;
    });
    result.total_duration_ms = elapsed_ms(started, config_.clock());
    summarize(result);
    return result;
}

WorkflowStep StepRunner::execute(const StepDefinition& definition,
                                 const std::filesystem::path& project_root,
                                 const WorkflowConfig& config,
                                 const std::vector<WorkflowStep>& previous,
                                 std::size_t index,
                                 std::size_t total) const {
    WorkflowStep step;
    step.id = definition.id;
    step.name = definition.name;
    step.description = definition.description;

    if (definition.skip_if) {
        if (auto reason = definition.skip_if(previous)) {
            const Timestamp now = config_.clock();
            step.status = StepStatus::skipped;
            step.start_time = now;
            step.end_time = now;
            step.duration_ms = 0;
            emit(config_.sink, Severity::info, kSource, "Skipping '" + step.id + "': " + *reason);
            if (config_.on_step_finished) {
                config_.on_step_finished(step, index, total);
            }
            return step;
        }
    }

    step.status = StepStatus::running;
    step.start_time = config_.clock();
    if (config_.on_step_started) {
        config_.on_step_started(step, index, total);
    }

    try {
        auto outcome = definition.run(project_root, config);
        step.result = std::move(outcome.payload);
        step.status = outcome.skipped ? StepStatus::skipped : StepStatus::completed;
        if (!outcome.note.empty()) {
            emit(config_.sink, Severity::info, kSource, step.id + ": " + outcome.note);
        }
    } catch (const std::exception& ex) {
        step.status = StepStatus::failed;
        step.error = ex.what();
    } catch (...) {
        step.status = StepStatus::failed;
        step.error = "unknown error";
    }

    step.end_time = config_.clock();
    step.duration_ms = elapsed_ms(*step.start_time, *step.end_time);
    if (step.status == StepStatus::failed) {
        emit(config_.sink, Severity::error, kSource, "Step '" + step.id + "' failed: " + *step.error);
    }

    if (config_.on_step_finished) {
        config_.on_step_finished(step, index, total);
    }
    return step;
}

}  // namespace shipkit::workflow
