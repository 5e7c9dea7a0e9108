#include "shipkit/state_store.hpp"
#include "shipkit/toolkit_config.hpp"
#include "shipkit/workflow_json.hpp"

#include <algorithm>
#include <exception>
#include <fstream>
#include <random>
#include <sstream>
#include <stdexcept>
#include <utility>

#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

namespace {

using nlohmann::json;

constexpr const char* kSource = "state-store";

bool write_text(const fs::path& path, const std::string& text, const shipkit::DiagnosticSink& sink) {
    std::error_code ec;
    if (const auto parent = path.parent_path(); !parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) {
            shipkit::emit(sink, shipkit::Severity::error, kSource,
                          "Failed to create directory " + parent.string() + ": " + ec.message());
            return false;
        }
    }
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    if (!output.is_open()) {
        shipkit::emit(sink, shipkit::Severity::error, kSource, "Unable to open " + path.string() + " for writing");
        return false;
    }
    output << text;
    output.flush();
    if (!output) {
        shipkit::emit(sink, shipkit::Severity::error, kSource, "Short write: " + path.string());
        return false;
    }
    return true;
}

// Invalid UTF-8 in messages is replaced with U+FFFD instead of failing the dump.
std::optional<std::string> serialize(const json& document, const shipkit::DiagnosticSink& sink) {
    try {
        return document.dump(2, ' ', false, json::error_handler_t::replace);
    } catch (const json::exception& ex) {
        shipkit::emit(sink, shipkit::Severity::error, kSource, std::string("Failed to serialize: ") + ex.what());
        return std::nullopt;
    }
}

std::optional<std::string> read_text(const fs::path& path, const shipkit::DiagnosticSink& sink) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return std::nullopt;
    }
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        shipkit::emit(sink, shipkit::Severity::warn, kSource, "Unable to open " + path.string());
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}

}  // namespace

namespace shipkit::workflow {

std::string generate_workflow_id(Timestamp when) {
    static constexpr char kAlphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    std::random_device device;
    std::mt19937 engine(device());
    std::uniform_int_distribution<int> pick(0, 35);

    std::string suffix;
    suffix.reserve(9);
    for (int i = 0; i < 9; ++i) {
        suffix.push_back(kAlphabet[pick(engine)]);
    }
    return "workflow-" + std::to_string(when.time_since_epoch().count()) + "-" + suffix;
}

bool can_resume(const WorkflowState& state, Timestamp now) {
    return state.status == RunStatus::in_progress && state.current_step < state.total_steps &&
           (now - state.last_update) < kResumeWindow;
}

HistoryEntry make_history_entry(const WorkflowResult& result, Timestamp when) {
    HistoryEntry entry;
    entry.timestamp = when;
    entry.duration_ms = result.total_duration_ms;
    entry.success = result.overall_success;
    entry.summary = result.summary;
    entry.steps.reserve(result.steps.size());
    for (const auto& step : result.steps) {
        entry.steps.push_back(StepSummary{step.id, step.name, step.status, step.duration_ms});
    }
    return entry;
}

StateStore::StateStore(Config config) : config_(std::move(config)) {
    if (!config_.clock) {
        config_.clock = system_clock_fn();
    }
}

fs::path StateStore::state_path() const {
    return tool_dir(config_.project_root) / kStateFileName;
}

fs::path StateStore::history_path() const {
    return tool_dir(config_.project_root) / kHistoryFileName;
}

WorkflowState StateStore::create(int total_steps, const WorkflowConfig& config) const {
    if (total_steps <= 0) {
        throw std::invalid_argument("Workflow must have at least one step, got " + std::to_string(total_steps));
    }
    const Timestamp now = config_.clock();

    WorkflowState state;
    state.id = generate_workflow_id(now);
    state.project_root = config_.project_root;
    state.start_time = now;
    state.last_update = now;
    state.status = RunStatus::in_progress;
    state.current_step = 0;
    state.total_steps = total_steps;
    state.config = config;
    return state;
}

WorkflowState StateStore::update(WorkflowState state, const WorkflowStep& step) const {
    auto it = std::find_if(state.steps.begin(), state.steps.end(),
                           [&](const WorkflowStep& existing) { return existing.id == step.id; });
    if (it != state.steps.end()) {
        *it = step;
    } else {
        state.steps.push_back(step);
    }

    state.last_update = config_.clock();
    state.current_step = static_cast<int>(std::count_if(
        state.steps.begin(), state.steps.end(), [](const WorkflowStep& s) { return is_terminal(s.status); }));

    if (state.current_step >= state.total_steps) {
        const bool any_failed = std::any_of(state.steps.begin(), state.steps.end(),
                                            [](const WorkflowStep& s) { return s.status == StepStatus::failed; });
        state.status = any_failed ? RunStatus::failed : RunStatus::completed;
    }
    return state;
}

bool StateStore::save(const WorkflowState& state) const {
    const auto text = serialize(json(state), config_.sink);
    return text && write_text(state_path(), *text, config_.sink);
}

std::optional<WorkflowState> StateStore::load() const {
    const auto path = state_path();
    const auto text = read_text(path, config_.sink);
    if (!text) {
        return std::nullopt;
    }

    try {
        return json::parse(*text).get<WorkflowState>();
    } catch (const std::exception& ex) {
        emit(config_.sink, Severity::warn, kSource,
             "Failed to load workflow state from " + path.string() + ": " + ex.what());
        return std::nullopt;
    }
}

bool StateStore::can_resume(const WorkflowState& state) const {
    return workflow::can_resume(state, config_.clock());
}

bool StateStore::clear() const {
    std::error_code ec;
    fs::remove(state_path(), ec);
    if (ec) {
        emit(config_.sink, Severity::warn, kSource,
             "Failed to remove " + state_path().string() + ": " + ec.message());
        return false;
    }
    return true;
}

bool StateStore::append_to_history(const WorkflowResult& result) const {
    auto history = load_history();
    history.insert(history.begin(), make_history_entry(result, config_.clock()));
    if (history.size() > kHistoryLimit) {
        history.resize(kHistoryLimit);
    }

    const auto text = serialize(json(history), config_.sink);
    return text && write_text(history_path(), *text, config_.sink);
}

std::vector<HistoryEntry> StateStore::load_history() const {
    const auto path = history_path();
    const auto text = read_text(path, config_.sink);
    if (!text) {
        return {};
    }

    try {
        const auto document = json::parse(*text);
        if (!document.is_array()) {
            throw std::runtime_error("history is not a JSON array");
        }
        return document.get<std::vector<HistoryEntry>>();
    } catch (const std::exception& ex) {
        emit(config_.sink, Severity::warn, kSource,
             "Ignoring unreadable history " + path.string() + ": " + ex.what());
        return {};
    }
}

}  // namespace shipkit::workflow
