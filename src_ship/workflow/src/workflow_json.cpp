#include "shipkit/workflow_json.hpp"
#include "shipkit/checklist_json.hpp"

#include <stdexcept>
#include <string>

namespace {

using nlohmann::json;

std::optional<shipkit::Timestamp> optional_timestamp(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    return shipkit::timestamp_from_json(*it);
}

std::optional<std::int64_t> optional_int64(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->get<std::int64_t>();
}

shipkit::workflow::StepStatus step_status_from(const json& value) {
    const auto text = value.get<std::string>();
    const auto status = shipkit::workflow::parse_step_status(text);
    if (!status) {
        throw std::runtime_error("Unknown step status '" + text + "'");
    }
    return *status;
}

}  // namespace

namespace shipkit::workflow {

json payload_to_json(const StepPayload& payload) {
    if (const auto* assets = std::get_if<AssetReport>(&payload)) {
        return json{
            {"kind", payload_kind(payload)},
            {"assetsGenerated", assets->assets_generated},
            {"totalSavings", assets->total_savings},
        };
    }
    if (const auto* seo = std::get_if<SeoReport>(&payload)) {
        return json{
            {"kind", payload_kind(payload)},
            {"seoScore", seo->seo_score},
            {"itemsFound", seo->items_found},
            {"itemsTotal", seo->items_total},
        };
    }
    if (const auto* perf = std::get_if<PerformanceReport>(&payload)) {
        return json{
            {"kind", payload_kind(payload)},
            {"performanceScore", perf->performance_score},
            {"imagesOptimized", perf->images_optimized},
            {"bytesSaved", perf->bytes_saved},
        };
    }
    if (const auto* checklist = std::get_if<readiness::LaunchChecklist>(&payload)) {
        return json{
            {"kind", payload_kind(payload)},
            {"checklist", *checklist},
        };
    }
    if (const auto* deploy = std::get_if<DeploymentReport>(&payload)) {
        json j{
            {"kind", payload_kind(payload)},
            {"platform", deploy->platform},
            {"production", deploy->production},
            {"skipped", deploy->skipped},
        };
        if (deploy->url) {
            j["url"] = *deploy->url;
        }
        return j;
    }
    return nullptr;
}

StepPayload payload_from_json(const json& j) {
    if (j.is_null()) {
        return std::monostate{};
    }

    const auto kind = j.at("kind").get<std::string>();
    if (kind == "assets") {
        return AssetReport{j.at("assetsGenerated").get<int>(), j.at("totalSavings").get<std::int64_t>()};
    }
    if (kind == "seo") {
        return SeoReport{j.at("seoScore").get<int>(), j.at("itemsFound").get<int>(),
                         j.at("itemsTotal").get<int>()};
    }
    if (kind == "performance") {
        return PerformanceReport{j.at("performanceScore").get<int>(), j.at("imagesOptimized").get<int>(),
                                 j.at("bytesSaved").get<std::int64_t>()};
    }
    if (kind == "launch-checklist") {
        return j.at("checklist").get<readiness::LaunchChecklist>();
    }
    if (kind == "deployment") {
        DeploymentReport report;
        report.platform = j.value("platform", std::string{});
        if (auto it = j.find("url"); it != j.end() && it->is_string()) {
            report.url = it->get<std::string>();
        }
        report.production = j.value("production", false);
        report.skipped = j.value("skipped", false);
        return report;
    }
    throw std::runtime_error("Unknown step payload kind '" + kind + "'");
}

void to_json(json& j, const WorkflowStep& step) {
    j = json{
        {"id", step.id},
        {"name", step.name},
        {"description", step.description},
        {"status", to_string(step.status)},
    };
    if (step.start_time) {
        j["startTime"] = timestamp_to_json(*step.start_time);
    }
    if (step.end_time) {
        j["endTime"] = timestamp_to_json(*step.end_time);
    }
    if (step.duration_ms) {
        j["duration"] = *step.duration_ms;
    }
    if (step.error) {
        j["error"] = *step.error;
    }
    if (!std::holds_alternative<std::monostate>(step.result)) {
        j["result"] = payload_to_json(step.result);
    }
}

void from_json(const json& j, WorkflowStep& step) {
    step.id = j.at("id").get<std::string>();
    step.name = j.at("name").get<std::string>();
    step.description = j.value("description", std::string{});
    step.status = step_status_from(j.at("status"));
    step.start_time = optional_timestamp(j, "startTime");
    step.end_time = optional_timestamp(j, "endTime");
    step.duration_ms = optional_int64(j, "duration");
    if (auto it = j.find("error"); it != j.end() && it->is_string()) {
        step.error = it->get<std::string>();
    } else {
        step.error.reset();
    }
    if (auto it = j.find("result"); it != j.end()) {
        step.result = payload_from_json(*it);
    } else {
        step.result = std::monostate{};
    }
}

void to_json(json& j, const WorkflowConfig& config) {
    j = json{
        {"skipAssets", config.skip_assets},
        {"skipSEO", config.skip_seo},
        {"skipPerf", config.skip_perf},
        {"skipDeploy", config.skip_deploy},
        {"autoFix", config.auto_fix},
        {"targetScore", config.target_score},
        {"production", config.production},
    };
    if (!config.deploy_platform.empty()) {
        j["deployPlatform"] = config.deploy_platform;
    }
}

void from_json(const json& j, WorkflowConfig& config) {
    const WorkflowConfig defaults;
    config.skip_assets = j.value("skipAssets", defaults.skip_assets);
    config.skip_seo = j.value("skipSEO", defaults.skip_seo);
    config.skip_perf = j.value("skipPerf", defaults.skip_perf);
    config.skip_deploy = j.value("skipDeploy", defaults.skip_deploy);
    config.auto_fix = j.value("autoFix", defaults.auto_fix);
    config.target_score = j.value("targetScore", defaults.target_score);
    config.production = j.value("production", defaults.production);
    config.deploy_platform = j.value("deployPlatform", defaults.deploy_platform);
}

void to_json(json& j, const WorkflowSummary& summary) {
    j = json{
        {"assetsGenerated", summary.assets_generated},
        {"seoScore", summary.seo_score},
        {"performanceScore", summary.performance_score},
        {"launchScore", summary.launch_score},
        {"readyToLaunch", summary.ready_to_launch},
    };
}

void from_json(const json& j, WorkflowSummary& summary) {
    summary.assets_generated = j.value("assetsGenerated", 0);
    summary.seo_score = j.value("seoScore", 0);
    summary.performance_score = j.value("performanceScore", 0);
    summary.launch_score = j.value("launchScore", 0);
    summary.ready_to_launch = j.value("readyToLaunch", false);
}

void to_json(json& j, const WorkflowState& state) {
    j = json{
        {"id", state.id},
        {"projectRoot", state.project_root.string()},
        {"startTime", timestamp_to_json(state.start_time)},
        {"lastUpdate", timestamp_to_json(state.last_update)},
        {"status", to_string(state.status)},
        {"currentStep", state.current_step},
        {"totalSteps", state.total_steps},
        {"steps", state.steps},
        {"config", state.config},
    };
}

void from_json(const json& j, WorkflowState& state) {
    state.id = j.at("id").get<std::string>();
    state.project_root = j.at("projectRoot").get<std::string>();
    state.start_time = timestamp_from_json(j.at("startTime"));
    state.last_update = timestamp_from_json(j.at("lastUpdate"));

    const auto status_text = j.at("status").get<std::string>();
    const auto status = parse_run_status(status_text);
    if (!status) {
        throw std::runtime_error("Unknown workflow status '" + status_text + "'");
    }
    state.status = *status;
    state.current_step = j.at("currentStep").get<int>();
    state.total_steps = j.at("totalSteps").get<int>();
    state.steps = j.at("steps").get<std::vector<WorkflowStep>>();
    state.config = j.value("config", json::object()).get<WorkflowConfig>();
}

void to_json(json& j, const StepSummary& step) {
    j = json{
        {"id", step.id},
        {"name", step.name},
        {"status", to_string(step.status)},
    };
    if (step.duration_ms) {
        j["duration"] = *step.duration_ms;
    }
}

void from_json(const json& j, StepSummary& step) {
    step.id = j.at("id").get<std::string>();
    step.name = j.at("name").get<std::string>();
    step.status = step_status_from(j.at("status"));
    step.duration_ms = optional_int64(j, "duration");
}

void to_json(json& j, const HistoryEntry& entry) {
    j = json{
        {"timestamp", timestamp_to_json(entry.timestamp)},
        {"duration", entry.duration_ms},
        {"success", entry.success},
        {"summary", entry.summary},
        {"steps", entry.steps},
    };
}

void from_json(const json& j, HistoryEntry& entry) {
    entry.timestamp = timestamp_from_json(j.at("timestamp"));
    entry.duration_ms = j.at("duration").get<std::int64_t>();
    entry.success = j.at("success").get<bool>();
    entry.summary = j.value("summary", json::object()).get<WorkflowSummary>();
    entry.steps = j.value("steps", json::array()).get<std::vector<StepSummary>>();
}

void to_json(json& j, const WorkflowResult& result) {
    j = json{
        {"steps", result.steps},
        {"overallSuccess", result.overall_success},
        {"totalDuration", result.total_duration_ms},
        {"summary", result.summary},
    };
    if (result.launch_checklist) {
        j["launchChecklist"] = *result.launch_checklist;
    }
    if (result.deployment_url) {
        j["deploymentUrl"] = *result.deployment_url;
    }
}

}  // namespace shipkit::workflow
