#include "shipkit/checklist_json.hpp"

#include <stdexcept>
#include <string>

namespace {

using nlohmann::json;

std::optional<std::string> optional_string(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

}  // namespace

namespace shipkit {

json timestamp_to_json(Timestamp ts) {
    return format_iso8601(ts);
}

Timestamp timestamp_from_json(const json& value) {
    const auto text = value.get<std::string>();
    const auto parsed = parse_iso8601(text);
    if (!parsed) {
        throw std::runtime_error("Invalid ISO-8601 timestamp: '" + text + "'");
    }
    return *parsed;
}

}  // namespace shipkit

namespace shipkit::readiness {

void to_json(json& j, const ChecklistItem& item) {
    j = json{
        {"id", item.id},
        {"name", item.name},
        {"status", to_string(item.status)},
        {"required", item.required},
        {"automated", item.automated},
    };
    if (item.message) {
        j["message"] = *item.message;
    }
    if (item.fix) {
        j["fix"] = *item.fix;
    }
}

void from_json(const json& j, ChecklistItem& item) {
    item.id = j.at("id").get<std::string>();
    item.name = j.at("name").get<std::string>();
    const auto status_text = j.at("status").get<std::string>();
    const auto status = parse_check_status(status_text);
    if (!status) {
        throw std::runtime_error("Unknown check status '" + status_text + "' for item '" + item.id + "'");
    }
    item.status = *status;
    item.required = j.at("required").get<bool>();
    item.automated = j.value("automated", false);
    item.message = optional_string(j, "message");
    item.fix = optional_string(j, "fix");
}

void to_json(json& j, const ChecklistSection& section) {
    j = json{
        {"name", section.name},
        {"items", section.items},
        {"score", section.score},
        {"required", section.required},
    };
}

void from_json(const json& j, ChecklistSection& section) {
    section.name = j.at("name").get<std::string>();
    section.items = j.at("items").get<std::vector<ChecklistItem>>();
    section.score = j.at("score").get<int>();
    section.required = j.at("required").get<bool>();
}

void to_json(json& j, const LaunchChecklist& checklist) {
    j = json{
        {"sections", checklist.sections},
        {"overallScore", checklist.overall_score},
        {"readyToLaunch", checklist.ready_to_launch},
        {"criticalIssues", checklist.critical_issues},
        {"warnings", checklist.warnings},
        {"timestamp", timestamp_to_json(checklist.timestamp)},
    };
}

void from_json(const json& j, LaunchChecklist& checklist) {
    checklist.sections = j.at("sections").get<std::vector<ChecklistSection>>();
    checklist.overall_score = j.at("overallScore").get<int>();
    checklist.ready_to_launch = j.at("readyToLaunch").get<bool>();
    checklist.critical_issues = j.at("criticalIssues").get<std::vector<ChecklistItem>>();
    checklist.warnings = j.at("warnings").get<std::vector<ChecklistItem>>();
    checklist.timestamp = timestamp_from_json(j.at("timestamp"));
}

std::string dump_checklist(const LaunchChecklist& checklist) {
    const json document = checklist;
    return document.dump(2, ' ', false, json::error_handler_t::replace);
}

LaunchChecklist parse_checklist(std::string_view text) {
    return json::parse(text).get<LaunchChecklist>();
}

}  // namespace shipkit::readiness
