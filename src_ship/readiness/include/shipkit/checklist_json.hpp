#pragma once

#include "checklist.hpp"

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace shipkit {

// Timestamps travel as ISO-8601 strings; from_json throws std::runtime_error otherwise.
[[nodiscard]] nlohmann::json timestamp_to_json(Timestamp ts);
[[nodiscard]] Timestamp timestamp_from_json(const nlohmann::json& value);

}  // namespace shipkit

namespace shipkit::readiness {

/*
 * nlohmann/json ADL hooks. Keys use the interchange spelling
 * (`overallScore`, `readyToLaunch`, `criticalIssues`, ...); `message` and
 * `fix` are omitted when empty.
 */
void to_json(nlohmann::json& j, const ChecklistItem& item);
void from_json(const nlohmann::json& j, ChecklistItem& item);

void to_json(nlohmann::json& j, const ChecklistSection& section);
void from_json(const nlohmann::json& j, ChecklistSection& section);

void to_json(nlohmann::json& j, const LaunchChecklist& checklist);
void from_json(const nlohmann::json& j, LaunchChecklist& checklist);

/// Canonical interchange document: the checklist verbatim, indented by 2.
[[nodiscard]] std::string dump_checklist(const LaunchChecklist& checklist);

/// Inverse of dump_checklist(); throws on malformed input.
[[nodiscard]] LaunchChecklist parse_checklist(std::string_view text);

}  // namespace shipkit::readiness
