#pragma once

#include "workflow_types.hpp"

#include <nlohmann/json.hpp>

namespace shipkit::workflow {

/**
 * Step payloads are tagged with a `kind` field:
 * \code{.json}
 * { "kind": "seo", "seoScore": 75, "itemsFound": 3, "itemsTotal": 4 }
 * { "kind": "launch-checklist", "checklist": { ... } }
 * \endcode
 * std::monostate serialises to null.
 */
[[nodiscard]] nlohmann::json payload_to_json(const StepPayload& payload);
[[nodiscard]] StepPayload payload_from_json(const nlohmann::json& j);

void to_json(nlohmann::json& j, const WorkflowStep& step);
void from_json(const nlohmann::json& j, WorkflowStep& step);

void to_json(nlohmann::json& j, const WorkflowConfig& config);
void from_json(const nlohmann::json& j, WorkflowConfig& config);

void to_json(nlohmann::json& j, const WorkflowSummary& summary);
void from_json(const nlohmann::json& j, WorkflowSummary& summary);

void to_json(nlohmann::json& j, const WorkflowState& state);
void from_json(const nlohmann::json& j, WorkflowState& state);

void to_json(nlohmann::json& j, const StepSummary& step);
void from_json(const nlohmann::json& j, StepSummary& step);

void to_json(nlohmann::json& j, const HistoryEntry& entry);
void from_json(const nlohmann::json& j, HistoryEntry& entry);

void to_json(nlohmann::json& j, const WorkflowResult& result);

}  // namespace shipkit::workflow
