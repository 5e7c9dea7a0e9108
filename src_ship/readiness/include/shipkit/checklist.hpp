#pragma once

#include "shipkit/timestamp.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace shipkit::readiness {

enum class CheckStatus {
    pass,
    fail,
    warning,
    skip,
};

[[nodiscard]] const char* to_string(CheckStatus status) noexcept;

/// Accepts the lowercase names produced by to_string(); std::nullopt otherwise.
[[nodiscard]] std::optional<CheckStatus> parse_check_status(std::string_view text) noexcept;

/**
 * \brief One atomic check result produced by a check provider.
 *
 * `required` marks items whose failure blocks the launch; `automated` marks
 * items a toolkit command can remediate, in which case `fix` names it.
 */
struct ChecklistItem {
    std::string id;
    std::string name;
    CheckStatus status{CheckStatus::skip};
    bool required{false};
    std::optional<std::string> message{};
    std::optional<std::string> fix{};
    bool automated{false};

    bool operator==(const ChecklistItem&) const = default;
};

/**
 * \brief Named group of items with a derived 0..100 score.
 *
 * Build sections through make_section() (scoring.hpp) so `score` always
 * matches `items`.
 */
struct ChecklistSection {
    std::string name;
    std::vector<ChecklistItem> items;
    int score{100};
    bool required{false};

    bool operator==(const ChecklistSection&) const = default;
};

/**
 * \brief Snapshot produced by one readiness evaluation.
 *
 * `critical_issues` and `warnings` are copies of items from `sections`, kept
 * in section order, then item order.
 */
struct LaunchChecklist {
    std::vector<ChecklistSection> sections;
    int overall_score{100};
    bool ready_to_launch{false};
    std::vector<ChecklistItem> critical_issues;
    std::vector<ChecklistItem> warnings;
    Timestamp timestamp{};

    bool operator==(const LaunchChecklist&) const = default;
};

/// Summary used by `--checklist` callers that only need the verdict.
struct QuickStatus {
    bool ready{false};
    int score{0};
    std::vector<std::string> missing;
};

[[nodiscard]] QuickStatus quick_status(const LaunchChecklist& checklist);

}  // namespace shipkit::readiness
