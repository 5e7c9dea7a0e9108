#include "shipkit/checklist.hpp"

namespace shipkit::readiness {

const char* to_string(CheckStatus status) noexcept {
    switch (status) {
        case CheckStatus::pass:    return "pass";
        case CheckStatus::fail:    return "fail";
        case CheckStatus::warning: return "warning";
        case CheckStatus::skip:    return "skip";
    }
    return "skip";
}

std::optional<CheckStatus> parse_check_status(std::string_view text) noexcept {
    if (text == "pass") return CheckStatus::pass;
    if (text == "fail") return CheckStatus::fail;
    if (text == "warning") return CheckStatus::warning;
    if (text == "skip") return CheckStatus::skip;
    return std::nullopt;
}

QuickStatus quick_status(const LaunchChecklist& checklist) {
    QuickStatus status;
    status.ready = checklist.ready_to_launch;
    status.score = checklist.overall_score;
    status.missing.reserve(checklist.critical_issues.size());
    for (const auto& issue : checklist.critical_issues) {
        status.missing.push_back(issue.name);
    }
    return status;
}

}  // namespace shipkit::readiness
