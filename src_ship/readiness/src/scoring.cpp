#include "shipkit/scoring.hpp"

#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace {

void require_percentage(int value, const char* field) {
    if (value < 0 || value > 100) {
        throw std::invalid_argument(std::string("ScoringPolicy.") + field + " must lie in 0..100, got " +
                                    std::to_string(value));
    }
}

}  // namespace

namespace shipkit::readiness {

void ScoringPolicy::validate() const {
    require_percentage(pass_points, "pass_points");
    require_percentage(warning_points, "warning_points");
    require_percentage(skip_points, "skip_points");
    require_percentage(fail_points, "fail_points");
    require_percentage(ready_threshold, "ready_threshold");
}

int ScoringPolicy::points(CheckStatus status) const noexcept {
    switch (status) {
        case CheckStatus::pass:    return pass_points;
        case CheckStatus::warning: return warning_points;
        case CheckStatus::skip:    return skip_points;
        case CheckStatus::fail:    return fail_points;
    }
    return fail_points;
}

int round_score(double value) noexcept {
    return static_cast<int>(std::floor(value + 0.5));
}

int section_score(const std::vector<ChecklistItem>& items, const ScoringPolicy& policy) {
    policy.validate();
    if (items.empty()) {
        return 100;
    }

    long total = 0;
    for (const auto& item : items) {
        total += policy.points(item.status);
    }
    return round_score(static_cast<double>(total) / static_cast<double>(items.size()));
}

ChecklistSection make_section(std::string name,
                              std::vector<ChecklistItem> items,
                              bool required,
                              const ScoringPolicy& policy) {
    ChecklistSection section;
    section.name = std::move(name);
    section.score = section_score(items, policy);
    section.items = std::move(items);
    section.required = required;
    return section;
}

}  // namespace shipkit::readiness
