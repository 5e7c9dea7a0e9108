#pragma once

#include "checklist.hpp"

#include <string>
#include <vector>

namespace shipkit::readiness {

/**
 * \brief Point values per status and the readiness threshold.
 *
 * A `skip` (manual verification) scores between `warning` and `pass`: it is
 * unverified state, not evidence of a problem.
 */
struct ScoringPolicy {
    int pass_points{100};
    int warning_points{50};
    int skip_points{75};
    int fail_points{0};
    int ready_threshold{70};

    /// Throws std::invalid_argument when a value lies outside 0..100.
    void validate() const;

    [[nodiscard]] int points(CheckStatus status) const noexcept;
};

/// Rounds half up, the rounding every score in this library uses.
[[nodiscard]] int round_score(double value) noexcept;

/**
 * \brief Section score: mean of the item points, rounded.
 *
 * An empty list scores 100; a section with nothing registered cannot fail.
 */
[[nodiscard]] int section_score(const std::vector<ChecklistItem>& items,
                                const ScoringPolicy& policy = {});

[[nodiscard]] ChecklistSection make_section(std::string name,
                                            std::vector<ChecklistItem> items,
                                            bool required,
                                            const ScoringPolicy& policy = {});

}  // namespace shipkit::readiness
