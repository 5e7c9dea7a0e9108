#pragma once

#include "checklist.hpp"
#include "scoring.hpp"
#include "shipkit/diagnostics.hpp"
#include "shipkit/timestamp.hpp"

#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace shipkit::readiness {

/// Inspects a project and returns one section with statuses already assigned.
using CheckProvider = std::function<ChecklistSection(const std::filesystem::path& project_root)>;

/**
 * \brief A provider together with the section it stands for.
 *
 * `section_name` and `required` are used when the provider throws and a
 * replacement section has to be synthesised.
 */
struct NamedProvider {
    std::string section_name;
    bool required{false};
    CheckProvider provider;
};

/**
 * \brief Aggregates sections into a LaunchChecklist and decides readiness.
 *
 * The project is ready when no required item failed and the overall score
 * (unweighted mean of the section scores) reaches the policy threshold.
 * Neither evaluate() nor run() throws once the evaluator is constructed;
 * provider exceptions become `fail` items.
 */
class Evaluator {
public:
    struct Config {
        ScoringPolicy policy{};
        DiagnosticSink sink{};
        ClockFn clock{};
    };

    Evaluator();

    /// Throws std::invalid_argument when `config.policy` is invalid.
    explicit Evaluator(Config config);

    [[nodiscard]] LaunchChecklist evaluate(std::vector<ChecklistSection> sections) const;

    /// Invokes one provider, converting an exception into a non-required `fail` item.
    [[nodiscard]] ChecklistSection run_provider(const NamedProvider& provider,
                                                const std::filesystem::path& project_root) const;

    [[nodiscard]] LaunchChecklist run(const std::vector<NamedProvider>& providers,
                                      const std::filesystem::path& project_root) const;

    [[nodiscard]] const ScoringPolicy& policy() const noexcept { return config_.policy; }

private:
    Config config_;
};

}  // namespace shipkit::readiness
