#include "shipkit/evaluator.hpp"

#include <exception>
#include <string>
#include <utility>

namespace {

constexpr const char* kSource = "readiness";

shipkit::readiness::ChecklistItem provider_error_item(const std::string& section_name,
                                                      std::string what) {
    shipkit::readiness::ChecklistItem item;
    item.id = "provider-error";
    item.name = section_name + " checks";
    item.status = shipkit::readiness::CheckStatus::fail;
    item.required = false;
    item.message = std::move(what);
    item.automated = false;
    return item;
}

}  // namespace

namespace shipkit::readiness {

Evaluator::Evaluator() : Evaluator(Config{}) {}

Evaluator::Evaluator(Config config) : config_(std::move(config)) {
    config_.policy.validate();
    if (!config_.clock) {
        config_.clock = system_clock_fn();
    }
}

LaunchChecklist Evaluator::evaluate(std::vector<ChecklistSection> sections) const {
    LaunchChecklist checklist;

    long total = 0;
    for (auto& section : sections) {
        section.score = section_score(section.items, config_.policy);
        total += section.score;

        for (const auto& item : section.items) {
            if (item.status == CheckStatus::fail && item.required) {
                checklist.critical_issues.push_back(item);
            } else if (item.status == CheckStatus::warning) {
                checklist.warnings.push_back(item);
            }
        }
    }

    // No sections means nothing was checked; treat like an empty section.
    checklist.overall_score =
        sections.empty() ? 100
                         : round_score(static_cast<double>(total) / static_cast<double>(sections.size()));
    checklist.ready_to_launch =
        checklist.critical_issues.empty() && checklist.overall_score >= config_.policy.ready_threshold;
    checklist.sections = std::move(sections);
    checklist.timestamp = config_.clock();

    if (checklist.ready_to_launch) {
        emit(config_.sink, Severity::info, kSource,
             "Ready to launch, score " + std::to_string(checklist.overall_score) + "/100");
    } else {
        emit(config_.sink, Severity::info, kSource,
             "Not ready to launch, score " + std::to_string(checklist.overall_score) + "/100, " +
                 std::to_string(checklist.critical_issues.size()) + " critical issue(s)");
    }
    return checklist;
}

ChecklistSection Evaluator::run_provider(const NamedProvider& provider,
                                         const std::filesystem::path& project_root) const {
    std::string failure;
    try {
        if (!provider.provider) {
            failure = "no check provider registered";
        } else {
            auto section = provider.provider(project_root);
            if (section.name.empty()) {
                section.name = provider.section_name;
            }
            section.score = section_score(section.items, config_.policy);
            return section;
        }
    } catch (const std::exception& ex) {
        failure = ex.what();
    } catch (...) {
        failure = "unknown error";
    }

    emit(config_.sink, Severity::error, "provider:" + provider.section_name, failure);
    std::vector<ChecklistItem> items;
    items.push_back(provider_error_item(provider.section_name, std::move(failure)));
    return make_section(provider.section_name, std::move(items), provider.required, config_.policy);
}

LaunchChecklist Evaluator::run(const std::vector<NamedProvider>& providers,
                               const std::filesystem::path& project_root) const {
    std::vector<ChecklistSection> sections;
    sections.reserve(providers.size());
    for (const auto& provider : providers) {
        sections.push_back(run_provider(provider, project_root));
    }
    return evaluate(std::move(sections));
}

}  // namespace shipkit::readiness
