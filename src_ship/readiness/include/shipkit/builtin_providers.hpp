#pragma once

#include "checklist.hpp"
#include "evaluator.hpp"
#include "shipkit/diagnostics.hpp"

#include <filesystem>
#include <vector>

namespace shipkit::readiness {

// Filesystem-backed check providers for a typical web project. Each returns
// one section; items the tool cannot verify are reported as `skip`.

[[nodiscard]] ChecklistSection check_assets(const std::filesystem::path& project_root);
[[nodiscard]] ChecklistSection check_seo(const std::filesystem::path& project_root);
[[nodiscard]] ChecklistSection check_performance(const std::filesystem::path& project_root);
[[nodiscard]] ChecklistSection check_security(const std::filesystem::path& project_root);
[[nodiscard]] ChecklistSection check_functionality(const std::filesystem::path& project_root);
[[nodiscard]] ChecklistSection check_analytics(const std::filesystem::path& project_root);
[[nodiscard]] ChecklistSection check_documentation(const std::filesystem::path& project_root);
[[nodiscard]] ChecklistSection check_legal(const std::filesystem::path& project_root);

/**
 * \brief The eight sections of the pre-launch checklist, in report order.
 *
 * Assets, SEO, Performance and Security are marked required.
 */
[[nodiscard]] std::vector<NamedProvider> default_providers();

}  // namespace shipkit::readiness
