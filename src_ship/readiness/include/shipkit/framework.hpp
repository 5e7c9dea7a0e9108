#pragma once

#include "shipkit/diagnostics.hpp"

#include <filesystem>
#include <string>

namespace shipkit::readiness {

enum class Framework {
    next_app,
    next_pages,
    react_vite,
    react_cra,
    vue,
    svelte,
    astro,
    static_html,
    unknown,
};

[[nodiscard]] const char* to_string(Framework framework) noexcept;

struct FrameworkDetection {
    Framework framework{Framework::static_html};
    std::string version{};      ///< Dependency version range from package.json
    bool has_app_dir{false};
    bool has_pages_dir{false};
    std::string public_dir{"public"};
    std::string output_dir{"public"};
    std::string config_file{};  ///< Framework config file name, empty when none applies
    double confidence{0.5};     ///< 0..1
    bool typescript{false};

    [[nodiscard]] bool is_next() const noexcept {
        return framework == Framework::next_app || framework == Framework::next_pages;
    }
};

/**
 * \brief Classifies a web project from package.json and its directory layout.
 *
 * Without package.json the project is static HTML. A malformed package.json
 * also yields static HTML (confidence 0.3) and a warning on `sink`.
 */
[[nodiscard]] FrameworkDetection detect_framework(const std::filesystem::path& project_root,
                                                  const DiagnosticSink& sink = {});

}  // namespace shipkit::readiness
