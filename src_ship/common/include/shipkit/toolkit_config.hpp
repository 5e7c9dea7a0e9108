#pragma once

#include "diagnostics.hpp"

#include <filesystem>
#include <string>

namespace shipkit {

/// Name of the per-project tool-config directory.
inline constexpr const char* kToolDirName = ".ship-toolkit";

[[nodiscard]] std::filesystem::path tool_dir(const std::filesystem::path& project_root);

[[nodiscard]] std::filesystem::path config_path(const std::filesystem::path& project_root);

/**
 * \brief Project-level settings read from `.ship-toolkit/config.json`.
 *
 * Only the keys the readiness and workflow layers consume are modelled:
 * \code{.json}
 * {
 *   "performance": { "targetScore": 90 },
 *   "deploy": { "platform": "vercel", "autoConfirm": false }
 * }
 * \endcode
 * Keys absent from the file keep their defaults; unknown keys are ignored.
 */
struct ToolkitConfig {
    int target_score{90};
    std::string deploy_platform{};
    bool deploy_auto_confirm{false};
};

/**
 * \brief Loads the project configuration, merged over the defaults.
 *
 * Never throws: a missing file yields the defaults, an unreadable or malformed
 * file yields the defaults and a warning on `sink`.
 */
[[nodiscard]] ToolkitConfig load_toolkit_config(const std::filesystem::path& project_root,
                                                const DiagnosticSink& sink = {});

}  // namespace shipkit
