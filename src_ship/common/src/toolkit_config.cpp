#include "shipkit/toolkit_config.hpp"

#include <fstream>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

namespace {

using nlohmann::json;

constexpr const char* kSource = "config";

void merge_performance(const json& section, shipkit::ToolkitConfig& config) {
    if (!section.is_object()) {
        return;
    }
    if (auto it = section.find("targetScore"); it != section.end() && it->is_number_integer()) {
        config.target_score = it->get<int>();
    }
}

void merge_deploy(const json& section, shipkit::ToolkitConfig& config) {
    if (!section.is_object()) {
        return;
    }
    if (auto it = section.find("platform"); it != section.end() && it->is_string()) {
        config.deploy_platform = it->get<std::string>();
    }
    if (auto it = section.find("autoConfirm"); it != section.end() && it->is_boolean()) {
        config.deploy_auto_confirm = it->get<bool>();
    }
}

}  // namespace

namespace shipkit {

std::filesystem::path tool_dir(const std::filesystem::path& project_root) {
    return project_root / kToolDirName;
}

std::filesystem::path config_path(const std::filesystem::path& project_root) {
    return tool_dir(project_root) / "config.json";
}

ToolkitConfig load_toolkit_config(const std::filesystem::path& project_root,
                                  const DiagnosticSink& sink) {
    ToolkitConfig config;
    const auto path = config_path(project_root);

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return config;
    }

    std::ifstream input(path);
    if (!input.is_open()) {
        emit(sink, Severity::warn, kSource, "Unable to open " + path.string() + ", using defaults");
        return config;
    }

    std::ostringstream buffer;
    buffer << input.rdbuf();

    const json document = json::parse(buffer.str(), nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        emit(sink, Severity::warn, kSource, "Malformed " + path.string() + ", using defaults");
        return config;
    }

    if (auto it = document.find("performance"); it != document.end()) {
        merge_performance(*it, config);
    }
    if (auto it = document.find("deploy"); it != document.end()) {
        merge_deploy(*it, config);
    }
    return config;
}

}  // namespace shipkit
