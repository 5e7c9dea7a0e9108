#include "shipkit/framework.hpp"
#include "shipkit/project_files.hpp"

#include <string>

#include <nlohmann/json.hpp>

namespace {

using nlohmann::json;

json merged_dependencies(const json& package) {
    json deps = json::object();
    for (const char* key : {"dependencies", "devDependencies"}) {
        auto it = package.find(key);
        if (it == package.end() || !it->is_object()) {
            continue;
        }
        for (const auto& [name, version] : it->items()) {
            deps[name] = version;
        }
    }
    return deps;
}

std::string dependency_version(const json& deps, const char* name) {
    auto it = deps.find(name);
    if (it == deps.end()) {
        return {};
    }
    return it->is_string() ? it->get<std::string>() : std::string{"*"};
}

bool has_dependency(const json& deps, const char* name) {
    return deps.contains(name);
}

}  // namespace

namespace shipkit::readiness {

const char* to_string(Framework framework) noexcept {
    switch (framework) {
        case Framework::next_app:    return "next-app";
        case Framework::next_pages:  return "next-pages";
        case Framework::react_vite:  return "react-vite";
        case Framework::react_cra:   return "react-cra";
        case Framework::vue:         return "vue";
        case Framework::svelte:      return "svelte";
        case Framework::astro:       return "astro";
        case Framework::static_html: return "static-html";
        case Framework::unknown:     return "unknown";
    }
    return "unknown";
}

FrameworkDetection detect_framework(const std::filesystem::path& project_root, const DiagnosticSink& sink) {
    const ProjectFiles files(project_root);

    FrameworkDetection result;
    result.typescript = files.exists("tsconfig.json");

    const auto package_text = files.read_text("package.json");
    if (!package_text) {
        if (files.exists("index.html")) {
            result.confidence = 0.7;
        }
        return result;
    }

    const json package = json::parse(*package_text, nullptr, false);
    if (package.is_discarded() || !package.is_object()) {
        emit(sink, Severity::warn, "framework", "Failed to parse package.json in " + project_root.string());
        result.confidence = 0.3;
        return result;
    }

    const json deps = merged_dependencies(package);

    if (has_dependency(deps, "next")) {
        result.has_app_dir = files.exists("app");
        result.has_pages_dir = files.exists("pages");
        result.framework = result.has_app_dir ? Framework::next_app : Framework::next_pages;
        result.version = dependency_version(deps, "next");
        result.output_dir = ".next";
        result.config_file = "next.config.js";
        for (const char* variant : {"next.config.js", "next.config.mjs", "next.config.ts"}) {
            if (files.exists(variant)) {
                result.config_file = variant;
                break;
            }
        }
        result.confidence = (result.has_app_dir || result.has_pages_dir) ? 0.9 : 0.6;
    } else if (has_dependency(deps, "vite") && has_dependency(deps, "react")) {
        result.framework = Framework::react_vite;
        result.version = dependency_version(deps, "vite");
        result.output_dir = "dist";
        result.config_file = "vite.config.ts";
        result.confidence =
            files.any_exists({"vite.config.ts", "vite.config.js", "vite.config.mjs"}) ? 0.95 : 0.85;
    } else if (has_dependency(deps, "react-scripts")) {
        result.framework = Framework::react_cra;
        result.version = dependency_version(deps, "react-scripts");
        result.output_dir = "build";
        result.confidence = 0.95;
    } else if (has_dependency(deps, "vue")) {
        result.framework = Framework::vue;
        result.version = dependency_version(deps, "vue");
        result.output_dir = "dist";
        result.config_file = "vite.config.ts";
        result.confidence = files.any_exists({"vite.config.ts", "vite.config.js"}) ? 0.9 : 0.75;
    } else if (has_dependency(deps, "@sveltejs/kit")) {
        result.framework = Framework::svelte;
        result.version = dependency_version(deps, "@sveltejs/kit");
        result.public_dir = "static";
        result.output_dir = "build";
        result.config_file = "svelte.config.js";
        result.confidence = 0.95;
    } else if (has_dependency(deps, "astro")) {
        result.framework = Framework::astro;
        result.version = dependency_version(deps, "astro");
        result.output_dir = "dist";
        result.config_file = "astro.config.mjs";
        result.confidence =
            files.any_exists({"astro.config.mjs", "astro.config.js", "astro.config.ts"}) ? 0.95 : 0.85;
    } else if (has_dependency(deps, "react")) {
        result.framework = Framework::unknown;
        result.output_dir = "build";
        result.confidence = 0.5;
    }

    return result;
}

}  // namespace shipkit::readiness
