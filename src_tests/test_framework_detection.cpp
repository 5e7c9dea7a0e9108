/**
 * @file test_framework_detection.cpp
 * @brief Project classification from package.json and directory layout.
 *
 * @author shipkit contributors
 * @date 2026
 * @copyright MIT License
 */

// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 shipkit contributors

#include <catch2/catch.hpp>

#include "shipkit/framework.hpp"
#include "test_support.hpp"

#include <string>

using shipkit::readiness::Framework;
using shipkit::readiness::detect_framework;
using shipkit::testing::CollectingSink;
using shipkit::testing::TempProject;

TEST_CASE("Next.js projects are split by router", "[framework]") {
    TempProject project;
    project.write("package.json", R"({"dependencies": {"next": "14.1.0", "react": "18.2.0"}})");

    SECTION("app router") {
        project.mkdir("app");
        project.write("tsconfig.json", "{}");
        const auto detection = detect_framework(project.root());
        REQUIRE(detection.framework == Framework::next_app);
        REQUIRE(detection.version == "14.1.0");
        REQUIRE(detection.has_app_dir);
        REQUIRE(detection.output_dir == ".next");
        REQUIRE(detection.typescript);
        REQUIRE(detection.is_next());
    }

    SECTION("pages router") {
        project.mkdir("pages");
        const auto detection = detect_framework(project.root());
        REQUIRE(detection.framework == Framework::next_pages);
        REQUIRE(detection.has_pages_dir);
        REQUIRE_FALSE(detection.typescript);
    }

    SECTION("config file variant") {
        project.mkdir("app");
        project.write("next.config.mjs", "export default {}");
        REQUIRE(detect_framework(project.root()).config_file == "next.config.mjs");
    }
}

TEST_CASE("other frameworks are recognised from dependencies", "[framework]") {
    TempProject project;

    SECTION("vite + react") {
        project.write("package.json", R"({"devDependencies": {"vite": "^5.0.0"}, "dependencies": {"react": "18"}})");
        const auto detection = detect_framework(project.root());
        REQUIRE(detection.framework == Framework::react_vite);
        REQUIRE(detection.output_dir == "dist");
    }

    SECTION("create react app") {
        project.write("package.json", R"({"dependencies": {"react": "18", "react-scripts": "5.0.1"}})");
        REQUIRE(detect_framework(project.root()).framework == Framework::react_cra);
    }

    SECTION("vue") {
        project.write("package.json", R"({"dependencies": {"vue": "^3.4.0"}})");
        REQUIRE(detect_framework(project.root()).framework == Framework::vue);
    }

    SECTION("sveltekit uses static/") {
        project.write("package.json", R"({"devDependencies": {"@sveltejs/kit": "^2.0.0"}})");
        const auto detection = detect_framework(project.root());
        REQUIRE(detection.framework == Framework::svelte);
        REQUIRE(detection.public_dir == "static");
    }

    SECTION("astro") {
        project.write("package.json", R"({"dependencies": {"astro": "^4.0.0"}})");
        REQUIRE(detect_framework(project.root()).framework == Framework::astro);
    }

    SECTION("plain react is unknown") {
        project.write("package.json", R"({"dependencies": {"react": "18"}})");
        REQUIRE(detect_framework(project.root()).framework == Framework::unknown);
    }
}

TEST_CASE("projects without a usable package.json are static", "[framework]") {
    TempProject project;
    CollectingSink sink;

    SECTION("no package.json") {
        project.write("index.html", "<html></html>");
        const auto detection = detect_framework(project.root(), sink.fn());
        REQUIRE(detection.framework == Framework::static_html);
        REQUIRE(sink.events->empty());
    }

    SECTION("malformed package.json") {
        project.write("package.json", "{ \"dependencies\": ");
        const auto detection = detect_framework(project.root(), sink.fn());
        REQUIRE(detection.framework == Framework::static_html);
        REQUIRE(sink.contains(shipkit::Severity::warn, "framework"));
    }
}

TEST_CASE("framework names", "[framework]") {
    REQUIRE(std::string(shipkit::readiness::to_string(Framework::next_app)) == "next-app");
    REQUIRE(std::string(shipkit::readiness::to_string(Framework::static_html)) == "static-html");
}
