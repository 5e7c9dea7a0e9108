/**
 * @file test_scoring.cpp
 * @brief Section scores, rounding and scoring policy validation.
 *
 * @author shipkit contributors
 * @date 2026
 * @copyright MIT License
 */

// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 shipkit contributors

#include <catch2/catch.hpp>

#include "shipkit/scoring.hpp"

#include <stdexcept>
#include <vector>

using shipkit::readiness::ChecklistItem;
using shipkit::readiness::CheckStatus;
using shipkit::readiness::ScoringPolicy;

namespace {

ChecklistItem item(const char* id, CheckStatus status, bool required = false) {
    ChecklistItem out;
    out.id = id;
    out.name = id;
    out.status = status;
    out.required = required;
    return out;
}

}  // namespace

TEST_CASE("section_score averages item points", "[scoring]") {
    SECTION("empty section scores 100") {
        REQUIRE(shipkit::readiness::section_score({}) == 100);
    }

    SECTION("all pass") {
        REQUIRE(shipkit::readiness::section_score({item("a", CheckStatus::pass), item("b", CheckStatus::pass)}) ==
                100);
    }

    SECTION("all fail") {
        REQUIRE(shipkit::readiness::section_score({item("a", CheckStatus::fail), item("b", CheckStatus::fail)}) ==
                0);
    }

    SECTION("mixed statuses round half up") {
        // (100 + 50 + 75 + 0) / 4 = 56.25
        const std::vector<ChecklistItem> items{
            item("a", CheckStatus::pass),
            item("b", CheckStatus::warning),
            item("c", CheckStatus::skip),
            item("d", CheckStatus::fail),
        };
        REQUIRE(shipkit::readiness::section_score(items) == 56);
    }

    SECTION("pass and warning land exactly on 75") {
        REQUIRE(shipkit::readiness::section_score({item("a", CheckStatus::pass), item("b", CheckStatus::warning)}) ==
                75);
    }

    SECTION("custom policy") {
        ScoringPolicy policy;
        policy.skip_points = 0;
        REQUIRE(shipkit::readiness::section_score({item("a", CheckStatus::skip)}, policy) == 0);
    }
}

TEST_CASE("round_score rounds halves up", "[scoring]") {
    REQUIRE(shipkit::readiness::round_score(62.5) == 63);
    REQUIRE(shipkit::readiness::round_score(62.49) == 62);
    REQUIRE(shipkit::readiness::round_score(0.0) == 0);
    REQUIRE(shipkit::readiness::round_score(100.0) == 100);
}

TEST_CASE("make_section derives the score from its items", "[scoring]") {
    const auto section = shipkit::readiness::make_section(
        "Security", {item("env", CheckStatus::warning, true), item("https", CheckStatus::skip, true)}, true);
    REQUIRE(section.name == "Security");
    REQUIRE(section.required);
    REQUIRE(section.items.size() == 2);
    REQUIRE(section.score == 63);
}

TEST_CASE("ScoringPolicy rejects out-of-range values", "[scoring][config]") {
    ScoringPolicy policy;
    REQUIRE_NOTHROW(policy.validate());

    SECTION("negative weight") {
        policy.warning_points = -1;
        REQUIRE_THROWS_AS(policy.validate(), std::invalid_argument);
    }

    SECTION("weight above 100") {
        policy.pass_points = 101;
        REQUIRE_THROWS_AS(policy.validate(), std::invalid_argument);
    }

    SECTION("threshold above 100") {
        policy.ready_threshold = 150;
        REQUIRE_THROWS_AS(policy.validate(), std::invalid_argument);
    }
}

TEST_CASE("ScoringPolicy points per status", "[scoring]") {
    const ScoringPolicy policy;
    REQUIRE(policy.points(CheckStatus::pass) == 100);
    REQUIRE(policy.points(CheckStatus::warning) == 50);
    REQUIRE(policy.points(CheckStatus::skip) == 75);
    REQUIRE(policy.points(CheckStatus::fail) == 0);
}
