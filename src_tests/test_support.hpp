/**
 * @file test_support.hpp
 * @brief Shared fixtures: a throwaway project directory and a manual clock.
 *
 * @author shipkit contributors
 * @date 2026
 * @copyright MIT License
 */

// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 shipkit contributors

#pragma once

#include "shipkit/diagnostics.hpp"
#include "shipkit/timestamp.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

namespace shipkit::testing {

/// Creates a unique directory under the system temp dir and removes it on destruction.
class TempProject {
public:
    TempProject() {
        static std::atomic<int> counter{0};
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        root_ = std::filesystem::temp_directory_path() /
                ("shipkit-test-" + std::to_string(stamp) + "-" + std::to_string(counter++));
        std::filesystem::create_directories(root_);
    }

    ~TempProject() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    TempProject(const TempProject&) = delete;
    TempProject& operator=(const TempProject&) = delete;

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

    void write(const std::filesystem::path& relative, const std::string& content = {}) const {
        const auto path = root_ / relative;
        std::filesystem::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << content;
    }

    void mkdir(const std::filesystem::path& relative) const {
        std::filesystem::create_directories(root_ / relative);
    }

private:
    std::filesystem::path root_;
};

/// Clock that only moves when told to; copies share the same time.
class ManualClock {
public:
    explicit ManualClock(Timestamp start = Timestamp{std::chrono::milliseconds{1'760'000'000'000}})
        : now_(std::make_shared<Timestamp>(start)) {}

    [[nodiscard]] Timestamp now() const { return *now_; }

    void advance(std::chrono::milliseconds delta) { *now_ += delta; }

    void set(Timestamp value) { *now_ = value; }

    [[nodiscard]] ClockFn fn() const {
        auto shared = now_;
        return [shared]() { return *shared; };
    }

private:
    std::shared_ptr<Timestamp> now_;
};

/// Sink that keeps every diagnostic for later inspection.
struct CollectingSink {
    std::shared_ptr<std::vector<Diagnostic>> events = std::make_shared<std::vector<Diagnostic>>();

    [[nodiscard]] DiagnosticSink fn() const {
        auto shared = events;
        return [shared](const Diagnostic& d) { shared->push_back(d); };
    }

    [[nodiscard]] bool contains(Severity severity, const std::string& source) const {
        for (const auto& d : *events) {
            if (d.severity == severity && d.source == source) {
                return true;
            }
        }
        return false;
    }
};

}  // namespace shipkit::testing
