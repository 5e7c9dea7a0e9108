#include "shipkit/workflow_report.hpp"
#include "shipkit/toolkit_config.hpp"
#include "shipkit/workflow_json.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <iterator>
#include <string>
#include <variant>

#include <nlohmann/json.hpp>

namespace {

using nlohmann::json;
using shipkit::workflow::StepStatus;
using shipkit::workflow::WorkflowStep;
using shipkit::workflow::WorkflowSummary;

const char* step_marker(StepStatus status) {
    switch (status) {
        case StepStatus::completed:
            return "DONE";
        case StepStatus::failed:
            return "FAIL";
        case StepStatus::skipped:
            return "SKIP";
        case StepStatus::running:
            return "RUN ";
        case StepStatus::pending:
            return "WAIT";
    }
    return "WAIT";
}

std::string seconds_with_tenths(std::int64_t ms) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.1fs", static_cast<double>(ms) / 1000.0);
    return buffer;
}

void print_summary(std::ostream& out, const WorkflowSummary& summary) {
    out << "  Assets optimized:  " << summary.assets_generated << '\n';
    out << "  SEO score:         " << summary.seo_score << "/100\n";
    out << "  Performance score: " << summary.performance_score << "/100\n";
    out << "  Launch score:      " << summary.launch_score << "/100\n";
    out << "  Ready to launch:   " << (summary.ready_to_launch ? "yes" : "no") << '\n';
}

}  // namespace

namespace shipkit::report {
namespace {

// Short payload description shown next to a step on the console.
std::string payload_detail(const WorkflowStep& step) {
    if (const auto* assets = std::get_if<workflow::AssetReport>(&step.result)) {
        std::string detail = std::to_string(assets->assets_generated) + " assets";
        if (assets->total_savings > 0) {
            detail += ", " + format_bytes(assets->total_savings) + " saved";
        }
        return detail;
    }
    if (const auto* seo = std::get_if<workflow::SeoReport>(&step.result)) {
        return "SEO " + std::to_string(seo->seo_score) + "/100";
    }
    if (const auto* perf = std::get_if<workflow::PerformanceReport>(&step.result)) {
        std::string detail = "performance " + std::to_string(perf->performance_score) + "/100";
        if (perf->bytes_saved > 0) {
            detail += ", " + format_bytes(perf->bytes_saved) + " saved";
        }
        return detail;
    }
    if (const auto* checklist = std::get_if<readiness::LaunchChecklist>(&step.result)) {
        return "launch " + std::to_string(checklist->overall_score) + "/100";
    }
    if (const auto* deploy = std::get_if<workflow::DeploymentReport>(&step.result)) {
        return deploy->url ? *deploy->url : deploy->platform + (deploy->skipped ? " (manual)" : "");
    }
    return {};
}

}  // namespace

std::string format_duration(std::int64_t ms) {
    const std::int64_t seconds = ms > 0 ? ms / 1000 : 0;
    const std::int64_t minutes = seconds / 60;
    const std::int64_t hours = minutes / 60;

    if (hours > 0) {
        return std::to_string(hours) + "h " + std::to_string(minutes % 60) + "m " + std::to_string(seconds % 60) + "s";
    }
    if (minutes > 0) {
        return std::to_string(minutes) + "m " + std::to_string(seconds % 60) + "s";
    }
    return std::to_string(seconds) + "s";
}

std::string format_bytes(std::int64_t bytes) {
    if (bytes <= 0) {
        return "0 B";
    }
    static constexpr const char* kUnits[] = {"B", "KB", "MB", "GB"};
    double value = static_cast<double>(bytes);
    std::size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < std::size(kUnits)) {
        value /= 1024.0;
        ++unit;
    }
    if (unit == 0) {
        return std::to_string(bytes) + " B";
    }
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.1f %s", value, kUnits[unit]);
    return buffer;
}

std::string progress_bar(int current, int total, std::size_t width) {
    int percentage = 0;
    if (total > 0) {
        percentage = static_cast<int>(std::floor(100.0 * current / total + 0.5));
        percentage = std::clamp(percentage, 0, 100);
    }
    const auto filled = static_cast<std::size_t>(std::floor(percentage / 100.0 * static_cast<double>(width) + 0.5));

    std::string bar = "[";
    bar.append(filled, '#');
    bar.append(width - filled, '-');
    bar += "] " + std::to_string(percentage) + "% (" + std::to_string(current) + "/" + std::to_string(total) + ")";
    return bar;
}

void render_workflow_console(const workflow::WorkflowResult& result, std::ostream& out) {
    out << "\nShip Workflow\n=============\n";
    for (const auto& step : result.steps) {
        out << '[' << step_marker(step.status) << "] " << step.name;
        if (step.duration_ms) {
            out << " (" << format_duration(*step.duration_ms) << ')';
        }
        if (const auto detail = payload_detail(step); !detail.empty()) {
            out << " - " << detail;
        }
        out << '\n';
        if (step.error) {
            out << "       error: " << *step.error << '\n';
        }
    }

    out << "\nSummary (" << format_duration(result.total_duration_ms) << ")\n";
    print_summary(out, result.summary);
    out << '\n' << (result.overall_success ? "Workflow completed." : "Workflow finished with failures.") << '\n';
}

void render_history(const std::vector<workflow::HistoryEntry>& history, std::ostream& out) {
    if (history.empty()) {
        out << "No workflow history found\n";
        return;
    }

    out << "\nWorkflow History (last " << history.size() << " runs)\n";
    for (std::size_t index = 0; index < history.size(); ++index) {
        const auto& entry = history[index];
        out << '\n'
            << (index + 1) << ". [" << (entry.success ? "PASS" : "FAIL") << "] " << format_iso8601(entry.timestamp)
            << '\n';
        out << "   Duration: " << format_duration(entry.duration_ms) << '\n';
        out << "   Launch Score: " << entry.summary.launch_score << "/100\n";
        if (entry.summary.assets_generated > 0) {
            out << "   Assets: " << entry.summary.assets_generated << " optimized\n";
        }
        if (entry.summary.performance_score > 0) {
            out << "   Performance: " << entry.summary.performance_score << "/100\n";
        }
    }
}

std::string render_workflow_markdown(const workflow::WorkflowResult& result, Timestamp generated) {
    std::ostringstream oss;
    oss << "# Ship Complete - Workflow Report\n\n";
    oss << "**Generated:** " << format_iso8601(generated) << "\n\n";
    oss << "**Duration:** " << format_duration(result.total_duration_ms) << "\n\n";
    oss << "**Status:** " << (result.overall_success ? "Success" : "Failed") << "\n\n";

    const auto& summary = result.summary;
    oss << "## Summary\n\n";
    oss << "- **Assets Optimized:** " << summary.assets_generated << '\n';
    oss << "- **SEO Score:** " << summary.seo_score << "/100\n";
    oss << "- **Performance Score:** " << summary.performance_score << "/100\n";
    oss << "- **Launch Score:** " << summary.launch_score << "/100\n";
    oss << "- **Ready to Launch:** " << (summary.ready_to_launch ? "Yes" : "No") << "\n\n";

    oss << "## Steps\n\n";
    for (const auto& step : result.steps) {
        oss << "### [" << step_marker(step.status) << "] " << step.name;
        if (step.duration_ms && *step.duration_ms > 0) {
            oss << " (" << seconds_with_tenths(*step.duration_ms) << ')';
        }
        oss << "\n\n";
        oss << "**Description:** " << step.description << "\n\n";
        oss << "**Status:** " << workflow::to_string(step.status) << "\n\n";
        if (step.error) {
            oss << "**Error:** " << *step.error << "\n\n";
        }
        if (!std::holds_alternative<std::monostate>(step.result)) {
            const auto payload =
                workflow::payload_to_json(step.result).dump(2, ' ', false, json::error_handler_t::replace);
            oss << "**Result:**\n```json\n" << payload << "\n```\n\n";
        }
    }

    if (result.launch_checklist) {
        const auto& checklist = *result.launch_checklist;
        oss << "## Launch Checklist\n\n";
        oss << "**Overall Score:** " << checklist.overall_score << "/100\n\n";
        oss << "**Ready to Launch:** " << (checklist.ready_to_launch ? "Yes" : "No") << "\n\n";
        if (!checklist.critical_issues.empty()) {
            oss << "### Critical Issues\n\n";
            for (const auto& issue : checklist.critical_issues) {
                oss << "- **" << issue.name << "**: " << issue.message.value_or("") << '\n';
            }
            oss << '\n';
        }
        oss << "### Next Steps\n\n";
        const auto steps = next_steps(checklist);
        for (std::size_t index = 0; index < steps.size(); ++index) {
            oss << (index + 1) << ". " << steps[index] << '\n';
        }
    }

    if (result.deployment_url) {
        oss << "\n## Deployment\n\n**URL:** " << *result.deployment_url << '\n';
    }
    return oss.str();
}

std::string render_workflow_json(const workflow::WorkflowResult& result) {
    const json document = result;
    return document.dump(2, ' ', false, json::error_handler_t::replace);
}

std::filesystem::path export_workflow_report(const std::filesystem::path& project_root,
                                             const workflow::WorkflowResult& result,
                                             ReportFormat format,
                                             Timestamp generated) {
    if (format == ReportFormat::html) {
        throw std::invalid_argument("Workflow reports are written as json or md");
    }

    const auto destination =
        tool_dir(project_root) / ("workflow-report-" + file_stamp(generated) + "." + to_string(format));
    const auto content =
        format == ReportFormat::json ? render_workflow_json(result) : render_workflow_markdown(result, generated);
    write_file(destination, content);
    return destination;
}

}  // namespace shipkit::report
