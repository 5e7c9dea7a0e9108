#include "shipkit/checklist_report.hpp"
#include "shipkit/checklist_json.hpp"

#include <algorithm>
#include <fstream>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using shipkit::readiness::CheckStatus;
using shipkit::readiness::ChecklistItem;
using shipkit::readiness::ChecklistSection;
using shipkit::readiness::LaunchChecklist;

const char* status_marker(CheckStatus status) {
    switch (status) {
        case CheckStatus::pass:
            return "PASS";
        case CheckStatus::fail:
            return "FAIL";
        case CheckStatus::warning:
            return "WARN";
        case CheckStatus::skip:
            return "SKIP";
    }
    return "SKIP";
}

const char* section_marker(const ChecklistSection& section) {
    if (section.score >= 80) {
        return "PASS";
    }
    return section.score >= 50 ? "WARN" : "FAIL";
}

std::string message_suffix(const ChecklistItem& item) {
    return item.message ? " - " + *item.message : std::string{};
}

void print_issues(std::ostream& out, const std::vector<ChecklistItem>& items, const char* fix_label) {
    for (const auto& item : items) {
        out << "  - " << item.name << ": " << item.message.value_or("") << '\n';
        if (item.fix) {
            out << "    " << fix_label << ": " << *item.fix << '\n';
        }
    }
}

void print_heading(std::ostream& out, const std::string& title) {
    out << '\n' << title << '\n' << std::string(title.size(), '=') << '\n';
}

void ensure_parent(const std::filesystem::path& destination) {
    const auto parent = destination.parent_path();
    if (!parent.empty() && !std::filesystem::exists(parent)) {
        std::filesystem::create_directories(parent);
    }
}

}  // namespace

namespace shipkit::report {

const char* to_string(ReportFormat format) noexcept {
    switch (format) {
        case ReportFormat::html:
            return "html";
        case ReportFormat::json:
            return "json";
        case ReportFormat::markdown:
            return "md";
    }
    return "json";
}

ReportFormat parse_report_format(std::string_view text) {
    if (text == "html") {
        return ReportFormat::html;
    }
    if (text == "json") {
        return ReportFormat::json;
    }
    if (text == "md" || text == "markdown") {
        return ReportFormat::markdown;
    }
    throw std::invalid_argument("Unknown report format '" + std::string(text) + "' (expected html, json or md)");
}

std::string escape_html(std::string_view input) {
    std::ostringstream oss;
    for (char ch : input) {
        switch (ch) {
            case '&':
                oss << "&amp;";
                break;
            case '<':
                oss << "&lt;";
                break;
            case '>':
                oss << "&gt;";
                break;
            case '"':
                oss << "&quot;";
                break;
            case '\'':
                oss << "&#39;";
                break;
            default:
                oss << ch;
        }
    }
    return oss.str();
}

std::vector<std::string> next_steps(const LaunchChecklist& checklist) {
    std::vector<std::string> steps;

    if (!checklist.critical_issues.empty()) {
        steps.emplace_back("Fix critical issues listed above");

        std::vector<std::string> fixes;
        for (const auto& issue : checklist.critical_issues) {
            if (issue.automated && issue.fix &&
                std::find(fixes.begin(), fixes.end(), *issue.fix) == fixes.end()) {
                fixes.push_back(*issue.fix);
            }
        }
        if (!fixes.empty()) {
            std::string joined;
            for (const auto& fix : fixes) {
                if (!joined.empty()) {
                    joined += ", ";
                }
                joined += fix;
            }
            steps.push_back("Run automated fixes: " + joined);
        }
    }

    if (!checklist.warnings.empty()) {
        steps.emplace_back("Review and address warnings");
    }

    if (checklist.ready_to_launch) {
        steps.emplace_back("Deploy to production: /ship-deploy");
        steps.emplace_back("Share your launch: /ship-export");
        steps.emplace_back("Monitor analytics and errors");
    } else {
        steps.emplace_back("Run /ship-launch again after fixes");
    }
    return steps;
}

void render_console(const LaunchChecklist& checklist, std::ostream& out) {
    print_heading(out, "Pre-Launch Checklist");

    for (const auto& section : checklist.sections) {
        out << '\n'
            << '[' << section_marker(section) << "] " << section.name << " (" << section.items.size()
            << " items) - " << section.score << "%\n";
        for (const auto& item : section.items) {
            out << "   [" << status_marker(item.status) << "] " << item.name << message_suffix(item) << '\n';
        }
    }

    print_heading(out, "Overall Score: " + std::to_string(checklist.overall_score) + "/100");
    if (checklist.ready_to_launch) {
        out << "READY TO LAUNCH: the project passes all critical checks.\n";
    } else {
        out << "NOT READY: fix the critical issues before launching.\n";
    }

    if (!checklist.critical_issues.empty()) {
        print_heading(out, "Critical Issues");
        print_issues(out, checklist.critical_issues, "Fix");
    }
    if (!checklist.warnings.empty()) {
        print_heading(out, "Warnings");
        print_issues(out, checklist.warnings, "Suggestion");
    }

    print_heading(out, "Next Steps");
    const auto steps = next_steps(checklist);
    for (std::size_t index = 0; index < steps.size(); ++index) {
        out << (index + 1) << ". " << steps[index] << '\n';
    }
    out << "\nTip: run the full workflow to optimise everything at once.\n";
}

std::string render_html(const LaunchChecklist& checklist) {
    std::ostringstream oss;
    oss << "<!DOCTYPE html><html lang=\"en\"><head><meta charset=\"utf-8\"/>"
        << "<meta name=\"viewport\" content=\"width=device-width, initial-scale=1.0\"/>"
        << "<title>Launch Checklist Report</title>"
        << "<style>"
        << "body{font-family:system-ui, sans-serif;margin:2rem;background:#f5f5f5;line-height:1.6;}"
        << ".header{color:#fff;padding:2rem;text-align:center;border-radius:8px;}"
        << ".ready{background:#10b981;}"
        << ".not-ready{background:#ef4444;}"
        << ".score{font-size:3rem;font-weight:bold;}"
        << "table{border-collapse:collapse;width:100%;background:#fff;margin-bottom:1.5rem;}"
        << "th,td{border:1px solid #e5e5e5;padding:0.5rem;vertical-align:top;}"
        << "th{background:#f9fafb;text-align:left;}"
        << ".status-pass{background:#f0fdf4;}"
        << ".status-warning{background:#fffbeb;}"
        << ".status-fail{background:#fef2f2;}"
        << ".status-skip{background:#f9fafb;}"
        << ".fix{color:#3b82f6;font-size:0.85rem;}"
        << "</style></head><body>";

    oss << "<div class=\"header " << (checklist.ready_to_launch ? "ready" : "not-ready") << "\">"
        << "<h1>Launch Checklist Report</h1>"
        << "<div class=\"score\">" << checklist.overall_score << "/100</div>"
        << "<div class=\"status\">" << (checklist.ready_to_launch ? "Ready to Launch" : "Not Ready to Launch")
        << "</div></div>";

    oss << "<section><h2>Summary</h2><ul>";
    oss << "<li>Sections: " << checklist.sections.size() << "</li>";
    oss << "<li>Critical issues: " << checklist.critical_issues.size() << "</li>";
    oss << "<li>Warnings: " << checklist.warnings.size() << "</li>";
    oss << "</ul></section>";

    for (const auto& section : checklist.sections) {
        oss << "<section><h2>" << escape_html(section.name) << " <small>" << section.score << "%</small></h2>";
        oss << "<table><thead><tr><th>Status</th><th>Check</th><th>Details</th></tr></thead><tbody>";
        for (const auto& item : section.items) {
            const auto status = std::string(readiness::to_string(item.status));
            oss << "<tr class=\"status-" << status << "\">";
            oss << "<td>" << status_marker(item.status) << "</td>";
            oss << "<td>" << escape_html(item.name) << (item.required ? " <strong>(required)</strong>" : "")
                << "</td>";
            oss << "<td>";
            if (item.message) {
                oss << escape_html(*item.message);
            }
            if (item.fix) {
                oss << "<div class=\"fix\">Fix: " << escape_html(*item.fix) << "</div>";
            }
            oss << "</td></tr>";
        }
        oss << "</tbody></table></section>";
    }

    oss << "<footer>Generated: " << escape_html(format_iso8601(checklist.timestamp)) << "</footer>";
    oss << "</body></html>";
    return oss.str();
}

std::string render_markdown(const LaunchChecklist& checklist) {
    std::ostringstream oss;
    oss << "# Launch Checklist Report\n\n";
    oss << "**Score:** " << checklist.overall_score << "/100\n\n";
    oss << "**Status:** " << (checklist.ready_to_launch ? "Ready to Launch" : "Not Ready") << "\n\n";
    oss << "**Generated:** " << format_iso8601(checklist.timestamp) << "\n\n";

    oss << "## Summary\n\n";
    oss << "- **Critical Issues:** " << checklist.critical_issues.size() << '\n';
    oss << "- **Warnings:** " << checklist.warnings.size() << '\n';
    oss << "- **Sections:** " << checklist.sections.size() << '\n';

    for (const auto& section : checklist.sections) {
        oss << "\n### " << section.name << " (" << section.score << "%)\n\n";
        for (const auto& item : section.items) {
            oss << "- [" << status_marker(item.status) << "] " << item.name << message_suffix(item) << '\n';
            if (item.fix) {
                oss << "  - Fix: " << *item.fix << '\n';
            }
        }
    }

    if (!checklist.critical_issues.empty()) {
        oss << "\n## Critical Issues\n\n";
        for (const auto& issue : checklist.critical_issues) {
            oss << "- **" << issue.name << "**: " << issue.message.value_or("") << '\n';
            if (issue.fix) {
                oss << "  - Fix: " << *issue.fix << '\n';
            }
        }
    }
    return oss.str();
}

std::string render(ReportFormat format, const LaunchChecklist& checklist) {
    switch (format) {
        case ReportFormat::html:
            return render_html(checklist);
        case ReportFormat::json:
            return readiness::dump_checklist(checklist);
        case ReportFormat::markdown:
            return render_markdown(checklist);
    }
    throw std::invalid_argument("Unsupported report format");
}

void write_file(const std::filesystem::path& destination, const std::string& content) {
    ensure_parent(destination);
    std::ofstream output(destination, std::ios::binary);
    if (!output.is_open()) {
        throw std::runtime_error("Unable to open output file: " + destination.string());
    }
    output << content;
    if (!output) {
        throw std::runtime_error("Failed to write output file: " + destination.string());
    }
}

void ReportWriter::write_checklist(const std::filesystem::path& destination,
                                   ReportFormat format,
                                   const LaunchChecklist& checklist) const {
    write_file(destination, render(format, checklist));
}

}  // namespace shipkit::report
