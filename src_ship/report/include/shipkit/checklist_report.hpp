#pragma once

#include "shipkit/checklist.hpp"

#include <filesystem>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

namespace shipkit::report {

enum class ReportFormat {
    html,
    json,
    markdown,
};

/// "html", "json" or "md"; doubles as the file extension.
[[nodiscard]] const char* to_string(ReportFormat format) noexcept;

/// Accepts "html", "json", "md" and "markdown"; throws std::invalid_argument otherwise.
[[nodiscard]] ReportFormat parse_report_format(std::string_view text);

[[nodiscard]] std::string escape_html(std::string_view input);

/**
 * \brief Ordered follow-up actions for a checklist.
 *
 * Critical issues come first, followed by the distinct `fix` hints of
 * automated critical items in first-seen order, a reminder about warnings,
 * and then either the launch actions or a prompt to re-run the checklist.
 */
[[nodiscard]] std::vector<std::string> next_steps(const readiness::LaunchChecklist& checklist);

/// Human-readable console rendering, next steps included.
void render_console(const readiness::LaunchChecklist& checklist, std::ostream& out);

/// Self-contained HTML page; every user-provided string is escaped.
[[nodiscard]] std::string render_html(const readiness::LaunchChecklist& checklist);

[[nodiscard]] std::string render_markdown(const readiness::LaunchChecklist& checklist);

/// Dispatches to the renderer for `format`; JSON is readiness::dump_checklist().
[[nodiscard]] std::string render(ReportFormat format, const readiness::LaunchChecklist& checklist);

/**
 * \brief Writes reports to disk.
 *
 * - write_checklist(): renders `checklist` in `format` and writes it to `destination`.
 *
 * Parent directories are created on demand. I/O failures throw std::runtime_error.
 */
class ReportWriter {
public:
    ReportWriter() = default;

    void write_checklist(const std::filesystem::path& destination,
                         ReportFormat format,
                         const readiness::LaunchChecklist& checklist) const;
};

/// Creates the parent of `destination` and writes `content`; throws std::runtime_error on failure.
void write_file(const std::filesystem::path& destination, const std::string& content);

}  // namespace shipkit::report
