#pragma once

#include "shipkit/checklist_report.hpp"
#include "shipkit/timestamp.hpp"
#include "shipkit/workflow_types.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <string>
#include <vector>

namespace shipkit::report {

/// `1h 2m 3s`, `2m 5s` or `7s`; negative input counts as zero.
[[nodiscard]] std::string format_duration(std::int64_t ms);

/// `0 B`, `512 B`, `1.5 KB`, ... with one decimal above bytes.
[[nodiscard]] std::string format_bytes(std::int64_t bytes);

/**
 * \brief `[################------------------------] 40% (2/5)`.
 *
 * The percentage is rounded half up and the bar is `width` cells wide.
 * A zero `total` renders an empty bar at 0%.
 */
[[nodiscard]] std::string progress_bar(int current, int total, std::size_t width = 40);

/// Step list with durations and errors, then the summary figures.
void render_workflow_console(const workflow::WorkflowResult& result, std::ostream& out);

/// Numbered history listing, newest first; prints a notice when empty.
void render_history(const std::vector<workflow::HistoryEntry>& history, std::ostream& out);

[[nodiscard]] std::string render_workflow_markdown(const workflow::WorkflowResult& result, Timestamp generated);

[[nodiscard]] std::string render_workflow_json(const workflow::WorkflowResult& result);

/**
 * \brief Writes `<project>/.ship-toolkit/workflow-report-<stamp>.<json|md>`.
 *
 * `stamp` is file_stamp(generated). Returns the written path. HTML is not a
 * workflow report format and throws std::invalid_argument; I/O failures throw
 * std::runtime_error.
 */
std::filesystem::path export_workflow_report(const std::filesystem::path& project_root,
                                             const workflow::WorkflowResult& result,
                                             ReportFormat format,
                                             Timestamp generated);

}  // namespace shipkit::report
