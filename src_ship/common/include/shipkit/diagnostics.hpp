#pragma once

#include <functional>
#include <iosfwd>
#include <string>

namespace shipkit {

enum class Severity {
    debug,
    info,
    warn,
    error,
};

/**
 * \brief One observable event raised at a best-effort boundary.
 *
 * `source` names the component that raised it (e.g. `state-store`,
 * `provider:SEO Optimization`), `message` is free text.
 */
struct Diagnostic {
    Severity severity{Severity::info};
    std::string source;
    std::string message;
};

using DiagnosticSink = std::function<void(const Diagnostic&)>;

[[nodiscard]] const char* to_string(Severity severity) noexcept;

/// Prints `[WARN] source: message` lines to `out` for events at or above `threshold`.
[[nodiscard]] DiagnosticSink stream_sink(std::ostream& out, Severity threshold = Severity::warn);

/// stream_sink() on std::cerr.
[[nodiscard]] DiagnosticSink stderr_sink(Severity threshold = Severity::warn);

/// Console threshold: debug when verbose, warn otherwise.
[[nodiscard]] Severity console_threshold(bool verbose) noexcept;

[[nodiscard]] DiagnosticSink null_sink();

/// Forwards to `sink` when it is set; a default-constructed sink drops the event.
void emit(const DiagnosticSink& sink, Severity severity, std::string source, std::string message);

}  // namespace shipkit
