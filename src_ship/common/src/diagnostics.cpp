#include "shipkit/diagnostics.hpp"

#include <iostream>
#include <utility>

namespace shipkit {

const char* to_string(Severity severity) noexcept {
    switch (severity) {
        case Severity::debug: return "DEBUG";
        case Severity::info:  return "INFO";
        case Severity::warn:  return "WARN";
        case Severity::error: return "ERROR";
    }
    return "INFO";
}

DiagnosticSink stream_sink(std::ostream& out, Severity threshold) {
    return [&out, threshold](const Diagnostic& diag) {
        if (static_cast<int>(diag.severity) < static_cast<int>(threshold)) {
            return;
        }
        out << "[" << to_string(diag.severity) << "] " << diag.source << ": "
            << diag.message << "\n";
    };
}

DiagnosticSink stderr_sink(Severity threshold) {
    return stream_sink(std::cerr, threshold);
}

Severity console_threshold(bool verbose) noexcept {
    return verbose ? Severity::debug : Severity::warn;
}

DiagnosticSink null_sink() {
    return [](const Diagnostic&) {};
}

void emit(const DiagnosticSink& sink, Severity severity, std::string source, std::string message) {
    if (!sink) {
        return;
    }
    sink(Diagnostic{severity, std::move(source), std::move(message)});
}

}  // namespace shipkit
