#include "dyntab/common/diagnostics.hpp"

#include <utility>

namespace dyntab::common {

std::string_view severity_name(DiagnosticSeverity severity) noexcept
{
    switch (severity) {
    case DiagnosticSeverity::Info:
        return "info";
    case DiagnosticSeverity::Warning:
        return "warning";
    case DiagnosticSeverity::Error:
    default:
        return "error";
    }
}

void emit_diagnostic(const DiagnosticSink& sink,
                     DiagnosticSeverity severity,
                     std::string component,
                     std::string message,
                     std::error_code error)
{
    if (!sink) {
        return;
    }

    Diagnostic diagnostic{};
    diagnostic.severity = severity;
    diagnostic.component = std::move(component);
    diagnostic.message = std::move(message);
    diagnostic.error = error;
    diagnostic.timestamp = std::chrono::system_clock::now();
    sink(diagnostic);
}

}  // namespace dyntab::common
