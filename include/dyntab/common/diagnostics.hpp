#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <system_error>

namespace dyntab::common {

enum class DiagnosticSeverity : std::uint8_t {
    Info = 0,
    Warning,
    Error
};

struct Diagnostic final {
    DiagnosticSeverity severity = DiagnosticSeverity::Info;
    std::string component{};
    std::string message{};
    std::string correlation_id{};
    std::error_code error{};
    std::chrono::system_clock::time_point timestamp{};
};

// Receives degraded conditions that do not fail the operation (ledger append, cleanup hooks).
using DiagnosticSink = std::function<void(const Diagnostic&)>;

[[nodiscard]] std::string_view severity_name(DiagnosticSeverity severity) noexcept;

void emit_diagnostic(const DiagnosticSink& sink,
                     DiagnosticSeverity severity,
                     std::string component,
                     std::string message,
                     std::error_code error = {});

}  // namespace dyntab::common
