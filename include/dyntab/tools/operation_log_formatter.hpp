#pragma once

#include "dyntab/common/diagnostics.hpp"
#include "dyntab/shell/shell_engine.hpp"

#include <string>

namespace dyntab::tools {

// Single-line JSON records for JSON Lines logs.
[[nodiscard]] std::string format_command_log_json(const shell::CommandMetrics& metrics);
[[nodiscard]] std::string format_diagnostic_log_json(const common::Diagnostic& diagnostic);

}  // namespace dyntab::tools
