#pragma once

#include "dyntab/common/cell_value.hpp"
#include "dyntab/common/diagnostics.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dyntab::shell {

enum class CommandVerb : std::uint8_t {
    Help = 0,
    Tables,
    Columns,
    Types,
    Modules,
    CreateTable,
    AddColumn,
    Insert,
    Update,
    Delete,
    DeleteWhere,
    Select,
    Purchase,
    Ledger,
    Stock,
    Swap,
    Recount,
    ModuleInstall,
    ModuleActivate,
    ModuleDeactivate,
    Generate,
    Rent,
    Release,
    Clone,
    Sales
};

[[nodiscard]] std::string_view to_string(CommandVerb verb) noexcept;

struct FieldAssignment final {
    std::string field{};
    common::CellValue value{};
};

struct ShellCommand final {
    CommandVerb verb = CommandVerb::Help;
    std::string name{};  // table, column, module or generator name
    std::string type_id{};
    std::uint64_t table_id = 0U;
    std::uint64_t row_id = 0U;
    std::uint64_t column_a = 0U;
    std::uint64_t column_b = 0U;
    std::vector<FieldAssignment> assignments{};
    std::vector<FieldAssignment> filters{};
    bool required = false;
    bool unique = false;
    std::optional<std::string> default_value{};
    std::optional<std::string> purpose{};
    std::optional<std::string> visibility{};
    std::optional<std::int64_t> quantity{};
    std::optional<double> threshold{};
    std::optional<std::size_t> table_count{};
    std::optional<std::size_t> row_count{};
};

struct CommandDiagnostic final {
    common::DiagnosticSeverity severity = common::DiagnosticSeverity::Error;
    std::string message{};
    std::size_t column = 0U;  // 1-based; 0 when the error has no position
    std::string statement{};
    std::vector<std::string> remediation_hints{};
};

struct CommandParseResult final {
    std::optional<ShellCommand> command{};
    std::vector<CommandDiagnostic> diagnostics{};

    [[nodiscard]] bool success() const noexcept { return command.has_value(); }
};

// One command per call; a trailing ';' is accepted. Keywords are case-insensitive.
[[nodiscard]] CommandParseResult parse_command(std::string_view input);

}  // namespace dyntab::shell
