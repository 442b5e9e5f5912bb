#pragma once

#include "dyntab/shell/command_grammar.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace dyntab::shell {

class ShellBackend;

struct CommandMetrics final {
    bool success = false;
    std::string summary{};
    double duration_ms = 0.0;
    std::uint64_t rows_touched = 0U;
    std::uint64_t ledger_entries = 0U;
    std::vector<CommandDiagnostic> diagnostics{};
    std::vector<std::string> detail_lines{};
    std::string command_text{};
    std::string correlation_id{};
    std::string command_category{};
    std::chrono::system_clock::time_point started_at{};
    std::chrono::system_clock::time_point finished_at{};
};

class ShellEngine final {
public:
    struct Config final {
        ShellBackend* backend = nullptr;
        std::string actor = "operator";
        std::uint64_t seed = 0x5eedU;  // generated data
        std::function<void(const CommandMetrics&)> command_logger{};
    };

    ShellEngine();
    explicit ShellEngine(Config config);

    CommandMetrics execute(const std::string& text);

    [[nodiscard]] static std::vector<std::string> help_lines();

private:
    CommandMetrics dispatch(const ShellCommand& command);

    CommandMetrics list_tables();
    CommandMetrics list_columns(const ShellCommand& command);
    CommandMetrics list_types();
    CommandMetrics list_modules();
    CommandMetrics create_table(const ShellCommand& command);
    CommandMetrics add_column(const ShellCommand& command);
    CommandMetrics insert_row(const ShellCommand& command);
    CommandMetrics update_row(const ShellCommand& command);
    CommandMetrics delete_row(const ShellCommand& command);
    CommandMetrics delete_where(const ShellCommand& command);
    CommandMetrics select_rows(const ShellCommand& command);
    CommandMetrics purchase(const ShellCommand& command);
    CommandMetrics ledger_summary(const ShellCommand& command);
    CommandMetrics stock_report(const ShellCommand& command);
    CommandMetrics swap_columns(const ShellCommand& command);
    CommandMetrics recount_columns(const ShellCommand& command);
    CommandMetrics change_module(const ShellCommand& command);
    CommandMetrics generate(const ShellCommand& command);
    CommandMetrics rent(const ShellCommand& command);
    CommandMetrics release(const ShellCommand& command);
    CommandMetrics clone_table(const ShellCommand& command);
    CommandMetrics sales_report(const ShellCommand& command);

    [[nodiscard]] std::uint64_t ledger_size() const;

    Config config_{};
    std::atomic<std::uint64_t> correlation_counter_{1U};
};

}  // namespace dyntab::shell
