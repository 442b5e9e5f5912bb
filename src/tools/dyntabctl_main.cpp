#include "dyntab/common/cell_value.hpp"
#include "dyntab/common/string_utils.hpp"
#include "dyntab/data/value_coercion.hpp"
#include "dyntab/shell/shell_backend.hpp"
#include "dyntab/shell/shell_engine.hpp"
#include "dyntab/tools/operation_log_formatter.hpp"

#include <CLI/CLI.hpp>
#include <replxx.hxx>

#include <cstdlib>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace {

using dyntab::shell::CommandMetrics;
using dyntab::shell::ShellEngine;

struct ToolOptions final {
    std::uint64_t seed = 0x5eedU;
    std::string log_json_path{};
    double threshold = dyntab::inventory::kDefaultLowStockThreshold;
    std::vector<std::string> script_files{};
    std::vector<std::string> commands{};
    bool quiet = false;
};

// Contact columns with validation and formatting rules, plus a directory table generator.
dyntab::registry::ModuleCapabilities contacts_module()
{
    using namespace dyntab::registry;

    ModuleCapabilities capabilities{};

    ModuleColumnTypeDefinition phone{};
    phone.tag = "phone";
    phone.display_name = "Phone Number";
    phone.validation.push_back(ValidationRule{ValidationRuleKind::Phone});
    phone.validation.back().allow_extension = true;
    phone.format.kind = FormatRuleKind::Phone;
    phone.format.phone_style = PhoneStyle::International;
    GenerationRule phone_rule{};
    phone_rule.kind = GenerationRuleKind::Pattern;
    phone_rule.pattern = "+1-###-###-####";
    phone.generation = phone_rule;
    capabilities.column_types.push_back(std::move(phone));

    ModuleColumnTypeDefinition email{};
    email.tag = "email";
    email.display_name = "Email Address";
    email.validation.push_back(ValidationRule{ValidationRuleKind::Email});
    email.format.kind = FormatRuleKind::Lowercase;
    capabilities.column_types.push_back(std::move(email));

    ModuleColumnTypeDefinition tier{};
    tier.tag = "tier";
    tier.display_name = "Customer Tier";
    ValidationRule tiers{ValidationRuleKind::Enum};
    tiers.values = {"bronze", "silver", "gold"};
    tier.validation.push_back(std::move(tiers));
    tier.default_value = "bronze";
    capabilities.column_types.push_back(std::move(tier));

    ModuleGeneratorDefinition first_name{};
    first_name.tag = "first-name";
    first_name.display_name = "First Name";
    first_name.rule.kind = GenerationRuleKind::RandomEnum;
    first_name.rule.values = {"Ada", "Grace", "Linus", "Barbara", "Dennis", "Margaret"};
    capabilities.generators.push_back(std::move(first_name));

    TableGeneratorDefinition directory{};
    directory.id = "directory";
    directory.display_name = "Contact Directory";
    directory.description = "People with phone numbers and email addresses";
    directory.default_row_count = 20U;
    TableGeneratorColumn name_column{};
    name_column.name = "Full Name";
    name_column.required = true;
    GenerationRule name_rule{};
    name_rule.kind = GenerationRuleKind::RandomEnum;
    name_rule.values = {"Ada Lovelace", "Grace Hopper", "Barbara Liskov", "Margaret Hamilton"};
    name_column.generate = name_rule;
    directory.columns.push_back(std::move(name_column));
    TableGeneratorColumn phone_column{};
    phone_column.name = "Phone";
    phone_column.type_id = "contacts:phone";
    directory.columns.push_back(std::move(phone_column));
    capabilities.table_generators.push_back(std::move(directory));

    return capabilities;
}

std::filesystem::path history_path()
{
    const char* home = std::getenv("HOME");
    if (home == nullptr || home[0] == '\0') {
        return {};
    }
    std::filesystem::path path{home};
    path /= ".dyntab_history";
    return path;
}

void render_result(const CommandMetrics& metrics)
{
    std::cout << (metrics.success ? "OK" : "ERROR") << ": " << metrics.summary;
    if (!metrics.correlation_id.empty()) {
        std::cout << " [" << metrics.correlation_id << ']';
    }
    std::cout << " [" << std::fixed << std::setprecision(2) << metrics.duration_ms << " ms]";
    if (metrics.rows_touched != 0U || metrics.ledger_entries != 0U) {
        std::cout << " rows=" << metrics.rows_touched << " ledger=" << metrics.ledger_entries;
    }
    std::cout << '\n';

    for (const auto& line : metrics.detail_lines) {
        std::cout << "    " << line << '\n';
    }
    for (const auto& diagnostic : metrics.diagnostics) {
        std::cout << "  - " << diagnostic.message;
        if (diagnostic.column != 0U) {
            std::cout << " (column " << diagnostic.column << ')';
        }
        std::cout << '\n';
        for (const auto& hint : diagnostic.remediation_hints) {
            std::cout << "      hint: " << hint << '\n';
        }
    }
}

bool is_comment(std::string_view line)
{
    return line.rfind("--", 0U) == 0U || line.rfind("#", 0U) == 0U;
}

bool load_script(const std::string& path, std::vector<std::string>& commands)
{
    std::ifstream stream{path};
    if (!stream.is_open()) {
        std::cerr << "error: failed to open script file '" << path << "'\n";
        return false;
    }

    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        const auto trimmed = dyntab::common::trim_copy(line);
        if (trimmed.empty() || is_comment(trimmed)) {
            continue;
        }
        commands.push_back(trimmed);
    }
    if (stream.bad()) {
        std::cerr << "error: I/O error while reading script '" << path << "'\n";
        return false;
    }
    return true;
}

int run_batch(ShellEngine& engine, const std::vector<std::string>& commands)
{
    int exit_code = EXIT_SUCCESS;
    for (const auto& command : commands) {
        const auto result = engine.execute(command);
        render_result(result);
        if (!result.success) {
            exit_code = EXIT_FAILURE;
        }
    }
    return exit_code;
}

int run_repl(ShellEngine& engine, bool quiet)
{
    replxx::Replxx repl;
    const auto history = history_path();
    if (!history.empty()) {
        repl.history_load(history.string());
    }

    if (!quiet) {
        std::cout << "dyntab shell: one command per line, 'help' lists commands, \\q exits.\n";
    }

    while (true) {
        const char* line = repl.input("dyntab> ");
        if (line == nullptr) {
            std::cout << '\n';
            break;
        }

        const auto trimmed = dyntab::common::trim_copy(line);
        if (trimmed.empty()) {
            continue;
        }
        if (trimmed == "\\q" || trimmed == "\\quit") {
            break;
        }

        repl.history_add(trimmed);
        render_result(engine.execute(trimmed));
        if (!history.empty()) {
            repl.history_save(history.string());
        }
    }
    return EXIT_SUCCESS;
}

void print_telemetry(const dyntab::data::MutationTelemetrySnapshot& snapshot)
{
    using dyntab::data::MutationKind;
    for (std::size_t index = 0U; index < snapshot.kinds.size(); ++index) {
        const auto& kind = snapshot.kinds[index];
        const auto name = dyntab::data::to_string(static_cast<MutationKind>(index));
        std::cout << "dyntab_mutation_attempts_total{kind=\"" << name << "\"} " << kind.attempts << '\n';
        std::cout << "dyntab_mutation_successes_total{kind=\"" << name << "\"} " << kind.successes << '\n';
        std::cout << "dyntab_mutation_failures_total{kind=\"" << name << "\"} " << kind.failures << '\n';
        std::cout << "dyntab_mutation_duration_ns_total{kind=\"" << name << "\"} " << kind.total_duration_ns << '\n';
    }
    std::cout << "dyntab_mutation_duplicate_rejections_total " << snapshot.failures.duplicate_rejections << '\n';
    std::cout << "dyntab_mutation_validation_failures_total " << snapshot.failures.validation_failures << '\n';
    std::cout << "dyntab_ledger_appends_total " << snapshot.ledger_appends << '\n';
    std::cout << "dyntab_ledger_append_failures_total " << snapshot.ledger_append_failures << '\n';
}

}  // namespace

int main(int argc, char** argv)
{
    CLI::App app{"Operator tooling for the dyntab dynamic table engine"};
    app.require_subcommand(1);

    ToolOptions options{};
    app.add_option("--seed", options.seed, "Seed for generated table data");
    app.add_option("--log-json", options.log_json_path, "Write command and diagnostic logs as JSON Lines (use '-' for stdout)")
        ->type_name("PATH");
    app.add_option("--threshold", options.threshold, "Default low stock threshold")
        ->check(CLI::NonNegativeNumber);
    app.add_option("--script", options.script_files, "Execute shell commands from a script file")
        ->type_name("PATH");
    app.add_option("-c,--command", options.commands, "Execute the provided shell command")
        ->type_name("COMMAND");
    app.add_flag("-q,--quiet", options.quiet, "Suppress the startup banner");

    auto* shell = app.add_subcommand("shell", "Run shell commands against an in-memory engine");
    auto* metrics = app.add_subcommand("metrics", "Run the given commands, then print mutation telemetry");
    auto* types = app.add_subcommand("types", "List the resolvable column types");

    std::string coerce_type;
    std::string coerce_value;
    auto* coerce = app.add_subcommand("coerce", "Coerce one raw value into a column type");
    coerce->add_option("type", coerce_type, "Column type identifier")->required();
    coerce->add_option("value", coerce_value, "Raw input value")->required();

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& error) {
        return app.exit(error);
    }

    std::unique_ptr<std::ofstream> log_file;
    std::ostream* log_stream = nullptr;
    std::mutex log_mutex;
    if (!options.log_json_path.empty()) {
        if (options.log_json_path == "-") {
            log_stream = &std::cout;
        } else {
            auto file = std::make_unique<std::ofstream>(options.log_json_path, std::ios::out | std::ios::app);
            if (!file->is_open()) {
                std::cerr << "error: failed to open log file '" << options.log_json_path << "'\n";
                return EXIT_FAILURE;
            }
            log_stream = file.get();
            log_file = std::move(file);
        }
    }

    dyntab::shell::ShellBackend::Config backend_config{};
    backend_config.engine.low_stock_threshold = options.threshold;
    backend_config.engine.diagnostics = [log_stream, &log_mutex](const dyntab::common::Diagnostic& diagnostic) {
        std::lock_guard<std::mutex> guard{log_mutex};
        if (log_stream != nullptr) {
            (*log_stream) << dyntab::tools::format_diagnostic_log_json(diagnostic) << '\n';
            log_stream->flush();
            return;
        }
        std::cerr << '[' << diagnostic.component << "] " << dyntab::common::severity_name(diagnostic.severity) << ": "
                  << diagnostic.message << '\n';
    };

    std::unique_ptr<dyntab::shell::ShellBackend> backend;
    try {
        backend = std::make_unique<dyntab::shell::ShellBackend>(backend_config);
    } catch (const std::exception& error) {
        std::cerr << "error: " << error.what() << '\n';
        return EXIT_FAILURE;
    }
    backend->add_module("contacts", contacts_module(), true);

    if (types->parsed()) {
        const auto view = backend->capability_view();
        for (const auto& handler : view.list_column_types()) {
            std::cout << std::left << std::setw(24) << handler->type_id() << ' ' << std::setw(8)
                      << dyntab::registry::to_string(handler->value_kind()) << ' ' << handler->display_name() << '\n';
        }
        return EXIT_SUCCESS;
    }

    if (coerce->parsed()) {
        const auto view = backend->capability_view();
        const auto result = dyntab::data::coerce(dyntab::common::CellValue{coerce_value}, coerce_type, view);
        if (!result.ok()) {
            std::cerr << "error: " << (result.reason.empty() ? result.error.message() : result.reason) << '\n';
            if (!result.suggestion.empty()) {
                std::cerr << "hint: " << result.suggestion << '\n';
            }
            return EXIT_FAILURE;
        }
        std::cout << dyntab::common::cell_kind_name(result.value) << ' '
                  << dyntab::data::format_cell(result.value, coerce_type, view) << '\n';
        return EXIT_SUCCESS;
    }

    auto config = backend->make_config();
    config.seed = options.seed;
    if (log_stream != nullptr) {
        config.command_logger = [log_stream, &log_mutex](const CommandMetrics& result) {
            const auto line = dyntab::tools::format_command_log_json(result);
            std::lock_guard<std::mutex> guard{log_mutex};
            (*log_stream) << line << '\n';
            log_stream->flush();
        };
    }
    ShellEngine engine{config};

    std::vector<std::string> commands;
    for (const auto& path : options.script_files) {
        if (!load_script(path, commands)) {
            return EXIT_FAILURE;
        }
    }
    commands.insert(commands.end(), options.commands.begin(), options.commands.end());

    if (metrics->parsed()) {
        const auto code = run_batch(engine, commands);
        print_telemetry(backend->telemetry_registry().aggregate());
        return code;
    }

    if (shell->parsed() && !commands.empty()) {
        return run_batch(engine, commands);
    }
    return run_repl(engine, options.quiet);
}
