#include "dyntab/shell/command_grammar.hpp"

#include "dyntab/common/string_utils.hpp"

#include <tao/pegtl.hpp>

#include <array>
#include <charconv>
#include <cstdlib>
#include <limits>
#include <utility>

namespace dyntab::shell {

namespace {

namespace pegtl = tao::pegtl;

constexpr std::array<std::string_view, 25> kVerbNames{
    "help",
    "tables",
    "columns",
    "types",
    "modules",
    "create table",
    "add column",
    "insert",
    "update",
    "delete",
    "delete where",
    "select",
    "purchase",
    "ledger",
    "stock",
    "swap",
    "recount",
    "module install",
    "module activate",
    "module deactivate",
    "generate",
    "rent",
    "release",
    "clone",
    "sales"};

struct CommandUsage final {
    std::string_view keyword;
    std::string_view usage;
};

constexpr std::array<CommandUsage, 22> kUsage{{
    {"help", "help"},
    {"tables", "tables"},
    {"columns", "columns <table>"},
    {"types", "types"},
    {"modules", "modules"},
    {"create", "create table <name> [purpose default|sale|rent] [visibility private|public|shared]"},
    {"add", "add column <table> <name> <type> [required] [unique] [default <value>]"},
    {"insert", "insert <table> field=value[, field=value...]"},
    {"update", "update <table> <row> field=value[, field=value...]"},
    {"delete", "delete <table> <row> | delete <table> where field=value[, ...]"},
    {"select", "select <table> [where field=value[, ...]]"},
    {"purchase", "purchase <table> <row> [quantity <n>]"},
    {"ledger", "ledger <table> [<row>]"},
    {"stock", "stock [threshold <n>]"},
    {"swap", "swap <table> <column> <column>"},
    {"recount", "recount <table>"},
    {"module", "module install|activate|deactivate <id>"},
    {"generate", "generate <generator> [tables <n>] [rows <n>]"},
    {"rent", "rent <table> <row>"},
    {"release", "release <table> <row>"},
    {"clone", "clone <table> [as <name>]"},
    {"sales", "sales [<table>]"},
}};

template <char... Cs>
struct keyword : pegtl::seq<pegtl::istring<Cs...>, pegtl::not_at<pegtl::identifier_other>> {
};

struct optional_space : pegtl::star<pegtl::blank> {
};

struct required_space : pegtl::plus<pegtl::blank> {
};

struct semicolon : pegtl::one<';'> {
};

struct comma : pegtl::seq<optional_space, pegtl::one<','>, optional_space> {
};

struct kw_help : keyword<'H', 'E', 'L', 'P'> {
};

struct kw_tables : keyword<'T', 'A', 'B', 'L', 'E', 'S'> {
};

struct kw_table : keyword<'T', 'A', 'B', 'L', 'E'> {
};

struct kw_columns : keyword<'C', 'O', 'L', 'U', 'M', 'N', 'S'> {
};

struct kw_column : keyword<'C', 'O', 'L', 'U', 'M', 'N'> {
};

struct kw_types : keyword<'T', 'Y', 'P', 'E', 'S'> {
};

struct kw_modules : keyword<'M', 'O', 'D', 'U', 'L', 'E', 'S'> {
};

struct kw_module : keyword<'M', 'O', 'D', 'U', 'L', 'E'> {
};

struct kw_create : keyword<'C', 'R', 'E', 'A', 'T', 'E'> {
};

struct kw_purpose : keyword<'P', 'U', 'R', 'P', 'O', 'S', 'E'> {
};

struct kw_visibility : keyword<'V', 'I', 'S', 'I', 'B', 'I', 'L', 'I', 'T', 'Y'> {
};

struct kw_add : keyword<'A', 'D', 'D'> {
};

struct kw_required : keyword<'R', 'E', 'Q', 'U', 'I', 'R', 'E', 'D'> {
};

struct kw_unique : keyword<'U', 'N', 'I', 'Q', 'U', 'E'> {
};

struct kw_default : keyword<'D', 'E', 'F', 'A', 'U', 'L', 'T'> {
};

struct kw_insert : keyword<'I', 'N', 'S', 'E', 'R', 'T'> {
};

struct kw_update : keyword<'U', 'P', 'D', 'A', 'T', 'E'> {
};

struct kw_delete : keyword<'D', 'E', 'L', 'E', 'T', 'E'> {
};

struct kw_where : keyword<'W', 'H', 'E', 'R', 'E'> {
};

struct kw_select : keyword<'S', 'E', 'L', 'E', 'C', 'T'> {
};

struct kw_purchase : keyword<'P', 'U', 'R', 'C', 'H', 'A', 'S', 'E'> {
};

struct kw_quantity : keyword<'Q', 'U', 'A', 'N', 'T', 'I', 'T', 'Y'> {
};

struct kw_ledger : keyword<'L', 'E', 'D', 'G', 'E', 'R'> {
};

struct kw_stock : keyword<'S', 'T', 'O', 'C', 'K'> {
};

struct kw_threshold : keyword<'T', 'H', 'R', 'E', 'S', 'H', 'O', 'L', 'D'> {
};

struct kw_swap : keyword<'S', 'W', 'A', 'P'> {
};

struct kw_recount : keyword<'R', 'E', 'C', 'O', 'U', 'N', 'T'> {
};

struct kw_install : keyword<'I', 'N', 'S', 'T', 'A', 'L', 'L'> {
};

struct kw_activate : keyword<'A', 'C', 'T', 'I', 'V', 'A', 'T', 'E'> {
};

struct kw_deactivate : keyword<'D', 'E', 'A', 'C', 'T', 'I', 'V', 'A', 'T', 'E'> {
};

struct kw_generate : keyword<'G', 'E', 'N', 'E', 'R', 'A', 'T', 'E'> {
};

struct kw_rows : keyword<'R', 'O', 'W', 'S'> {
};

struct kw_rent : keyword<'R', 'E', 'N', 'T'> {
};

struct kw_release : keyword<'R', 'E', 'L', 'E', 'A', 'S', 'E'> {
};

struct kw_clone : keyword<'C', 'L', 'O', 'N', 'E'> {
};

struct kw_as : keyword<'A', 'S'> {
};

struct kw_sales : keyword<'S', 'A', 'L', 'E', 'S'> {
};

struct quoted_char : pegtl::sor<pegtl::seq<pegtl::one<'\''>, pegtl::one<'\''>>, pegtl::not_one<'\''>> {
};

struct quoted_text : pegtl::seq<pegtl::one<'\''>, pegtl::star<quoted_char>, pegtl::one<'\''>> {
};

// A literal must end at whitespace, a separator or the end of input.
struct value_end : pegtl::not_at<pegtl::not_one<' ', '\t', '\r', '\n', ',', ';'>> {
};

struct unsigned_number : pegtl::seq<pegtl::plus<pegtl::digit>, pegtl::not_at<pegtl::identifier_other>> {
};

struct decimal_number
    : pegtl::seq<pegtl::plus<pegtl::digit>, pegtl::opt<pegtl::one<'.'>, pegtl::plus<pegtl::digit>>, value_end> {
};

struct table_ref : unsigned_number {
};

struct row_ref : unsigned_number {
};

struct first_column : unsigned_number {
};

struct second_column : unsigned_number {
};

struct quantity_number : unsigned_number {
};

struct table_count_number : unsigned_number {
};

struct row_count_number : unsigned_number {
};

struct threshold_number : decimal_number {
};

struct quoted_name : quoted_text {
};

struct plain_name : pegtl::identifier {
};

struct entity_name : pegtl::sor<quoted_name, plain_name> {
};

// Module, generator and type identifiers ("contacts:phone", "crm-lite").
struct token_chars : pegtl::plus<pegtl::sor<pegtl::identifier_other, pegtl::one<':', '-', '.'>>> {
};

struct token_name : token_chars {
};

struct type_name : token_chars {
};

struct purpose_name : pegtl::identifier {
};

struct visibility_name : pegtl::identifier {
};

struct quoted_default : quoted_text {
};

struct plain_default : pegtl::plus<pegtl::not_one<' ', '\t', '\r', '\n', ';', '\''>> {
};

struct field_name : pegtl::identifier {
};

struct quoted_value : quoted_text {
};

struct true_value : pegtl::seq<pegtl::istring<'T', 'R', 'U', 'E'>, value_end> {
};

struct false_value : pegtl::seq<pegtl::istring<'F', 'A', 'L', 'S', 'E'>, value_end> {
};

struct null_value : pegtl::seq<pegtl::istring<'N', 'U', 'L', 'L'>, value_end> {
};

struct number_value
    : pegtl::seq<pegtl::opt<pegtl::one<'+', '-'>>,
                 pegtl::plus<pegtl::digit>,
                 pegtl::opt<pegtl::one<'.'>, pegtl::plus<pegtl::digit>>,
                 value_end> {
};

struct bare_value : pegtl::plus<pegtl::not_one<' ', '\t', '\r', '\n', ',', ';', '\''>> {
};

struct field_value : pegtl::sor<quoted_value, true_value, false_value, null_value, number_value, bare_value> {
};

struct set_item : pegtl::seq<field_name, optional_space, pegtl::one<'='>, optional_space, field_value> {
};

struct filter_item : pegtl::seq<field_name, optional_space, pegtl::one<'='>, optional_space, field_value> {
};

struct set_list : pegtl::list<set_item, comma> {
};

struct where_clause : pegtl::seq<kw_where, required_space, pegtl::list<filter_item, comma>> {
};

struct help_command : kw_help {
};

struct tables_command : kw_tables {
};

struct types_command : kw_types {
};

struct modules_command : kw_modules {
};

struct columns_command : pegtl::seq<kw_columns, required_space, table_ref> {
};

struct create_table_command
    : pegtl::seq<kw_create,
                 required_space,
                 kw_table,
                 required_space,
                 entity_name,
                 pegtl::opt<required_space, kw_purpose, required_space, purpose_name>,
                 pegtl::opt<required_space, kw_visibility, required_space, visibility_name>> {
};

struct column_option
    : pegtl::sor<kw_required,
                 kw_unique,
                 pegtl::seq<kw_default, required_space, pegtl::sor<quoted_default, plain_default>>> {
};

struct add_column_command
    : pegtl::seq<kw_add,
                 required_space,
                 kw_column,
                 required_space,
                 table_ref,
                 required_space,
                 entity_name,
                 required_space,
                 type_name,
                 pegtl::star<required_space, column_option>> {
};

struct insert_command : pegtl::seq<kw_insert, required_space, table_ref, required_space, set_list> {
};

struct update_command
    : pegtl::seq<kw_update, required_space, table_ref, required_space, row_ref, required_space, set_list> {
};

struct delete_where_command : pegtl::seq<kw_delete, required_space, table_ref, required_space, where_clause> {
};

struct delete_command : pegtl::seq<kw_delete, required_space, table_ref, required_space, row_ref> {
};

struct select_command : pegtl::seq<kw_select, required_space, table_ref, pegtl::opt<required_space, where_clause>> {
};

struct purchase_command
    : pegtl::seq<kw_purchase,
                 required_space,
                 table_ref,
                 required_space,
                 row_ref,
                 pegtl::opt<required_space, kw_quantity, required_space, quantity_number>> {
};

struct ledger_command : pegtl::seq<kw_ledger, required_space, table_ref, pegtl::opt<required_space, row_ref>> {
};

struct stock_command : pegtl::seq<kw_stock, pegtl::opt<required_space, kw_threshold, required_space, threshold_number>> {
};

struct swap_command
    : pegtl::seq<kw_swap, required_space, table_ref, required_space, first_column, required_space, second_column> {
};

struct recount_command : pegtl::seq<kw_recount, required_space, table_ref> {
};

struct module_command
    : pegtl::seq<kw_module, required_space, pegtl::sor<kw_install, kw_activate, kw_deactivate>, required_space, token_name> {
};

struct generate_option
    : pegtl::sor<pegtl::seq<kw_tables, required_space, table_count_number>,
                 pegtl::seq<kw_rows, required_space, row_count_number>> {
};

struct generate_command
    : pegtl::seq<kw_generate, required_space, token_name, pegtl::star<required_space, generate_option>> {
};

struct rent_command : pegtl::seq<kw_rent, required_space, table_ref, required_space, row_ref> {
};

struct release_command : pegtl::seq<kw_release, required_space, table_ref, required_space, row_ref> {
};

struct clone_command
    : pegtl::seq<kw_clone, required_space, table_ref, pegtl::opt<required_space, kw_as, required_space, entity_name>> {
};

struct sales_command : pegtl::seq<kw_sales, pegtl::opt<required_space, table_ref>> {
};

struct any_command
    : pegtl::sor<help_command,
                 tables_command,
                 columns_command,
                 types_command,
                 modules_command,
                 create_table_command,
                 add_column_command,
                 insert_command,
                 update_command,
                 delete_where_command,
                 delete_command,
                 select_command,
                 purchase_command,
                 ledger_command,
                 stock_command,
                 swap_command,
                 recount_command,
                 module_command,
                 generate_command,
                 rent_command,
                 release_command,
                 clone_command,
                 sales_command> {
};

struct command_grammar
    : pegtl::seq<optional_space,
                 any_command,
                 optional_space,
                 pegtl::opt<semicolon, optional_space>,
                 pegtl::must<pegtl::eof>> {
};

struct ParseState final {
    ShellCommand command{};
    std::string pending_field{};
    common::CellValue pending_value{};
    bool number_out_of_range = false;
};

std::string unquote(std::string_view text)
{
    std::string result;
    if (text.size() < 2U) {
        return result;
    }
    const auto body = text.substr(1U, text.size() - 2U);
    result.reserve(body.size());
    for (std::size_t index = 0U; index < body.size(); ++index) {
        result.push_back(body[index]);
        if (body[index] == '\'' && index + 1U < body.size() && body[index + 1U] == '\'') {
            ++index;
        }
    }
    return result;
}

std::uint64_t parse_unsigned(std::string_view text, ParseState& state)
{
    std::uint64_t value = 0U;
    const auto [end, error] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (error != std::errc{} || end != text.data() + text.size()) {
        state.number_out_of_range = true;
        return 0U;
    }
    return value;
}

template <typename Rule>
struct command_action {
    template <typename Input>
    static void apply(const Input&, ParseState&)
    {
    }
};

template <CommandVerb Verb>
struct verb_action {
    template <typename Input>
    static void apply(const Input&, ParseState& state)
    {
        state.command.verb = Verb;
    }
};

template <>
struct command_action<help_command> : verb_action<CommandVerb::Help> {
};

template <>
struct command_action<tables_command> : verb_action<CommandVerb::Tables> {
};

template <>
struct command_action<columns_command> : verb_action<CommandVerb::Columns> {
};

template <>
struct command_action<types_command> : verb_action<CommandVerb::Types> {
};

template <>
struct command_action<modules_command> : verb_action<CommandVerb::Modules> {
};

template <>
struct command_action<create_table_command> : verb_action<CommandVerb::CreateTable> {
};

template <>
struct command_action<add_column_command> : verb_action<CommandVerb::AddColumn> {
};

template <>
struct command_action<insert_command> : verb_action<CommandVerb::Insert> {
};

template <>
struct command_action<update_command> : verb_action<CommandVerb::Update> {
};

template <>
struct command_action<delete_where_command> : verb_action<CommandVerb::DeleteWhere> {
};

template <>
struct command_action<delete_command> : verb_action<CommandVerb::Delete> {
};

template <>
struct command_action<select_command> : verb_action<CommandVerb::Select> {
};

template <>
struct command_action<purchase_command> : verb_action<CommandVerb::Purchase> {
};

template <>
struct command_action<ledger_command> : verb_action<CommandVerb::Ledger> {
};

template <>
struct command_action<stock_command> : verb_action<CommandVerb::Stock> {
};

template <>
struct command_action<swap_command> : verb_action<CommandVerb::Swap> {
};

template <>
struct command_action<recount_command> : verb_action<CommandVerb::Recount> {
};

template <>
struct command_action<kw_install> : verb_action<CommandVerb::ModuleInstall> {
};

template <>
struct command_action<kw_activate> : verb_action<CommandVerb::ModuleActivate> {
};

template <>
struct command_action<kw_deactivate> : verb_action<CommandVerb::ModuleDeactivate> {
};

template <>
struct command_action<generate_command> : verb_action<CommandVerb::Generate> {
};

template <>
struct command_action<rent_command> : verb_action<CommandVerb::Rent> {
};

template <>
struct command_action<release_command> : verb_action<CommandVerb::Release> {
};

template <>
struct command_action<clone_command> : verb_action<CommandVerb::Clone> {
};

template <>
struct command_action<sales_command> : verb_action<CommandVerb::Sales> {
};

template <>
struct command_action<table_ref> {
    template <typename Input>
    static void apply(const Input& in, ParseState& state)
    {
        state.command.table_id = parse_unsigned(in.string(), state);
    }
};

template <>
struct command_action<row_ref> {
    template <typename Input>
    static void apply(const Input& in, ParseState& state)
    {
        state.command.row_id = parse_unsigned(in.string(), state);
    }
};

template <>
struct command_action<first_column> {
    template <typename Input>
    static void apply(const Input& in, ParseState& state)
    {
        state.command.column_a = parse_unsigned(in.string(), state);
    }
};

template <>
struct command_action<second_column> {
    template <typename Input>
    static void apply(const Input& in, ParseState& state)
    {
        state.command.column_b = parse_unsigned(in.string(), state);
    }
};

template <>
struct command_action<quantity_number> {
    template <typename Input>
    static void apply(const Input& in, ParseState& state)
    {
        const auto value = parse_unsigned(in.string(), state);
        if (value > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            state.number_out_of_range = true;
            return;
        }
        state.command.quantity = static_cast<std::int64_t>(value);
    }
};

template <>
struct command_action<table_count_number> {
    template <typename Input>
    static void apply(const Input& in, ParseState& state)
    {
        state.command.table_count = static_cast<std::size_t>(parse_unsigned(in.string(), state));
    }
};

template <>
struct command_action<row_count_number> {
    template <typename Input>
    static void apply(const Input& in, ParseState& state)
    {
        state.command.row_count = static_cast<std::size_t>(parse_unsigned(in.string(), state));
    }
};

template <>
struct command_action<threshold_number> {
    template <typename Input>
    static void apply(const Input& in, ParseState& state)
    {
        state.command.threshold = std::strtod(in.string().c_str(), nullptr);
    }
};

template <>
struct command_action<quoted_name> {
    template <typename Input>
    static void apply(const Input& in, ParseState& state)
    {
        state.command.name = unquote(in.string());
    }
};

template <>
struct command_action<plain_name> {
    template <typename Input>
    static void apply(const Input& in, ParseState& state)
    {
        state.command.name = in.string();
    }
};

template <>
struct command_action<token_name> {
    template <typename Input>
    static void apply(const Input& in, ParseState& state)
    {
        state.command.name = in.string();
    }
};

template <>
struct command_action<type_name> {
    template <typename Input>
    static void apply(const Input& in, ParseState& state)
    {
        state.command.type_id = in.string();
    }
};

template <>
struct command_action<purpose_name> {
    template <typename Input>
    static void apply(const Input& in, ParseState& state)
    {
        state.command.purpose = in.string();
    }
};

template <>
struct command_action<visibility_name> {
    template <typename Input>
    static void apply(const Input& in, ParseState& state)
    {
        state.command.visibility = in.string();
    }
};

template <>
struct command_action<kw_required> {
    template <typename Input>
    static void apply(const Input&, ParseState& state)
    {
        state.command.required = true;
    }
};

template <>
struct command_action<kw_unique> {
    template <typename Input>
    static void apply(const Input&, ParseState& state)
    {
        state.command.unique = true;
    }
};

template <>
struct command_action<quoted_default> {
    template <typename Input>
    static void apply(const Input& in, ParseState& state)
    {
        state.command.default_value = unquote(in.string());
    }
};

template <>
struct command_action<plain_default> {
    template <typename Input>
    static void apply(const Input& in, ParseState& state)
    {
        state.command.default_value = in.string();
    }
};

template <>
struct command_action<field_name> {
    template <typename Input>
    static void apply(const Input& in, ParseState& state)
    {
        state.pending_field = in.string();
    }
};

template <>
struct command_action<quoted_value> {
    template <typename Input>
    static void apply(const Input& in, ParseState& state)
    {
        state.pending_value = unquote(in.string());
    }
};

template <>
struct command_action<true_value> {
    template <typename Input>
    static void apply(const Input&, ParseState& state)
    {
        state.pending_value = true;
    }
};

template <>
struct command_action<false_value> {
    template <typename Input>
    static void apply(const Input&, ParseState& state)
    {
        state.pending_value = false;
    }
};

template <>
struct command_action<null_value> {
    template <typename Input>
    static void apply(const Input&, ParseState& state)
    {
        state.pending_value = std::monostate{};
    }
};

template <>
struct command_action<number_value> {
    template <typename Input>
    static void apply(const Input& in, ParseState& state)
    {
        state.pending_value = std::strtod(in.string().c_str(), nullptr);
    }
};

template <>
struct command_action<bare_value> {
    template <typename Input>
    static void apply(const Input& in, ParseState& state)
    {
        state.pending_value = in.string();
    }
};

template <>
struct command_action<set_item> {
    template <typename Input>
    static void apply(const Input&, ParseState& state)
    {
        state.command.assignments.push_back({std::move(state.pending_field), std::move(state.pending_value)});
        state.pending_field.clear();
        state.pending_value = std::monostate{};
    }
};

template <>
struct command_action<filter_item> {
    template <typename Input>
    static void apply(const Input&, ParseState& state)
    {
        state.command.filters.push_back({std::move(state.pending_field), std::move(state.pending_value)});
        state.pending_field.clear();
        state.pending_value = std::monostate{};
    }
};

std::string_view first_token(std::string_view text)
{
    std::size_t begin = 0U;
    while (begin < text.size() && (text[begin] == ' ' || text[begin] == '\t')) {
        ++begin;
    }
    std::size_t end = begin;
    while (end < text.size() && text[end] != ' ' && text[end] != '\t' && text[end] != ';') {
        ++end;
    }
    return text.substr(begin, end - begin);
}

std::vector<std::string> usage_hints(std::string_view input)
{
    const auto token = common::to_lower_copy(first_token(input));
    for (const auto& entry : kUsage) {
        if (entry.keyword == token) {
            return {"Usage: " + std::string{entry.usage}};
        }
    }
    return {"Type 'help' to list the available commands."};
}

CommandDiagnostic make_parse_error(const pegtl::parse_error& error, std::string_view source)
{
    CommandDiagnostic diagnostic{};
    diagnostic.message = "Unexpected input";
    diagnostic.statement = common::trim_copy(source);
    diagnostic.remediation_hints = usage_hints(source);

    if (!error.positions().empty()) {
        const auto& position = error.positions().front();
        diagnostic.column = static_cast<std::size_t>(position.column);
        const auto byte_index = static_cast<std::size_t>(position.byte);
        if (byte_index < source.size()) {
            const auto token = first_token(source.substr(byte_index));
            if (!token.empty()) {
                diagnostic.message += " near '" + std::string{token} + "'";
            }
        } else {
            diagnostic.message += " at end of input";
        }
    }
    return diagnostic;
}

}  // namespace

std::string_view to_string(CommandVerb verb) noexcept
{
    const auto index = static_cast<std::size_t>(verb);
    return index < kVerbNames.size() ? kVerbNames[index] : std::string_view{"unknown"};
}

CommandParseResult parse_command(std::string_view input)
{
    CommandParseResult result{};
    pegtl::memory_input in(input.data(), input.size(), "command");
    ParseState state{};

    try {
        const auto parsed = pegtl::parse<command_grammar, command_action>(in, state);
        if (!parsed) {
            CommandDiagnostic diagnostic{};
            diagnostic.message = "input did not match any shell command";
            diagnostic.column = 1U;
            diagnostic.statement = common::trim_copy(input);
            diagnostic.remediation_hints = usage_hints(input);
            result.diagnostics.push_back(std::move(diagnostic));
            return result;
        }
    } catch (const pegtl::parse_error& error) {
        result.diagnostics.push_back(make_parse_error(error, input));
        return result;
    }

    if (state.number_out_of_range) {
        CommandDiagnostic diagnostic{};
        diagnostic.message = "Numeric argument is out of range";
        diagnostic.statement = common::trim_copy(input);
        diagnostic.remediation_hints = usage_hints(input);
        result.diagnostics.push_back(std::move(diagnostic));
        return result;
    }

    result.command = std::move(state.command);
    return result;
}

}  // namespace dyntab::shell
