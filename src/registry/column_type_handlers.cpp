#include "dyntab/registry/column_type_handlers.hpp"

#include "dyntab/common/string_utils.hpp"
#include "dyntab/registry/value_patterns.hpp"

#include <array>
#include <cmath>
#include <cstdio>
#include <utility>

namespace dyntab::registry {

namespace {

std::optional<double> number_of(std::string_view value)
{
    return common::as_number(common::CellValue{std::string{value}});
}

ValidationOutcome accept_any(std::string_view)
{
    return ValidationOutcome::ok();
}

ValidationOutcome validate_number(std::string_view value)
{
    if (!number_of(value).has_value()) {
        return ValidationOutcome::failure("Must be a valid number", "Use digits with an optional decimal point");
    }
    return ValidationOutcome::ok();
}

ValidationOutcome validate_integer(std::string_view value)
{
    const auto number = number_of(value);
    if (!number.has_value() || std::trunc(*number) != *number) {
        return ValidationOutcome::failure("Must be a whole number", "Remove the decimal part");
    }
    return ValidationOutcome::ok();
}

ValidationOutcome validate_currency(std::string_view value)
{
    const auto number = number_of(value);
    if (!number.has_value()) {
        return ValidationOutcome::failure("Must be a valid amount", "Use a number such as 19.99");
    }
    const auto cents = *number * 100.0;
    if (std::fabs(cents - std::round(cents)) > 1e-6) {
        return ValidationOutcome::failure("Currency values allow at most 2 decimal places", "Round the amount to cents");
    }
    return ValidationOutcome::ok();
}

ValidationOutcome validate_percentage(std::string_view value)
{
    const auto number = number_of(value);
    if (!number.has_value() || *number < 0.0 || *number > 100.0) {
        return ValidationOutcome::failure("Percentage must be between 0 and 100", "Enter 45 for 45%");
    }
    return ValidationOutcome::ok();
}

ValidationOutcome validate_rating(std::string_view value)
{
    const auto number = number_of(value);
    if (!number.has_value() || *number < 0.0 || *number > 5.0) {
        return ValidationOutcome::failure("Rating must be between 0 and 5", "Use a value from 1 to 5");
    }
    return ValidationOutcome::ok();
}

ValidationOutcome validate_date(std::string_view value)
{
    if (!parse_date(value).has_value()) {
        return ValidationOutcome::failure("Invalid date", "Use YYYY-MM-DD, MM/DD/YYYY or DD.MM.YYYY");
    }
    return ValidationOutcome::ok();
}

ValidationOutcome validate_time(std::string_view value)
{
    if (!is_valid_time(value)) {
        return ValidationOutcome::failure("Invalid time format", "Use HH:MM or HH:MM:SS");
    }
    return ValidationOutcome::ok();
}

ValidationOutcome validate_datetime(std::string_view value)
{
    if (!is_valid_datetime(value)) {
        return ValidationOutcome::failure("Invalid date and time", "Use YYYY-MM-DDTHH:MM:SS");
    }
    return ValidationOutcome::ok();
}

ValidationOutcome validate_boolean(std::string_view value)
{
    if (!parse_boolean(value).has_value()) {
        return ValidationOutcome::failure("Must be a yes/no value", "Use true, false, yes, no, 1 or 0");
    }
    return ValidationOutcome::ok();
}

ValidationOutcome validate_email(std::string_view value)
{
    if (!is_valid_email(value)) {
        return ValidationOutcome::failure("Invalid email format", "Use a format like user@example.com");
    }
    return ValidationOutcome::ok();
}

ValidationOutcome validate_url(std::string_view value)
{
    if (!is_valid_url(value)) {
        return ValidationOutcome::failure("Invalid URL format", "Include the scheme, e.g. https://example.com");
    }
    return ValidationOutcome::ok();
}

ValidationOutcome validate_phone(std::string_view value)
{
    if (!is_valid_phone(value)) {
        return ValidationOutcome::failure("Invalid phone number format",
                                          "Use digits with optional +, spaces, dashes or parentheses");
    }
    return ValidationOutcome::ok();
}

ValidationOutcome validate_country(std::string_view value)
{
    if (!is_country_code(value)) {
        return ValidationOutcome::failure("Must be 2-3 letter country code", "Use 2-letter ISO code (e.g., US, GB, DE)");
    }
    return ValidationOutcome::ok();
}

// Spreadsheet exports write these where the country is unknown.
constexpr std::array<std::string_view, 5> kCountryPlaceholders{"NULL", "NONE", "N/A", "UNDEFINED", "FALSE"};

common::CellValue normalize_country(std::string_view value)
{
    for (const auto placeholder : kCountryPlaceholders) {
        if (common::iequals(value, placeholder)) {
            return std::monostate{};
        }
    }
    return common::to_upper_copy(value);
}

ValidationOutcome validate_color(std::string_view value)
{
    if (!is_valid_color(value)) {
        return ValidationOutcome::failure("Invalid color", "Use a hex value such as #FF8800");
    }
    return ValidationOutcome::ok();
}

std::string format_plain(const common::CellValue& value)
{
    return common::to_display_string(value);
}

std::string format_currency(const common::CellValue& value)
{
    const auto number = common::as_number(value);
    if (!number.has_value()) {
        return common::to_display_string(value);
    }
    return format_fixed(*number, 2);
}

std::string format_color(const common::CellValue& value)
{
    auto text = common::to_display_string(value);
    if (!text.empty() && text.front() != '#') {
        text.insert(text.begin(), '#');
    }
    return common::to_upper_copy(text);
}

std::string format_country(const common::CellValue& value)
{
    return common::to_upper_copy(common::to_display_string(value));
}

int random_int(GenerationContext& context, int low, int high)
{
    std::uniform_int_distribution<int> distribution(low, high);
    return distribution(context.engine);
}

common::CellValue generate_text(GenerationContext& context)
{
    return std::string{"Sample "} + std::to_string(context.index + 1U);
}

common::CellValue generate_textarea(GenerationContext& context)
{
    return std::string{"Generated description for item "} + std::to_string(context.index + 1U) + ".";
}

common::CellValue generate_number(GenerationContext& context)
{
    return static_cast<double>(random_int(context, 0, 100000)) / 100.0;
}

common::CellValue generate_integer(GenerationContext& context)
{
    return static_cast<double>(random_int(context, 0, 100));
}

common::CellValue generate_currency(GenerationContext& context)
{
    return static_cast<double>(random_int(context, 100, 50000)) / 100.0;
}

common::CellValue generate_percentage(GenerationContext& context)
{
    return static_cast<double>(random_int(context, 0, 100));
}

common::CellValue generate_rating(GenerationContext& context)
{
    return static_cast<double>(random_int(context, 1, 5));
}

common::CellValue generate_date(GenerationContext& context)
{
    char buffer[16] = {};
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d", random_int(context, 2020, 2025), random_int(context, 1, 12),
                  random_int(context, 1, 28));
    return std::string{buffer};
}

common::CellValue generate_time(GenerationContext& context)
{
    char buffer[8] = {};
    std::snprintf(buffer, sizeof(buffer), "%02d:%02d", random_int(context, 0, 23), random_int(context, 0, 59));
    return std::string{buffer};
}

common::CellValue generate_datetime(GenerationContext& context)
{
    const auto date = std::get<std::string>(generate_date(context));
    const auto time = std::get<std::string>(generate_time(context));
    return date + "T" + time + ":00";
}

common::CellValue generate_boolean(GenerationContext& context)
{
    return random_int(context, 0, 1) == 1;
}

common::CellValue generate_email(GenerationContext& context)
{
    return std::string{"user"} + std::to_string(context.index + 1U) + "@example.com";
}

common::CellValue generate_url(GenerationContext& context)
{
    return std::string{"https://example.com/items/"} + std::to_string(context.index + 1U);
}

common::CellValue generate_phone(GenerationContext& context)
{
    char buffer[24] = {};
    std::snprintf(buffer, sizeof(buffer), "+1 555 %03d %04d", random_int(context, 100, 999), random_int(context, 0, 9999));
    return std::string{buffer};
}

common::CellValue generate_country(GenerationContext& context)
{
    static constexpr std::array<std::string_view, 8> kCodes{"US", "GB", "DE", "FR", "CA", "JP", "AU", "NL"};
    return std::string{kCodes[static_cast<std::size_t>(random_int(context, 0, static_cast<int>(kCodes.size()) - 1))]};
}

common::CellValue generate_color(GenerationContext& context)
{
    char buffer[8] = {};
    std::snprintf(buffer, sizeof(buffer), "#%06X", random_int(context, 0, 0xFFFFFF));
    return std::string{buffer};
}

BuiltinTypeEntry make_entry(std::string_view id,
                            std::string_view display_name,
                            ValueKind kind,
                            BuiltinTypeEntry::ValidateFn validate,
                            BuiltinTypeEntry::FormatFn format,
                            BuiltinTypeEntry::GenerateFn generate,
                            BuiltinTypeEntry::NormalizeFn normalize = nullptr)
{
    BuiltinTypeEntry entry{};
    entry.id = id;
    entry.display_name = display_name;
    entry.kind = kind;
    entry.validate = validate;
    entry.format = format;
    entry.generate = generate;
    entry.normalize = normalize;
    return entry;
}

}  // namespace

std::string_view to_string(ValueKind kind) noexcept
{
    switch (kind) {
    case ValueKind::Number:
        return "number";
    case ValueKind::Boolean:
        return "boolean";
    case ValueKind::Date:
        return "date";
    case ValueKind::Json:
        return "json";
    case ValueKind::Text:
    default:
        return "text";
    }
}

std::vector<BuiltinTypeEntry> builtin_type_entries()
{
    return {
        make_entry("text", "Text", ValueKind::Text, accept_any, format_plain, generate_text),
        make_entry("textarea", "Long Text", ValueKind::Text, accept_any, format_plain, generate_textarea),
        make_entry("number", "Number", ValueKind::Number, validate_number, format_plain, generate_number),
        make_entry("integer", "Integer", ValueKind::Number, validate_integer, format_plain, generate_integer),
        make_entry("float", "Decimal", ValueKind::Number, validate_number, format_plain, generate_number),
        make_entry("currency", "Currency", ValueKind::Number, validate_currency, format_currency, generate_currency),
        make_entry("percentage", "Percentage", ValueKind::Number, validate_percentage, format_plain, generate_percentage),
        make_entry("date", "Date", ValueKind::Date, validate_date, format_plain, generate_date),
        make_entry("time", "Time", ValueKind::Text, validate_time, format_plain, generate_time),
        make_entry("datetime", "Date & Time", ValueKind::Text, validate_datetime, format_plain, generate_datetime),
        make_entry("boolean", "Yes/No", ValueKind::Boolean, validate_boolean, format_plain, generate_boolean),
        make_entry("email", "Email", ValueKind::Text, validate_email, format_plain, generate_email),
        make_entry("url", "URL", ValueKind::Text, validate_url, format_plain, generate_url),
        make_entry("phone", "Phone", ValueKind::Text, validate_phone, format_plain, generate_phone),
        make_entry("country", "Country", ValueKind::Text, validate_country, format_country, generate_country,
                   normalize_country),
        make_entry("select", "Select", ValueKind::Text, accept_any, format_plain, nullptr),
        make_entry("rating", "Rating", ValueKind::Number, validate_rating, format_plain, generate_rating),
        make_entry("color", "Color", ValueKind::Text, validate_color, format_color, generate_color),
    };
}

std::string make_module_type_id(std::string_view module_id, std::string_view tag)
{
    std::string id{module_id};
    id.push_back(':');
    id.append(tag);
    return id;
}

std::string_view module_of_type(std::string_view type_id) noexcept
{
    const auto separator = type_id.find(':');
    if (separator == std::string_view::npos) {
        return {};
    }
    return type_id.substr(0U, separator);
}

BuiltinColumnType::BuiltinColumnType(BuiltinTypeEntry entry)
    : entry_{std::move(entry)}
{
}

common::CellValue BuiltinColumnType::normalize(std::string_view value) const
{
    if (entry_.normalize == nullptr) {
        return std::string{value};
    }
    return entry_.normalize(value);
}

ValidationOutcome BuiltinColumnType::validate(std::string_view value) const
{
    if (entry_.validate == nullptr) {
        return ValidationOutcome::ok();
    }
    return entry_.validate(value);
}

std::string BuiltinColumnType::format(const common::CellValue& value) const
{
    if (common::is_null(value)) {
        return {};
    }
    if (entry_.format == nullptr) {
        return common::to_display_string(value);
    }
    return entry_.format(value);
}

std::optional<common::CellValue> BuiltinColumnType::generate(GenerationContext& context) const
{
    if (entry_.generate == nullptr) {
        return std::nullopt;
    }
    return entry_.generate(context);
}

ModuleColumnType::ModuleColumnType(std::string module_id, ModuleColumnTypeDefinition definition)
    : module_id_{std::move(module_id)}
    , type_id_{make_module_type_id(module_id_, definition.tag)}
    , definition_{std::move(definition)}
{
}

ValidationOutcome ModuleColumnType::validate(std::string_view value) const
{
    if (!definition_.multi_value) {
        return evaluate_validation_rules(definition_.validation, value);
    }

    const auto elements = split_multi_value(value);
    if (!elements.has_value()) {
        return ValidationOutcome::failure("Value must be a list", "Use a list such as [\"a\", \"b\"]");
    }
    for (std::size_t index = 0U; index < elements->size(); ++index) {
        auto outcome = evaluate_validation_rules(definition_.validation, (*elements)[index]);
        if (!outcome.valid) {
            outcome.reason = "Item " + std::to_string(index + 1U) + ": " + outcome.reason;
            return outcome;
        }
    }
    return ValidationOutcome::ok();
}

std::string ModuleColumnType::format(const common::CellValue& value) const
{
    return apply_format_rule(definition_.format, value);
}

std::optional<common::CellValue> ModuleColumnType::generate(GenerationContext& context) const
{
    if (!definition_.generation.has_value()) {
        return std::nullopt;
    }
    return apply_generation_rule(*definition_.generation, context);
}

}  // namespace dyntab::registry
