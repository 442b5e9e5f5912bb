#pragma once

#include "dyntab/catalog/table_model.hpp"
#include "dyntab/registry/column_type.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace dyntab::registry {

// Modules ship data only. Every rule below is interpreted by a built-in handler.

enum class ValidationRuleKind : std::uint8_t {
    Required = 0,
    Regex,
    Phone,
    Email,
    Url,
    Range,
    Length,
    Enum,
    JsonSchema,
    Composite
};

enum class CompositeMode : std::uint8_t {
    All = 0,
    Any
};

struct ValidationRule final {
    ValidationRuleKind kind = ValidationRuleKind::Required;
    std::string pattern{};
    std::string message{};
    bool allow_extension = false;
    std::optional<double> min{};
    std::optional<double> max{};
    std::vector<std::string> values{};
    std::vector<ValidationRule> rules{};
    CompositeMode mode = CompositeMode::All;
};

enum class FormatRuleKind : std::uint8_t {
    None = 0,
    Phone,
    Currency,
    Number,
    Date,
    Boolean,
    Uppercase,
    Lowercase,
    Template
};

enum class PhoneStyle : std::uint8_t {
    E164 = 0,
    National,
    International
};

struct FormatRule final {
    FormatRuleKind kind = FormatRuleKind::None;
    PhoneStyle phone_style = PhoneStyle::International;
    std::string currency = "USD";
    int decimals = 2;
    bool thousands_separator = false;
    std::string date_format = "%Y-%m-%d";
    std::string true_label = "Yes";
    std::string false_label = "No";
    std::string template_text = "{value}";
};

enum class GenerationRuleKind : std::uint8_t {
    Static = 0,
    RandomInt,
    RandomFloat,
    RandomBoolean,
    RandomEnum,
    Sequence,
    Pattern,
    Template
};

struct TemplateSlot;

struct GenerationRule final {
    GenerationRuleKind kind = GenerationRuleKind::Static;
    common::CellValue value{};
    double min = 0.0;
    double max = 100.0;
    int decimals = 2;
    double probability = 0.5;
    std::vector<std::string> values{};
    double start = 1.0;
    double step = 1.0;
    std::string pattern{};
    std::string template_text{};
    std::vector<TemplateSlot> data{};  // {name} placeholders of a template rule
};

struct TemplateSlot final {
    std::string name{};
    GenerationRule rule{};
};

struct ModuleColumnTypeDefinition final {
    std::string tag{};
    std::string display_name{};
    ValueKind base_kind = ValueKind::Text;
    bool multi_value = false;
    std::optional<std::string> default_value{};
    std::vector<ValidationRule> validation{};
    FormatRule format{};
    std::optional<GenerationRule> generation{};
};

struct ModuleGeneratorDefinition final {
    std::string tag{};
    std::string display_name{};
    GenerationRule rule{};
};

struct TableGeneratorColumn final {
    std::string name{};
    std::string type_id = "text";
    bool required = false;
    bool allow_duplicates = true;
    std::optional<std::string> default_value{};
    std::optional<GenerationRule> generate{};
};

struct TableGeneratorDefinition final {
    std::string id{};
    std::string display_name{};
    std::string description{};
    catalog::TablePurpose purpose = catalog::TablePurpose::Default;
    std::size_t default_table_count = 1U;
    std::size_t default_row_count = 10U;
    std::vector<TableGeneratorColumn> columns{};
};

struct ModuleCapabilities final {
    std::vector<ModuleColumnTypeDefinition> column_types{};
    std::vector<ModuleGeneratorDefinition> generators{};
    std::vector<TableGeneratorDefinition> table_generators{};
};

[[nodiscard]] ValidationOutcome evaluate_validation_rule(const ValidationRule& rule, std::string_view value);
[[nodiscard]] ValidationOutcome evaluate_validation_rules(const std::vector<ValidationRule>& rules, std::string_view value);
[[nodiscard]] std::string apply_format_rule(const FormatRule& rule, const common::CellValue& value);
[[nodiscard]] common::CellValue apply_generation_rule(const GenerationRule& rule, GenerationContext& context);

// Splits a JSON-array-like literal (["a", "b"]) into elements; nullopt when the value is not a list.
[[nodiscard]] std::optional<std::vector<std::string>> split_multi_value(std::string_view value);

}  // namespace dyntab::registry
