#include "dyntab/registry/module_rules.hpp"

#include "dyntab/common/string_utils.hpp"
#include "dyntab/registry/value_patterns.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <ctime>
#include <regex>

namespace dyntab::registry {

namespace {

std::string rule_message(const ValidationRule& rule, std::string fallback)
{
    return rule.message.empty() ? std::move(fallback) : rule.message;
}

std::string describe_range(const ValidationRule& rule)
{
    if (rule.min.has_value() && rule.max.has_value()) {
        return "between " + common::format_number(*rule.min) + " and " + common::format_number(*rule.max);
    }
    if (rule.min.has_value()) {
        return "at least " + common::format_number(*rule.min);
    }
    if (rule.max.has_value()) {
        return "at most " + common::format_number(*rule.max);
    }
    return "within range";
}

std::string digits_only(std::string_view text)
{
    std::string digits;
    for (const char ch : text) {
        if (std::isdigit(static_cast<unsigned char>(ch)) != 0) {
            digits.push_back(ch);
        }
    }
    return digits;
}

std::string format_phone(PhoneStyle style, std::string_view text)
{
    const auto digits = digits_only(text);
    if (digits.size() < 10U) {
        return std::string{text};
    }
    const auto national = digits.substr(digits.size() - 10U);
    auto country = digits.substr(0U, digits.size() - 10U);
    if (country.empty()) {
        country = "1";
    }
    switch (style) {
    case PhoneStyle::E164:
        return "+" + country + national;
    case PhoneStyle::National:
        return "(" + national.substr(0U, 3U) + ") " + national.substr(3U, 3U) + "-" + national.substr(6U);
    case PhoneStyle::International:
    default:
        return "+" + country + " " + national.substr(0U, 3U) + " " + national.substr(3U, 3U) + " " + national.substr(6U);
    }
}

std::string currency_symbol(std::string_view code)
{
    if (common::iequals(code, "USD")) {
        return "$";
    }
    if (common::iequals(code, "EUR")) {
        return "\xE2\x82\xAC";
    }
    if (common::iequals(code, "GBP")) {
        return "\xC2\xA3";
    }
    return common::to_upper_copy(code) + " ";
}

std::string format_date(std::string_view pattern, std::string_view text)
{
    int year = 0;
    int month = 0;
    int day = 0;
    if (text.size() < 10U || std::sscanf(std::string{text.substr(0U, 10U)}.c_str(), "%4d-%2d-%2d", &year, &month, &day) != 3) {
        return std::string{text};
    }
    std::tm parts{};
    parts.tm_year = year - 1900;
    parts.tm_mon = month - 1;
    parts.tm_mday = day;
    std::array<char, 64> buffer{};
    const auto written = std::strftime(buffer.data(), buffer.size(), std::string{pattern}.c_str(), &parts);
    if (written == 0U) {
        return std::string{text};
    }
    return std::string(buffer.data(), written);
}

void replace_all(std::string& text, std::string_view token, std::string_view replacement)
{
    std::size_t position = 0U;
    while ((position = text.find(token, position)) != std::string::npos) {
        text.replace(position, token.size(), replacement);
        position += replacement.size();
    }
}

std::string generate_pattern(std::string_view pattern, std::mt19937_64& engine)
{
    static constexpr std::string_view kAlphanumeric = "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz";
    std::uniform_int_distribution<int> digit(0, 9);
    std::uniform_int_distribution<int> letter(0, 25);
    std::uniform_int_distribution<std::size_t> alnum(0U, kAlphanumeric.size() - 1U);

    std::string result;
    bool literal = false;
    for (const char ch : pattern) {
        if (ch == '{') {
            literal = true;
            continue;
        }
        if (ch == '}') {
            literal = false;
            continue;
        }
        if (literal) {
            result.push_back(ch);
            continue;
        }
        switch (ch) {
        case '#':
            result.push_back(static_cast<char>('0' + digit(engine)));
            break;
        case 'A':
            result.push_back(static_cast<char>('A' + letter(engine)));
            break;
        case 'a':
            result.push_back(static_cast<char>('a' + letter(engine)));
            break;
        case '*':
            result.push_back(kAlphanumeric[alnum(engine)]);
            break;
        default:
            result.push_back(ch);
            break;
        }
    }
    return result;
}

}  // namespace

ValidationOutcome evaluate_validation_rule(const ValidationRule& rule, std::string_view value)
{
    switch (rule.kind) {
    case ValidationRuleKind::Required:
        if (common::is_blank(value)) {
            return ValidationOutcome::failure(rule_message(rule, "This field is required"));
        }
        return ValidationOutcome::ok();
    case ValidationRuleKind::Regex: {
        if (value.size() > kMaxPatternInputLength) {
            return ValidationOutcome::failure(rule_message(rule, "Value does not match the required format"),
                                              "Shorten the value to at most " + std::to_string(kMaxPatternInputLength) +
                                                  " characters");
        }
        try {
            const std::regex pattern(rule.pattern);
            if (!std::regex_search(value.begin(), value.end(), pattern)) {
                return ValidationOutcome::failure(rule_message(rule, "Value does not match the required format"));
            }
        } catch (const std::regex_error&) {
            return ValidationOutcome::failure("Column type declares an invalid pattern",
                                              "Report the module definition to its author.");
        }
        return ValidationOutcome::ok();
    }
    case ValidationRuleKind::Phone:
        if (!is_valid_phone(value, rule.allow_extension)) {
            return ValidationOutcome::failure(rule_message(rule, "Invalid phone number format"),
                                              "Use digits with optional +, spaces, dashes or parentheses");
        }
        return ValidationOutcome::ok();
    case ValidationRuleKind::Email:
        if (!is_valid_email(value)) {
            return ValidationOutcome::failure(rule_message(rule, "Invalid email format"), "Use a format like user@example.com");
        }
        return ValidationOutcome::ok();
    case ValidationRuleKind::Url:
        if (!is_valid_url(value)) {
            return ValidationOutcome::failure(rule_message(rule, "Invalid URL format"), "Include the scheme, e.g. https://example.com");
        }
        return ValidationOutcome::ok();
    case ValidationRuleKind::Range: {
        const auto number = common::as_number(common::CellValue{std::string{value}});
        if (!number.has_value()) {
            return ValidationOutcome::failure(rule_message(rule, "Value must be a number"));
        }
        if ((rule.min.has_value() && *number < *rule.min) || (rule.max.has_value() && *number > *rule.max)) {
            return ValidationOutcome::failure(rule_message(rule, "Value must be " + describe_range(rule)));
        }
        return ValidationOutcome::ok();
    }
    case ValidationRuleKind::Length: {
        const auto length = static_cast<double>(value.size());
        if ((rule.min.has_value() && length < *rule.min) || (rule.max.has_value() && length > *rule.max)) {
            return ValidationOutcome::failure(rule_message(rule, "Length must be " + describe_range(rule)));
        }
        return ValidationOutcome::ok();
    }
    case ValidationRuleKind::Enum:
        if (std::find(rule.values.begin(), rule.values.end(), value) == rule.values.end()) {
            return ValidationOutcome::failure(rule_message(rule, "Value must be one of: " + common::join(rule.values, ", ")));
        }
        return ValidationOutcome::ok();
    case ValidationRuleKind::JsonSchema:
        return ValidationOutcome::ok();
    case ValidationRuleKind::Composite: {
        if (rule.mode == CompositeMode::All) {
            return evaluate_validation_rules(rule.rules, value);
        }
        if (rule.rules.empty()) {
            return ValidationOutcome::ok();
        }
        for (const auto& child : rule.rules) {
            if (evaluate_validation_rule(child, value).valid) {
                return ValidationOutcome::ok();
            }
        }
        return ValidationOutcome::failure(rule_message(rule, "Value does not satisfy any accepted format"));
    }
    default:
        return ValidationOutcome::ok();
    }
}

ValidationOutcome evaluate_validation_rules(const std::vector<ValidationRule>& rules, std::string_view value)
{
    for (const auto& rule : rules) {
        auto outcome = evaluate_validation_rule(rule, value);
        if (!outcome.valid) {
            return outcome;
        }
    }
    return ValidationOutcome::ok();
}

std::string apply_format_rule(const FormatRule& rule, const common::CellValue& value)
{
    if (common::is_null(value)) {
        return {};
    }
    const auto text = common::to_display_string(value);

    switch (rule.kind) {
    case FormatRuleKind::Phone:
        return format_phone(rule.phone_style, text);
    case FormatRuleKind::Currency: {
        const auto number = common::as_number(value);
        if (!number.has_value()) {
            return text;
        }
        const auto body = format_fixed(std::fabs(*number), rule.decimals, true);
        return (*number < 0.0 ? "-" : "") + currency_symbol(rule.currency) + body;
    }
    case FormatRuleKind::Number: {
        const auto number = common::as_number(value);
        if (!number.has_value()) {
            return text;
        }
        return format_fixed(*number, rule.decimals, rule.thousands_separator);
    }
    case FormatRuleKind::Date:
        return format_date(rule.date_format, text);
    case FormatRuleKind::Boolean: {
        if (const auto* flag = std::get_if<bool>(&value)) {
            return *flag ? rule.true_label : rule.false_label;
        }
        if (common::iequals(text, "true")) {
            return rule.true_label;
        }
        if (common::iequals(text, "false")) {
            return rule.false_label;
        }
        return text;
    }
    case FormatRuleKind::Uppercase:
        return common::to_upper_copy(text);
    case FormatRuleKind::Lowercase:
        return common::to_lower_copy(text);
    case FormatRuleKind::Template: {
        auto rendered = rule.template_text;
        replace_all(rendered, "{value}", text);
        return rendered;
    }
    case FormatRuleKind::None:
    default:
        return text;
    }
}

common::CellValue apply_generation_rule(const GenerationRule& rule, GenerationContext& context)
{
    switch (rule.kind) {
    case GenerationRuleKind::Static:
        return rule.value;
    case GenerationRuleKind::RandomInt: {
        const auto low = static_cast<long long>(std::ceil(std::min(rule.min, rule.max)));
        const auto high = static_cast<long long>(std::floor(std::max(rule.min, rule.max)));
        std::uniform_int_distribution<long long> distribution(low, std::max(low, high));
        return static_cast<double>(distribution(context.engine));
    }
    case GenerationRuleKind::RandomFloat: {
        std::uniform_real_distribution<double> distribution(std::min(rule.min, rule.max), std::max(rule.min, rule.max));
        const auto scale = std::pow(10.0, std::clamp(rule.decimals, 0, 10));
        return std::round(distribution(context.engine) * scale) / scale;
    }
    case GenerationRuleKind::RandomBoolean: {
        std::bernoulli_distribution distribution(std::clamp(rule.probability, 0.0, 1.0));
        return distribution(context.engine);
    }
    case GenerationRuleKind::RandomEnum: {
        if (rule.values.empty()) {
            return std::monostate{};
        }
        std::uniform_int_distribution<std::size_t> distribution(0U, rule.values.size() - 1U);
        return rule.values[distribution(context.engine)];
    }
    case GenerationRuleKind::Sequence:
        return rule.start + static_cast<double>(context.index) * rule.step;
    case GenerationRuleKind::Pattern:
        return generate_pattern(rule.pattern, context.engine);
    case GenerationRuleKind::Template: {
        auto rendered = rule.template_text;
        for (const auto& slot : rule.data) {
            const auto generated = apply_generation_rule(slot.rule, context);
            replace_all(rendered, "{" + slot.name + "}", common::to_display_string(generated));
        }
        return rendered;
    }
    default:
        return std::monostate{};
    }
}

std::optional<std::vector<std::string>> split_multi_value(std::string_view value)
{
    const auto text = common::trim_copy(value);
    if (text.size() < 2U || text.front() != '[' || text.back() != ']') {
        return std::nullopt;
    }

    std::vector<std::string> elements;
    std::string current;
    bool in_string = false;
    bool escaped = false;
    bool pending = false;
    for (std::size_t index = 1U; index + 1U < text.size(); ++index) {
        const char ch = text[index];
        if (in_string) {
            if (escaped) {
                current.push_back(ch);
                escaped = false;
            } else if (ch == '\\') {
                escaped = true;
            } else if (ch == '"') {
                in_string = false;
            } else {
                current.push_back(ch);
            }
            continue;
        }
        if (ch == '"') {
            in_string = true;
            pending = true;
            continue;
        }
        if (ch == ',') {
            elements.push_back(common::trim_copy(current));
            current.clear();
            pending = false;
            continue;
        }
        if (std::isspace(static_cast<unsigned char>(ch)) == 0) {
            pending = true;
        }
        current.push_back(ch);
    }
    if (in_string) {
        return std::nullopt;
    }
    if (pending || !elements.empty()) {
        elements.push_back(common::trim_copy(current));
    }
    return elements;
}

}  // namespace dyntab::registry
