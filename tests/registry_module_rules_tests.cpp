#include "dyntab/registry/column_type_handlers.hpp"
#include "dyntab/registry/module_rules.hpp"
#include "dyntab/registry/value_patterns.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <string>
#include <variant>
#include <vector>

using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::StartsWith;
using dyntab::common::CellValue;
using namespace dyntab::registry;

namespace {

ValidationRule make_rule(ValidationRuleKind kind)
{
    ValidationRule rule{};
    rule.kind = kind;
    return rule;
}

}  // namespace

TEST_CASE("Value patterns accept the documented formats")
{
    CHECK(is_valid_email("user@example.com"));
    CHECK_FALSE(is_valid_email("user@example"));
    CHECK_FALSE(is_valid_email("user example@test.com"));

    CHECK(is_valid_url("https://example.com/items/1"));
    CHECK(is_valid_url("http://localhost:8080"));
    CHECK_FALSE(is_valid_url("example.com"));

    CHECK(is_valid_phone("+1 (555) 123-4567"));
    CHECK_FALSE(is_valid_phone("12345"));
    CHECK_FALSE(is_valid_phone("555-1234 ext 12"));
    CHECK(is_valid_phone("555-1234 ext 12", true));

    CHECK(is_valid_time("9:05"));
    CHECK(is_valid_time("23:59:59"));
    CHECK_FALSE(is_valid_time("24:00"));

    CHECK(is_valid_datetime("2024-01-15T10:30:00Z"));
    CHECK_FALSE(is_valid_datetime("2024-13-15"));

    CHECK(is_valid_color("#FF8800"));
    CHECK(is_valid_color("abc"));
    CHECK_FALSE(is_valid_color("#GG0000"));

    CHECK(is_country_code("US"));
    CHECK(is_country_code("deu"));
    CHECK_FALSE(is_country_code("U5"));
}

TEST_CASE("Value patterns scan long input without recursion")
{
    const std::string long_local(1024U * 1024U, 'a');
    CHECK(is_valid_email(long_local + "@example.com"));
    CHECK_FALSE(is_valid_email(long_local + "@example"));
    CHECK(is_valid_url("https://example.com/" + long_local));
    CHECK_FALSE(is_valid_url("https://" + long_local + " x"));
    CHECK_FALSE(is_valid_datetime("2024-01-15T10:30:00" + long_local));
    CHECK_FALSE(is_valid_phone(long_local, true));
    CHECK_FALSE(is_valid_color(long_local));

    auto rule = make_rule(ValidationRuleKind::Regex);
    rule.pattern = "^a+$";
    CHECK(evaluate_validation_rule(rule, std::string(kMaxPatternInputLength, 'a')).valid);
    const auto rejected = evaluate_validation_rule(rule, long_local);
    CHECK_FALSE(rejected.valid);
    CHECK_THAT(rejected.suggestion, ContainsSubstring(std::to_string(kMaxPatternInputLength)));
}

TEST_CASE("Dates normalize to YYYY-MM-DD")
{
    CHECK(parse_date("2024-01-15") == "2024-01-15");
    CHECK(parse_date("1/15/2024") == "2024-01-15");
    CHECK(parse_date("01-15-2024") == "2024-01-15");
    CHECK(parse_date("2024/1/5") == "2024-01-05");
    CHECK(parse_date("15.01.2024") == "2024-01-15");
    CHECK(parse_date("2024-02-29") == "2024-02-29");

    CHECK_FALSE(parse_date("2023-02-29").has_value());
    CHECK_FALSE(parse_date("2024-13-01").has_value());
    CHECK_FALSE(parse_date("yesterday").has_value());
}

TEST_CASE("Boolean tokens are case-insensitive")
{
    for (const auto* token : {"true", "YES", "1", "y", "On"}) {
        CAPTURE(token);
        CHECK(parse_boolean(token) == true);
    }
    for (const auto* token : {"false", "No", "0", "N", "off"}) {
        CAPTURE(token);
        CHECK(parse_boolean(token) == false);
    }
    CHECK_FALSE(parse_boolean("maybe").has_value());
}

TEST_CASE("Fixed-point formatting groups thousands on request")
{
    CHECK(format_fixed(1234567.891, 2) == "1234567.89");
    CHECK(format_fixed(1234567.891, 2, true) == "1,234,567.89");
    CHECK(format_fixed(-1234.6, 0, true) == "-1,235");
    CHECK(format_fixed(12.0, 2, true) == "12.00");
}

TEST_CASE("Validation rules report the first failing rule")
{
    SECTION("range")
    {
        auto rule = make_rule(ValidationRuleKind::Range);
        rule.min = 1.0;
        rule.max = 10.0;
        CHECK(evaluate_validation_rule(rule, "5").valid);
        const auto outcome = evaluate_validation_rule(rule, "11");
        CHECK_FALSE(outcome.valid);
        CHECK(outcome.reason == "Value must be between 1 and 10");
        CHECK_FALSE(evaluate_validation_rule(rule, "ten").valid);
    }

    SECTION("length")
    {
        auto rule = make_rule(ValidationRuleKind::Length);
        rule.max = 3.0;
        CHECK(evaluate_validation_rule(rule, "abc").valid);
        CHECK(evaluate_validation_rule(rule, "abcd").reason == "Length must be at most 3");
    }

    SECTION("enum with custom message")
    {
        auto rule = make_rule(ValidationRuleKind::Enum);
        rule.values = {"bronze", "silver"};
        CHECK(evaluate_validation_rule(rule, "silver").valid);
        CHECK(evaluate_validation_rule(rule, "gold").reason == "Value must be one of: bronze, silver");
        rule.message = "Pick a tier";
        CHECK(evaluate_validation_rule(rule, "gold").reason == "Pick a tier");
    }

    SECTION("regex")
    {
        auto rule = make_rule(ValidationRuleKind::Regex);
        rule.pattern = "^SKU-[0-9]+$";
        CHECK(evaluate_validation_rule(rule, "SKU-42").valid);
        CHECK_FALSE(evaluate_validation_rule(rule, "sku42").valid);

        rule.pattern = "([unclosed";
        const auto broken = evaluate_validation_rule(rule, "anything");
        CHECK_FALSE(broken.valid);
        CHECK_THAT(broken.reason, ContainsSubstring("invalid pattern"));
    }

    SECTION("composite any and all")
    {
        auto any = make_rule(ValidationRuleKind::Composite);
        any.mode = CompositeMode::Any;
        any.rules = {make_rule(ValidationRuleKind::Email), make_rule(ValidationRuleKind::Phone)};
        CHECK(evaluate_validation_rule(any, "user@example.com").valid);
        CHECK(evaluate_validation_rule(any, "+1 555 123 4567").valid);
        CHECK_FALSE(evaluate_validation_rule(any, "neither").valid);

        auto all = any;
        all.mode = CompositeMode::All;
        CHECK_FALSE(evaluate_validation_rule(all, "user@example.com").valid);
    }

    SECTION("required treats blank text as missing")
    {
        const auto rule = make_rule(ValidationRuleKind::Required);
        CHECK_FALSE(evaluate_validation_rule(rule, "   ").valid);
        CHECK(evaluate_validation_rule(rule, "x").valid);
    }

    SECTION("rule lists stop at the first failure")
    {
        auto length = make_rule(ValidationRuleKind::Length);
        length.min = 20.0;
        const std::vector<ValidationRule> rules{make_rule(ValidationRuleKind::Email), length};
        CHECK(evaluate_validation_rules(rules, "bad").reason == "Invalid email format");
        CHECK(evaluate_validation_rules(rules, "a@b.co").reason == "Length must be at least 20");
    }
}

TEST_CASE("Format rules render stored values")
{
    FormatRule rule{};

    SECTION("phone styles")
    {
        rule.kind = FormatRuleKind::Phone;
        rule.phone_style = PhoneStyle::E164;
        CHECK(apply_format_rule(rule, CellValue{std::string{"(555) 123-4567"}}) == "+15551234567");
        rule.phone_style = PhoneStyle::International;
        CHECK(apply_format_rule(rule, CellValue{std::string{"44 20 7946 0958"}}) == "+44 207 946 0958");
        CHECK(apply_format_rule(rule, CellValue{std::string{"12345"}}) == "12345");
    }

    SECTION("currency")
    {
        rule.kind = FormatRuleKind::Currency;
        CHECK(apply_format_rule(rule, CellValue{1234.5}) == "$1,234.50");
        CHECK(apply_format_rule(rule, CellValue{-3.0}) == "-$3.00");
        rule.currency = "CHF";
        CHECK(apply_format_rule(rule, CellValue{10.0}) == "CHF 10.00");
    }

    SECTION("boolean labels")
    {
        rule.kind = FormatRuleKind::Boolean;
        rule.true_label = "In stock";
        rule.false_label = "Sold out";
        CHECK(apply_format_rule(rule, CellValue{true}) == "In stock");
        CHECK(apply_format_rule(rule, CellValue{std::string{"FALSE"}}) == "Sold out");
    }

    SECTION("date pattern")
    {
        rule.kind = FormatRuleKind::Date;
        rule.date_format = "%d/%m/%Y";
        CHECK(apply_format_rule(rule, CellValue{std::string{"2024-01-15"}}) == "15/01/2024");
    }

    SECTION("template and case")
    {
        rule.kind = FormatRuleKind::Template;
        rule.template_text = "[{value}]";
        CHECK(apply_format_rule(rule, CellValue{7.0}) == "[7]");
        rule.kind = FormatRuleKind::Uppercase;
        CHECK(apply_format_rule(rule, CellValue{std::string{"abc"}}) == "ABC");
    }

    SECTION("null stays empty")
    {
        rule.kind = FormatRuleKind::Uppercase;
        CHECK(apply_format_rule(rule, CellValue{}).empty());
    }
}

TEST_CASE("Generation rules are reproducible for a seed")
{
    GenerationRule rule{};
    rule.kind = GenerationRuleKind::RandomInt;
    rule.min = 10.0;
    rule.max = 20.0;

    GenerationContext first{42U};
    GenerationContext second{42U};
    for (int i = 0; i < 16; ++i) {
        const auto lhs = apply_generation_rule(rule, first);
        const auto rhs = apply_generation_rule(rule, second);
        REQUIRE(lhs == rhs);
        const auto value = std::get<double>(lhs);
        CHECK(value >= 10.0);
        CHECK(value <= 20.0);
    }

    SECTION("sequence follows the row index")
    {
        GenerationRule sequence{};
        sequence.kind = GenerationRuleKind::Sequence;
        sequence.start = 100.0;
        sequence.step = 5.0;
        GenerationContext context{};
        context.index = 3U;
        CHECK(std::get<double>(apply_generation_rule(sequence, context)) == 115.0);
    }

    SECTION("pattern keeps braced literals")
    {
        GenerationRule pattern{};
        pattern.kind = GenerationRuleKind::Pattern;
        pattern.pattern = "{SKU}-###";
        GenerationContext context{7U};
        const auto value = std::get<std::string>(apply_generation_rule(pattern, context));
        CHECK_THAT(value, StartsWith("SKU-"));
        CHECK(value.size() == 7U);
    }

    SECTION("template fills named slots")
    {
        GenerationRule slot{};
        slot.kind = GenerationRuleKind::Static;
        slot.value = std::string{"Widget"};

        GenerationRule templated{};
        templated.kind = GenerationRuleKind::Template;
        templated.template_text = "{noun} #{noun}";
        templated.data.push_back(TemplateSlot{"noun", slot});
        GenerationContext context{};
        CHECK(std::get<std::string>(apply_generation_rule(templated, context)) == "Widget #Widget");
    }

    SECTION("empty enum yields null")
    {
        GenerationRule empty{};
        empty.kind = GenerationRuleKind::RandomEnum;
        GenerationContext context{};
        CHECK(std::holds_alternative<std::monostate>(apply_generation_rule(empty, context)));
    }
}

TEST_CASE("Multi-value literals split into elements")
{
    CHECK(split_multi_value(R"(["a", "b, c"])") == std::vector<std::string>{"a", "b, c"});
    CHECK(split_multi_value("[1, 2]") == std::vector<std::string>{"1", "2"});
    CHECK(split_multi_value("[]") == std::vector<std::string>{});
    CHECK_FALSE(split_multi_value("a, b").has_value());
    CHECK_FALSE(split_multi_value(R"(["open])").has_value());
}

TEST_CASE("Multi-value module types validate every element")
{
    ModuleColumnTypeDefinition definition{};
    definition.tag = "emails";
    definition.multi_value = true;
    definition.validation.push_back(make_rule(ValidationRuleKind::Email));
    const ModuleColumnType type{"crm", definition};

    CHECK(type.type_id() == "crm:emails");
    CHECK(type.validate(R"(["a@b.co", "c@d.io"])").valid);
    const auto outcome = type.validate(R"(["a@b.co", "broken"])");
    CHECK_FALSE(outcome.valid);
    CHECK_THAT(outcome.reason, StartsWith("Item 2: "));
    CHECK_FALSE(type.validate("a@b.co").valid);
}
