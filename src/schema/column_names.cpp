#include "dyntab/schema/column_names.hpp"

#include "dyntab/common/string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <utility>
#include <vector>

namespace dyntab::schema {

namespace {

bool is_latin_letter(char ch) noexcept
{
    return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z');
}

std::vector<std::string> words_of(std::string_view text)
{
    std::vector<std::string> words;
    std::string current;
    for (const char ch : text) {
        if (std::isspace(static_cast<unsigned char>(ch)) != 0) {
            if (!current.empty()) {
                words.push_back(std::move(current));
                current.clear();
            }
            continue;
        }
        current.push_back(ch);
    }
    if (!current.empty()) {
        words.push_back(std::move(current));
    }
    return words;
}

}  // namespace

std::string to_internal_name(std::string_view display_name)
{
    std::string result;
    const auto words = words_of(display_name);
    for (std::size_t index = 0U; index < words.size(); ++index) {
        auto word = common::to_lower_copy(words[index]);
        if (index > 0U && !word.empty()) {
            word.front() = static_cast<char>(std::toupper(static_cast<unsigned char>(word.front())));
        }
        result += word;
    }
    return result;
}

std::string to_display_name(std::string_view internal_name)
{
    std::string spaced;
    for (const char ch : internal_name) {
        if (ch >= 'A' && ch <= 'Z' && !spaced.empty()) {
            spaced.push_back(' ');
        }
        spaced.push_back(ch);
    }

    std::string result;
    for (const auto& word : words_of(spaced)) {
        if (!result.empty()) {
            result.push_back(' ');
        }
        auto lowered = common::to_lower_copy(word);
        lowered.front() = static_cast<char>(std::toupper(static_cast<unsigned char>(lowered.front())));
        result += lowered;
    }
    return result;
}

ColumnNameValidation validate_column_name(std::string_view name)
{
    ColumnNameValidation validation{};
    const auto trimmed = common::trim_copy(name);
    if (trimmed.empty()) {
        validation.error = "Column name is required";
        return validation;
    }
    if (trimmed.size() > kMaxColumnNameLength) {
        validation.error = "Column name must be 100 characters or less";
        return validation;
    }

    const auto allowed = std::all_of(trimmed.begin(), trimmed.end(), [](char ch) {
        return is_latin_letter(ch) || ch == ' ' || ch == '\t';
    });
    if (!allowed || !is_latin_letter(trimmed.front())) {
        validation.error = "Column name can only contain Latin letters (a-z, A-Z) and spaces";
        return validation;
    }

    validation.internal_name = to_internal_name(trimmed);
    if (validation.internal_name.empty()) {
        validation.error = "Column name must contain at least one letter";
        return validation;
    }
    validation.valid = true;
    return validation;
}

}  // namespace dyntab::schema
