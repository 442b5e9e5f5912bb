#include "dyntab/common/string_utils.hpp"

#include <algorithm>
#include <cctype>

namespace dyntab::common {

std::string trim_copy(std::string_view text)
{
    std::size_t start = 0U;
    while (start < text.size() && std::isspace(static_cast<unsigned char>(text[start])) != 0) {
        ++start;
    }

    std::size_t end = text.size();
    while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1U])) != 0) {
        --end;
    }

    return std::string{text.substr(start, end - start)};
}

std::string to_lower_copy(std::string_view text)
{
    std::string result{text};
    std::transform(result.begin(), result.end(), result.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return result;
}

std::string to_upper_copy(std::string_view text)
{
    std::string result{text};
    std::transform(result.begin(), result.end(), result.begin(), [](unsigned char ch) {
        return static_cast<char>(std::toupper(ch));
    });
    return result;
}

bool iequals(std::string_view lhs, std::string_view rhs) noexcept
{
    if (lhs.size() != rhs.size()) {
        return false;
    }
    for (std::size_t index = 0U; index < lhs.size(); ++index) {
        const auto left = std::tolower(static_cast<unsigned char>(lhs[index]));
        const auto right = std::tolower(static_cast<unsigned char>(rhs[index]));
        if (left != right) {
            return false;
        }
    }
    return true;
}

bool is_blank(std::string_view text) noexcept
{
    return std::all_of(text.begin(), text.end(), [](unsigned char ch) { return std::isspace(ch) != 0; });
}

std::vector<std::string> split(std::string_view text, char delimiter)
{
    std::vector<std::string> parts;
    std::size_t begin = 0U;
    while (true) {
        const auto end = text.find(delimiter, begin);
        if (end == std::string_view::npos) {
            parts.emplace_back(text.substr(begin));
            break;
        }
        parts.emplace_back(text.substr(begin, end - begin));
        begin = end + 1U;
    }
    return parts;
}

std::string join(const std::vector<std::string>& parts, std::string_view separator)
{
    std::string result;
    for (std::size_t index = 0U; index < parts.size(); ++index) {
        if (index > 0U) {
            result.append(separator);
        }
        result.append(parts[index]);
    }
    return result;
}

}  // namespace dyntab::common
