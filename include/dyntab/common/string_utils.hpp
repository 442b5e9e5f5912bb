#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace dyntab::common {

[[nodiscard]] std::string trim_copy(std::string_view text);
[[nodiscard]] std::string to_lower_copy(std::string_view text);
[[nodiscard]] std::string to_upper_copy(std::string_view text);
[[nodiscard]] bool iequals(std::string_view lhs, std::string_view rhs) noexcept;
[[nodiscard]] bool is_blank(std::string_view text) noexcept;
[[nodiscard]] std::vector<std::string> split(std::string_view text, char delimiter);
[[nodiscard]] std::string join(const std::vector<std::string>& parts, std::string_view separator);

}  // namespace dyntab::common
