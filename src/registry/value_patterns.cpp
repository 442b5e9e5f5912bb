#include "dyntab/registry/value_patterns.hpp"

#include "dyntab/common/string_utils.hpp"

#include <tao/pegtl.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <iomanip>
#include <sstream>

namespace dyntab::registry {

namespace {

namespace pegtl = tao::pegtl;

namespace pattern {

// Any non-whitespace character other than Cs.
template <char... Cs>
struct visible_except : pegtl::seq<pegtl::not_at<pegtl::space>, pegtl::not_one<Cs...>> {
};

struct visible : pegtl::seq<pegtl::not_at<pegtl::space>, pegtl::any> {
};

struct email_local : pegtl::plus<visible_except<'@'>> {
};

struct email_label : pegtl::plus<visible_except<'@', '.'>> {
};

struct email : pegtl::seq<email_local,
                          pegtl::one<'@'>,
                          email_label,
                          pegtl::plus<pegtl::one<'.'>, email_label>,
                          pegtl::eof> {
};

struct url_scheme : pegtl::seq<pegtl::alpha, pegtl::star<pegtl::sor<pegtl::alnum, pegtl::one<'+', '.', '-'>>>> {
};

struct url_host : pegtl::plus<visible_except<'/', '?', '#', ':'>> {
};

struct url_port : pegtl::seq<pegtl::one<':'>, pegtl::rep_min_max<1, 5, pegtl::digit>> {
};

struct url_rest : pegtl::seq<pegtl::one<'/', '?', '#'>, pegtl::star<visible>> {
};

struct url : pegtl::seq<url_scheme,
                        pegtl::string<':', '/', '/'>,
                        url_host,
                        pegtl::opt<url_port>,
                        pegtl::opt<url_rest>,
                        pegtl::eof> {
};

struct phone_char : pegtl::sor<pegtl::digit, pegtl::space, pegtl::one<'-', '(', ')', '.'>> {
};

struct phone : pegtl::seq<pegtl::opt<pegtl::one<'+'>>, pegtl::rep_min_max<7, 20, phone_char>, pegtl::eof> {
};

struct minute : pegtl::seq<pegtl::range<'0', '5'>, pegtl::digit> {
};

struct short_hour : pegtl::sor<pegtl::seq<pegtl::one<'2'>, pegtl::range<'0', '3'>>,
                               pegtl::seq<pegtl::range<'0', '1'>, pegtl::digit>,
                               pegtl::digit> {
};

struct time_of_day : pegtl::seq<short_hour,
                         pegtl::one<':'>,
                         minute,
                         pegtl::opt<pegtl::one<':'>, minute>,
                         pegtl::eof> {
};

struct month : pegtl::sor<pegtl::seq<pegtl::one<'0'>, pegtl::range<'1', '9'>>,
                          pegtl::seq<pegtl::one<'1'>, pegtl::range<'0', '2'>>> {
};

struct day : pegtl::sor<pegtl::seq<pegtl::one<'0'>, pegtl::range<'1', '9'>>,
                        pegtl::seq<pegtl::range<'1', '2'>, pegtl::digit>,
                        pegtl::seq<pegtl::one<'3'>, pegtl::range<'0', '1'>>> {
};

struct hour : pegtl::sor<pegtl::seq<pegtl::range<'0', '1'>, pegtl::digit>,
                         pegtl::seq<pegtl::one<'2'>, pegtl::range<'0', '3'>>> {
};

struct seconds : pegtl::seq<pegtl::one<':'>,
                            minute,
                            pegtl::opt<pegtl::one<'.'>, pegtl::rep_min_max<1, 9, pegtl::digit>>> {
};

struct zone : pegtl::sor<pegtl::one<'Z'>,
                         pegtl::seq<pegtl::one<'+', '-'>,
                                    pegtl::rep<2, pegtl::digit>,
                                    pegtl::opt<pegtl::one<':'>>,
                                    pegtl::rep<2, pegtl::digit>>> {
};

struct clock_part : pegtl::seq<pegtl::one<'T', ' '>, hour, pegtl::one<':'>, minute, pegtl::opt<seconds>, pegtl::opt<zone>> {
};

struct datetime : pegtl::seq<pegtl::rep<4, pegtl::digit>,
                             pegtl::one<'-'>,
                             month,
                             pegtl::one<'-'>,
                             day,
                             pegtl::opt<clock_part>,
                             pegtl::eof> {
};

struct color : pegtl::seq<pegtl::opt<pegtl::one<'#'>>,
                          pegtl::sor<pegtl::seq<pegtl::rep<8, pegtl::xdigit>, pegtl::eof>,
                                     pegtl::seq<pegtl::rep<6, pegtl::xdigit>, pegtl::eof>,
                                     pegtl::seq<pegtl::rep<3, pegtl::xdigit>, pegtl::eof>>> {
};

}  // namespace pattern

template <typename Rule>
bool matches(std::string_view value)
{
    pegtl::memory_input input(value.data(), value.size(), "value");
    return pegtl::parse<Rule>(input);
}

// Drops a trailing "ext 123", "x123" or "#123" extension.
std::string_view strip_phone_extension(std::string_view value)
{
    auto end = value.size();
    std::size_t digits = 0U;
    while (end > 0U && std::isdigit(static_cast<unsigned char>(value[end - 1U])) != 0) {
        --end;
        ++digits;
    }
    if (digits == 0U || digits > 6U) {
        return value;
    }
    while (end > 0U && std::isspace(static_cast<unsigned char>(value[end - 1U])) != 0) {
        --end;
    }

    const auto head = value.substr(0U, end);
    std::size_t marker = 0U;
    if (head.size() >= 4U && common::iequals(head.substr(head.size() - 4U), "ext.")) {
        marker = 4U;
    } else if (head.size() >= 3U && common::iequals(head.substr(head.size() - 3U), "ext")) {
        marker = 3U;
    } else if (!head.empty() && (head.back() == 'x' || head.back() == 'X' || head.back() == '#')) {
        marker = 1U;
    }
    if (marker == 0U) {
        return value;
    }

    end = head.size() - marker;
    while (end > 0U && std::isspace(static_cast<unsigned char>(value[end - 1U])) != 0) {
        --end;
    }
    return value.substr(0U, end);
}

bool is_leap_year(int year) noexcept
{
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int days_in_month(int year, int month) noexcept
{
    static constexpr int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && is_leap_year(year)) {
        return 29;
    }
    return kDays[month - 1];
}

std::optional<std::string> make_date(int year, int month, int day)
{
    if (year < 1900 || year > 2100 || month < 1 || month > 12) {
        return std::nullopt;
    }
    if (day < 1 || day > days_in_month(year, month)) {
        return std::nullopt;
    }
    char buffer[16] = {};
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d", year, month, day);
    return std::string{buffer};
}

struct DateFields final {
    int values[3] = {};
    std::size_t widths[3] = {};
    char separator = '\0';
};

// Three digit groups joined by one repeated separator, e.g. "1/15/2024".
bool split_date(std::string_view value, DateFields& fields)
{
    std::size_t position = 0U;
    for (std::size_t index = 0U; index < 3U; ++index) {
        if (index > 0U) {
            if (position >= value.size()) {
                return false;
            }
            const auto separator = value[position];
            if (index == 1U) {
                if (separator != '-' && separator != '/' && separator != '.') {
                    return false;
                }
                fields.separator = separator;
            } else if (separator != fields.separator) {
                return false;
            }
            ++position;
        }

        const auto begin = position;
        while (position < value.size() && position - begin < 4U && std::isdigit(static_cast<unsigned char>(value[position])) != 0) {
            ++position;
        }
        if (position == begin) {
            return false;
        }
        fields.widths[index] = position - begin;
        std::from_chars(value.data() + begin, value.data() + position, fields.values[index]);
    }
    return position == value.size();
}

}  // namespace

bool is_valid_email(std::string_view value)
{
    return matches<pattern::email>(value);
}

bool is_valid_url(std::string_view value)
{
    return matches<pattern::url>(value);
}

bool is_valid_phone(std::string_view value, bool allow_extension)
{
    const auto candidate = allow_extension ? strip_phone_extension(value) : value;
    if (!matches<pattern::phone>(candidate)) {
        return false;
    }
    const auto digits = std::count_if(candidate.begin(), candidate.end(), [](unsigned char ch) {
        return std::isdigit(ch) != 0;
    });
    return digits >= 7;
}

bool is_valid_time(std::string_view value)
{
    return matches<pattern::time_of_day>(value);
}

bool is_valid_datetime(std::string_view value)
{
    return matches<pattern::datetime>(value);
}

bool is_valid_color(std::string_view value)
{
    return matches<pattern::color>(value);
}

bool is_country_code(std::string_view value) noexcept
{
    if (value.size() < 2U || value.size() > 3U) {
        return false;
    }
    return std::all_of(value.begin(), value.end(), [](unsigned char ch) {
        return (ch >= 'A' && ch <= 'Z') || (ch >= 'a' && ch <= 'z');
    });
}

std::optional<std::string> parse_date(std::string_view value)
{
    DateFields fields{};
    if (!split_date(value, fields)) {
        return std::nullopt;
    }

    const auto year_first = fields.widths[0] == 4U && fields.widths[1] <= 2U && fields.widths[2] <= 2U;
    const auto year_last = fields.widths[0] <= 2U && fields.widths[1] <= 2U && fields.widths[2] == 4U;
    switch (fields.separator) {
    case '-':
    case '/':
        if (year_first) {
            return make_date(fields.values[0], fields.values[1], fields.values[2]);
        }
        if (year_last) {
            return make_date(fields.values[2], fields.values[0], fields.values[1]);
        }
        return std::nullopt;
    case '.':
        if (year_last) {
            return make_date(fields.values[2], fields.values[1], fields.values[0]);
        }
        return std::nullopt;
    default:
        return std::nullopt;
    }
}

std::optional<bool> parse_boolean(std::string_view value)
{
    static constexpr std::string_view kTrue[] = {"true", "yes", "1", "y", "on"};
    static constexpr std::string_view kFalse[] = {"false", "no", "0", "n", "off"};
    for (const auto token : kTrue) {
        if (common::iequals(value, token)) {
            return true;
        }
    }
    for (const auto token : kFalse) {
        if (common::iequals(value, token)) {
            return false;
        }
    }
    return std::nullopt;
}

std::string format_fixed(double value, int decimals, bool thousands_separator)
{
    std::ostringstream stream;
    stream << std::fixed << std::setprecision(std::clamp(decimals, 0, 10)) << value;
    auto text = stream.str();
    if (!thousands_separator) {
        return text;
    }

    const auto negative = !text.empty() && text.front() == '-';
    const auto begin = negative ? 1U : 0U;
    auto end = text.find('.');
    if (end == std::string::npos) {
        end = text.size();
    }
    std::string grouped;
    const auto digits = end - begin;
    for (std::size_t index = 0U; index < digits; ++index) {
        if (index > 0U && (digits - index) % 3U == 0U) {
            grouped.push_back(',');
        }
        grouped.push_back(text[begin + index]);
    }
    return (negative ? "-" : "") + grouped + text.substr(end);
}

}  // namespace dyntab::registry
