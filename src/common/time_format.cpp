#include "dyntab/common/time_format.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace dyntab::common {

namespace {

std::tm to_utc(std::time_t value)
{
    std::tm buffer{};
#if defined(_WIN32)
    gmtime_s(&buffer, &value);
#else
    gmtime_r(&value, &buffer);
#endif
    return buffer;
}

}  // namespace

std::string format_timestamp_iso(std::chrono::system_clock::time_point tp)
{
    if (tp.time_since_epoch().count() == 0) {
        return {};
    }

    const auto time_value = std::chrono::system_clock::to_time_t(tp);
    const auto buffer = to_utc(time_value);

    std::ostringstream stream;
    stream << std::put_time(&buffer, "%Y-%m-%dT%H:%M:%S");
    const auto fractional = tp - std::chrono::system_clock::from_time_t(time_value);
    const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(fractional).count();
    stream << '.' << std::setw(6) << std::setfill('0') << micros << 'Z';
    return stream.str();
}

std::string format_date_utc(std::chrono::system_clock::time_point tp)
{
    const auto buffer = to_utc(std::chrono::system_clock::to_time_t(tp));
    std::ostringstream stream;
    stream << std::put_time(&buffer, "%Y-%m-%d");
    return stream.str();
}

}  // namespace dyntab::common
