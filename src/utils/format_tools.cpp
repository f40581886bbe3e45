// format_tools.cpp
#include "ljdaq_base.hpp"

#include <fmt/chrono.h>

namespace ljdaq::format_tools
{

// Local time with sub-second resolution. fmt's chrono formatter prints whole
// seconds for system_clock, so the microsecond part is appended separately.
std::string formatted_time(std::chrono::system_clock::time_point timestamp)
{
    auto tp_us = std::chrono::time_point_cast<std::chrono::microseconds>(timestamp);
    auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp_us);
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(tp_us - secs).count();
    // normalize to 0..999999 even for negative timestamps
    int fractional_us = static_cast<int>(us % 1000000);
    if (fractional_us < 0)
        fractional_us += 1000000;
    auto sec_part = fmt::format("{:%Y-%m-%d %H:%M:%S}", fmt::localtime(std::chrono::system_clock::to_time_t(secs)));
    return fmt::format("{}.{:06d}", sec_part, fractional_us);
}

std::string join(const std::vector<std::string> &items, std::string_view sep)
{
    return fmt::format("{}", fmt::join(items, sep));
}

} // namespace ljdaq::format_tools
