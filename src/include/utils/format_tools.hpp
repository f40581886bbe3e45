// Tools for formatting strings
#pragma once
#include <chrono>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>

#include "ljdaq_export.h"

namespace ljdaq::format_tools
{

/**
 * @brief Formats a system_clock time_point with microsecond precision.
 * @return A string in the format "YYYY-MM-DD HH:MM:SS.uuuuuu" (local time).
 */
LJDAQ_EXPORT std::string formatted_time(std::chrono::system_clock::time_point timestamp);

/**
 * @brief Joins register names (or any string list) with a separator.
 *
 * Used to print the register lists held by the device helpers, e.g.
 * "DAC0_BINARY, DAC1_BINARY".
 */
LJDAQ_EXPORT std::string join(const std::vector<std::string> &items, std::string_view sep = ", ");

/**
 * @brief Substitutes a stream-out index into a per-stream register template.
 *
 * `indexed_register("STREAM_OUT{}_ENABLE", 1)` yields "STREAM_OUT1_ENABLE".
 */
inline std::string indexed_register(fmt::string_view pattern, std::size_t index)
{
    return fmt::format(fmt::runtime(pattern), index);
}

} // namespace ljdaq::format_tools
