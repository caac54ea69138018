// Tools for formatting strings
#pragma once
#include "plexus_msg_export.h"

#include <chrono>
#include <string>
#include <string_view>

#include <fmt/format.h>

namespace plexus::format_tools
{

/**
 * @brief Formats a system_clock time_point into a string with microsecond precision.
 * @return A string in the format "YYYY-MM-DD HH:MM:SS.us" (local time).
 */
PLEXUS_MSG_EXPORT std::string formatted_time(std::chrono::system_clock::time_point timestamp);

/**
 * @brief Renders a byte string for log output: printable ASCII is kept, anything else
 *        is written as \xNN, and the result is capped at @p max_len input bytes.
 */
PLEXUS_MSG_EXPORT std::string printable_bytes(std::string_view bytes, size_t max_len = 64);

} // namespace plexus::format_tools
