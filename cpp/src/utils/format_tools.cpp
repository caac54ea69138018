// format_tools.cpp
#include "utils/format_tools.hpp"

#include <ctime>
#include <iterator>

#include <fmt/chrono.h>

namespace plexus::format_tools
{

// Two-step formatting: seconds through fmt::chrono, fractional microseconds appended
// manually so the output does not depend on the fmt version's subsecond support.
std::string formatted_time(std::chrono::system_clock::time_point timestamp)
{
    auto tp_us = std::chrono::time_point_cast<std::chrono::microseconds>(timestamp);
    auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp_us);
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(tp_us - secs).count();
    // normalize to 0..999999 even for negative timestamps
    int fractional_us = static_cast<int>(us % 1000000);
    if (fractional_us < 0)
        fractional_us += 1000000;
    std::time_t tt = std::chrono::system_clock::to_time_t(secs);
    auto sec_part = fmt::format("{:%Y-%m-%d %H:%M:%S}", fmt::localtime(tt));
    return fmt::format("{}.{:06d}", sec_part, fractional_us);
}

std::string printable_bytes(std::string_view bytes, size_t max_len)
{
    std::string out;
    const size_t n = bytes.size() < max_len ? bytes.size() : max_len;
    out.reserve(n);
    for (size_t i = 0; i < n; ++i)
    {
        const auto c = static_cast<unsigned char>(bytes[i]);
        if (c >= 0x20 && c < 0x7f)
            out.push_back(static_cast<char>(c));
        else
            fmt::format_to(std::back_inserter(out), "\\x{:02x}", c);
    }
    if (bytes.size() > max_len)
        out.append("...");
    return out;
}

} // namespace plexus::format_tools
