#pragma once

#include "plexus_msg_export.h"

#include <chrono>
#include <cstdint>
#include <string>

#include <fmt/format.h>

namespace plexus::utils
{

// Represents a single log message event.
struct LogMessage
{
    std::chrono::system_clock::time_point timestamp;
    uint64_t process_id;
    uint64_t thread_id;
    int level; // Use int to avoid including all of logger.hpp for the enum.
    fmt::memory_buffer body;
};

// Abstract interface for a log message destination.
class PLEXUS_MSG_EXPORT Sink
{
  public:
    virtual ~Sink() = default;
    // Throws std::system_error when the underlying write fails.
    virtual void write(const LogMessage &msg) = 0;
    virtual void flush() = 0;
    virtual std::string description() const = 0;

    static const char *level_to_string_internal(int lvl);
    static std::string format_logmsg(const LogMessage &msg);
};

} // namespace plexus::utils
