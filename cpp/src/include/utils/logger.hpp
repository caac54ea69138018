#pragma once
/**
 * @file logger.hpp
 * @brief Process-wide leveled logger with fmt-style formatting.
 *
 * Formatting happens in the calling thread into an fmt::memory_buffer; the
 * formatted body is then handed to write_formatted(), which stamps it and
 * passes it to the active Sink under a mutex. Logging never throws.
 *
 * Use the LOGGER_* macros; messages below LOGGER_COMPILE_LEVEL are compiled out.
 */
#include "plexus_msg_export.h"

#include <cstddef>
#include <functional>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

// Default initial reserve for fmt::memory_buffer used by Logger::log_fmt.
#ifndef LOGGER_FMT_BUFFER_RESERVE
#define LOGGER_FMT_BUFFER_RESERVE (1024u)
#endif

#ifndef LOGGER_COMPILE_LEVEL
#define LOGGER_COMPILE_LEVEL 0 // 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error
#endif

namespace plexus::utils
{

class Sink;

class PLEXUS_MSG_EXPORT Logger
{
  public:
    enum class Level : int
    {
        L_TRACE = 0,
        L_DEBUG = 1,
        L_INFO = 2,
        L_WARNING = 3,
        L_ERROR = 4,
        L_SYSTEM = 5,
    };

    // Singleton accessor
    static Logger &instance();

    ~Logger();

    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;
    Logger(Logger &&) = delete;
    Logger &operator=(Logger &&) = delete;

    // ---- Sinks ----
    /// Route output to stderr (the default).
    bool set_console();
    /// Route output to @p utf8_path, opened for append. Returns false if it cannot be opened;
    /// the previous sink stays active in that case.
    bool set_logfile(const std::string &utf8_path);
    /// Install a caller-provided sink.
    void set_sink(std::unique_ptr<Sink> sink);
    /// Flush and drop the active sink. Later messages are discarded until a sink is set.
    void shutdown();
    void flush();

    // ---- Configuration & Diagnostics ----
    void set_level(Level lvl);
    [[nodiscard]] Level level() const;

    void set_max_log_line_length(size_t bytes);
    [[nodiscard]] size_t max_log_line_length() const noexcept;

    void set_write_error_callback(std::function<void(const std::string &)> cb);
    [[nodiscard]] int write_failure_count() const;

    [[nodiscard]] bool should_log(Level lvl) const noexcept;

    // ---- Formatting API ----
    template <typename... Args>
    void log_fmt(Level lvl, fmt::format_string<Args...> fmt_str, Args &&...args) noexcept;

  private:
    Logger();

    // Non-template sink entry: accepts an already formatted body (no newline).
    void write_formatted(Level lvl, fmt::memory_buffer &&body) noexcept;

    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

template <typename... Args>
void Logger::log_fmt(Level lvl, fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    if (!should_log(lvl))
        return;

    try
    {
        fmt::memory_buffer mb;
        mb.reserve(static_cast<size_t>(LOGGER_FMT_BUFFER_RESERVE));
        fmt::format_to(std::back_inserter(mb), fmt_str, std::forward<Args>(args)...);

        static constexpr std::string_view kTruncMarker = "...[TRUNCATED]";
        const size_t max_line = max_log_line_length();
        if (mb.size() > max_line)
        {
            const size_t cap = (max_line > kTruncMarker.size()) ? (max_line - kTruncMarker.size()) : 1;
            mb.resize(cap);
            mb.append(kTruncMarker);
        }
        write_formatted(lvl, std::move(mb));
    }
    catch (const std::exception &ex)
    {
        fmt::memory_buffer err;
        fmt::format_to(std::back_inserter(err), "[FORMAT ERROR] {}", ex.what());
        write_formatted(lvl, std::move(err));
    }
}

} // namespace plexus::utils

#define PLEXUS_LOG_AT(lvl, fmt_str, ...)                                                           \
    ::plexus::utils::Logger::instance().log_fmt(::plexus::utils::Logger::Level::lvl,             \
                                                fmt_str __VA_OPT__(, ) __VA_ARGS__)

#if LOGGER_COMPILE_LEVEL <= 0
#define LOGGER_TRACE(fmt_str, ...) PLEXUS_LOG_AT(L_TRACE, fmt_str __VA_OPT__(, ) __VA_ARGS__)
#else
#define LOGGER_TRACE(fmt_str, ...) ((void)0)
#endif

#if LOGGER_COMPILE_LEVEL <= 1
#define LOGGER_DEBUG(fmt_str, ...) PLEXUS_LOG_AT(L_DEBUG, fmt_str __VA_OPT__(, ) __VA_ARGS__)
#else
#define LOGGER_DEBUG(fmt_str, ...) ((void)0)
#endif

#if LOGGER_COMPILE_LEVEL <= 2
#define LOGGER_INFO(fmt_str, ...) PLEXUS_LOG_AT(L_INFO, fmt_str __VA_OPT__(, ) __VA_ARGS__)
#else
#define LOGGER_INFO(fmt_str, ...) ((void)0)
#endif

#if LOGGER_COMPILE_LEVEL <= 3
#define LOGGER_WARN(fmt_str, ...) PLEXUS_LOG_AT(L_WARNING, fmt_str __VA_OPT__(, ) __VA_ARGS__)
#else
#define LOGGER_WARN(fmt_str, ...) ((void)0)
#endif

#if LOGGER_COMPILE_LEVEL <= 4
#define LOGGER_ERROR(fmt_str, ...) PLEXUS_LOG_AT(L_ERROR, fmt_str __VA_OPT__(, ) __VA_ARGS__)
#else
#define LOGGER_ERROR(fmt_str, ...) ((void)0)
#endif
