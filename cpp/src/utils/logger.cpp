/*******************************************************************************
 * @file logger.cpp
 * @brief Implementation of the synchronous, sink-based logger.
 *
 * Locking notes:
 *  - should_log() and max_log_line_length() only read atomics; the header template
 *    calls them without taking the mutex.
 *  - write_formatted() holds Impl::mtx while the sink writes. If the write fails the
 *    failure is recorded under the lock, and the user callback is invoked after the
 *    lock has been released so the callback may log again.
 ******************************************************************************/
#include "utils/logger.hpp"

#include "plx_platform.hpp"
#include "utils/logger_sinks/console_sink.hpp"
#include "utils/logger_sinks/file_sink.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <mutex>
#include <stdexcept>
#include <system_error>

namespace plexus::utils
{

struct Logger::Impl
{
    std::mutex mtx;
    std::unique_ptr<Sink> sink{std::make_unique<ConsoleSink>()};

    std::atomic<int> level{static_cast<int>(Level::L_INFO)};
    std::atomic<size_t> max_log_line_length{64 * 1024};
    std::atomic<int> write_failure_count{0};

    std::function<void(const std::string &)> write_error_callback;
};

Logger::Logger() : pImpl(std::make_unique<Impl>()) {}

Logger::~Logger() = default;

Logger &Logger::instance()
{
    // Intentionally leaked: endpoints destroyed during static destruction may still log.
    static Logger *logger = new Logger();
    return *logger;
}

bool Logger::set_console()
{
    set_sink(std::make_unique<ConsoleSink>());
    return true;
}

bool Logger::set_logfile(const std::string &utf8_path)
{
    std::unique_ptr<Sink> sink;
    try
    {
        sink = std::make_unique<FileSink>(utf8_path);
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "[PLEXUS] Logger: {}\n", e.what());
        return false;
    }
    set_sink(std::move(sink));
    return true;
}

void Logger::set_sink(std::unique_ptr<Sink> sink)
{
    std::lock_guard<std::mutex> lock(pImpl->mtx);
    if (pImpl->sink)
    {
        pImpl->sink->flush();
    }
    pImpl->sink = std::move(sink);
}

void Logger::shutdown()
{
    set_sink(nullptr);
}

void Logger::flush()
{
    std::lock_guard<std::mutex> lock(pImpl->mtx);
    if (pImpl->sink)
    {
        pImpl->sink->flush();
    }
}

void Logger::set_level(Level lvl)
{
    pImpl->level.store(static_cast<int>(lvl), std::memory_order_relaxed);
}

Logger::Level Logger::level() const
{
    return static_cast<Level>(pImpl->level.load(std::memory_order_relaxed));
}

void Logger::set_max_log_line_length(size_t bytes)
{
    pImpl->max_log_line_length.store(bytes, std::memory_order_relaxed);
}

size_t Logger::max_log_line_length() const noexcept
{
    return pImpl->max_log_line_length.load(std::memory_order_relaxed);
}

void Logger::set_write_error_callback(std::function<void(const std::string &)> cb)
{
    std::lock_guard<std::mutex> lock(pImpl->mtx);
    pImpl->write_error_callback = std::move(cb);
}

int Logger::write_failure_count() const
{
    return pImpl->write_failure_count.load();
}

bool Logger::should_log(Level lvl) const noexcept
{
    return static_cast<int>(lvl) >= pImpl->level.load(std::memory_order_relaxed);
}

void Logger::write_formatted(Level lvl, fmt::memory_buffer &&body) noexcept
{
    LogMessage msg{std::chrono::system_clock::now(), platform::get_pid(),
                   platform::get_native_thread_id(), static_cast<int>(lvl), std::move(body)};

    std::function<void(const std::string &)> cb;
    std::string error_text;
    {
        std::lock_guard<std::mutex> lock(pImpl->mtx);
        if (!pImpl->sink)
        {
            return;
        }
        try
        {
            pImpl->sink->write(msg);
            if (lvl >= Level::L_WARNING)
            {
                pImpl->sink->flush();
            }
            return;
        }
        catch (const std::exception &e)
        {
            pImpl->write_failure_count.fetch_add(1);
            error_text = fmt::format("{} write failed: {}", pImpl->sink->description(), e.what());
            cb = pImpl->write_error_callback;
        }
    }

    if (cb)
    {
        try
        {
            cb(error_text);
        }
        catch (const std::exception &e)
        {
            std::fprintf(stderr, "[PLEXUS] Logger: write error callback threw: %s\n", e.what());
        }
    }
}

} // namespace plexus::utils
