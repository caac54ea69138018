/**
 * @file platform.cpp
 * @brief Cross-platform process and thread identity used by the logger.
 */
#include "plx_platform.hpp"

#include <functional>
#include <thread>

#if defined(PLEXUS_IS_POSIX)
#include <pthread.h>
#include <sys/syscall.h>
#include <sys/types.h>
#include <unistd.h>
#endif

namespace plexus::platform
{

uint64_t get_pid()
{
#if defined(PLEXUS_PLATFORM_WIN64)
    return static_cast<uint64_t>(GetCurrentProcessId());
#else
    return static_cast<uint64_t>(getpid());
#endif
}

uint64_t get_native_thread_id() noexcept
{
#if defined(PLEXUS_PLATFORM_WIN64)
    return static_cast<uint64_t>(::GetCurrentThreadId());
#elif defined(PLEXUS_PLATFORM_APPLE)
    uint64_t tid;
    pthread_threadid_np(nullptr, &tid);
    return tid;
#elif defined(PLEXUS_PLATFORM_LINUX)
    return static_cast<uint64_t>(syscall(SYS_gettid));
#else
    return std::hash<std::thread::id>()(std::this_thread::get_id());
#endif
}

} // namespace plexus::platform
