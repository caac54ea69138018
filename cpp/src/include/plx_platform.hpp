#pragma once
/**
 * @file plx_platform.hpp
 * @brief Layer 0: Platform detection and process/thread identity helpers.
 *
 * Every file that needs platform macros (PLEXUS_PLATFORM_LINUX, PLEXUS_IS_POSIX, ...)
 * should include this. It is self-contained and can be included at any point.
 */
#include "plexus_msg_export.h"

#include <cstdint>

#if defined(_WIN64)
#define PLEXUS_PLATFORM_WIN64 1
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#elif defined(__APPLE__) && defined(__MACH__)
#define PLEXUS_PLATFORM_APPLE 1
#elif defined(__FreeBSD__)
#define PLEXUS_PLATFORM_FREEBSD 1
#elif defined(__linux__)
#define PLEXUS_PLATFORM_LINUX 1
#else
#define PLEXUS_PLATFORM_UNKNOWN 1
#endif

#if defined(PLEXUS_PLATFORM_APPLE) || defined(PLEXUS_PLATFORM_FREEBSD) ||                    \
    defined(PLEXUS_PLATFORM_LINUX)
#define PLEXUS_IS_POSIX 1
#endif

namespace plexus::platform
{

/// Process ID of the calling process.
PLEXUS_MSG_EXPORT uint64_t get_pid();

/// Platform-native thread ID, suitable for logging.
PLEXUS_MSG_EXPORT uint64_t get_native_thread_id() noexcept;

} // namespace plexus::platform
