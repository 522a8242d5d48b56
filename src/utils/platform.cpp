// platform.cpp
#include "sfx_platform.hpp"
#include "scenefix_version.h"

#include <chrono>
#include <functional>
#include <thread>

#if defined(SCENEFIX_IS_POSIX)
#include <sys/syscall.h>
#include <sys/types.h>
#include <unistd.h>
#endif
#if defined(SCENEFIX_PLATFORM_APPLE)
#include <pthread.h>
#endif

namespace scenefix::platform
{

uint64_t get_pid() noexcept
{
#if defined(SCENEFIX_PLATFORM_WIN64)
    return static_cast<uint64_t>(GetCurrentProcessId());
#else
    return static_cast<uint64_t>(getpid());
#endif
}

/**
 * @brief Gets a platform-native thread ID.
 * @details Uses the most efficient OS-specific API available (`GetCurrentThreadId`,
 *          `pthread_threadid_np`, `syscall(SYS_gettid)`).
 */
uint64_t get_native_thread_id() noexcept
{
#if defined(SCENEFIX_PLATFORM_WIN64)
    return static_cast<uint64_t>(::GetCurrentThreadId());
#elif defined(SCENEFIX_PLATFORM_APPLE)
    uint64_t tid = 0;
    pthread_threadid_np(nullptr, &tid);
    return tid;
#elif defined(SCENEFIX_PLATFORM_LINUX)
    return static_cast<uint64_t>(syscall(SYS_gettid));
#else
    return std::hash<std::thread::id>()(std::this_thread::get_id());
#endif
}

// --- Version information (from scenefix_version.h, generated at configure time) ---

const char *get_version_string() noexcept
{
    return SCENEFIX_VERSION_STRING;
}

uint64_t monotonic_time_ns() noexcept
{
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
                                     std::chrono::steady_clock::now().time_since_epoch())
                                     .count());
}

uint64_t elapsed_time_ns(uint64_t start_ns) noexcept
{
    uint64_t now = monotonic_time_ns();
    if (now < start_ns)
    {
        return 0;
    }
    return now - start_ns;
}

} // namespace scenefix::platform
