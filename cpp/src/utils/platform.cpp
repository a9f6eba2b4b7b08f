/**
 * @file platform.cpp
 * @brief Provides cross-platform implementations for core OS-specific utilities.
 *
 * This file contains the platform-specific logic for functions declared in the
 * `treespec::platform` namespace: process and thread IDs for log lines and the
 * monotonic clock used to time tests.
 */
#include "tsp_platform.hpp"

#include <chrono>
#include <functional>
#include <thread>

#if defined(TREESPEC_IS_POSIX)
#include <sys/syscall.h>
#include <sys/types.h>
#include <unistd.h>
#endif

#if defined(TREESPEC_PLATFORM_APPLE)
#include <pthread.h>
#endif

namespace treespec::platform
{

uint64_t get_pid() noexcept
{
#if defined(TREESPEC_PLATFORM_WIN64)
    return static_cast<uint64_t>(GetCurrentProcessId());
#elif defined(TREESPEC_IS_POSIX)
    return static_cast<uint64_t>(getpid());
#else
    return 0;
#endif
}

/**
 * @brief Gets a platform-native thread ID.
 * @details Uses the most efficient OS-specific API available
 *          (`GetCurrentThreadId`, `pthread_threadid_np`, `syscall(SYS_gettid)`).
 */
uint64_t get_native_thread_id() noexcept
{
#if defined(TREESPEC_PLATFORM_WIN64)
    return static_cast<uint64_t>(::GetCurrentThreadId());
#elif defined(TREESPEC_PLATFORM_APPLE)
    uint64_t tid;
    pthread_threadid_np(nullptr, &tid);
    return tid;
#elif defined(TREESPEC_PLATFORM_LINUX)
    return static_cast<uint64_t>(syscall(SYS_gettid));
#else
    // Fallback for other POSIX or unknown systems.
    return std::hash<std::thread::id>()(std::this_thread::get_id());
#endif
}

uint64_t monotonic_time_ns() noexcept
{
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
                                     std::chrono::steady_clock::now().time_since_epoch())
                                     .count());
}

uint64_t elapsed_time_ns(uint64_t start_ns) noexcept
{
    const uint64_t now = monotonic_time_ns();
    return now < start_ns ? 0 : now - start_ns;
}

} // namespace treespec::platform
