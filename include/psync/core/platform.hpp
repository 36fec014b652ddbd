#pragma once

#if defined(_WIN32)
    #define PSYNC_PLATFORM_WINDOWS
#elif defined(__APPLE__)
    #define PSYNC_PLATFORM_MACOS
#else
    #define PSYNC_PLATFORM_LINUX
#endif

#include <cstddef>
#include <functional>

namespace psync {

enum class Platform {
    Windows,
    Linux,
    MacOS,
    Unknown
};

inline Platform get_platform() {
#ifdef PSYNC_PLATFORM_WINDOWS
    return Platform::Windows;
#elif defined(PSYNC_PLATFORM_MACOS)
    return Platform::MacOS;
#elif defined(PSYNC_PLATFORM_LINUX)
    return Platform::Linux;
#else
    return Platform::Unknown;
#endif
}

inline const char* platform_name(Platform platform) {
    switch (platform) {
        case Platform::Windows: return "Windows";
        case Platform::Linux: return "Linux";
        case Platform::MacOS: return "macOS";
        default: return "Unknown";
    }
}

/**
 * @brief Facts about the host the worker cap is derived from
 *
 * Gathered once by detect_platform(); tests build it by hand.
 */
struct PlatformInfo {
    Platform platform = Platform::Unknown;
    std::size_t hardware_threads = 1;
    std::size_t fd_soft_limit = 0; ///< 0 when the limit could not be read
};

PlatformInfo detect_platform();

/// Pure function deciding the maximum number of concurrent workers
using WorkerCapPolicy = std::function<std::size_t(const PlatformInfo&)>;

/**
 * Linux: a quarter of the descriptor soft limit, clamped to [64, 512].
 * macOS: 64. Everything else: 256.
 */
std::size_t default_worker_cap(const PlatformInfo& info);

/// Policy that ignores the host and always answers @p cap
WorkerCapPolicy fixed_worker_cap(std::size_t cap);

} // namespace psync
