#include "psync/core/platform.hpp"

#include <algorithm>
#include <thread>

#ifndef PSYNC_PLATFORM_WINDOWS
#include <sys/resource.h>
#endif

namespace psync {

PlatformInfo detect_platform() {
    PlatformInfo info;
    info.platform = get_platform();
    info.hardware_threads = std::max<std::size_t>(1, std::thread::hardware_concurrency());

#ifndef PSYNC_PLATFORM_WINDOWS
    struct rlimit limit {};
    if (::getrlimit(RLIMIT_NOFILE, &limit) == 0 && limit.rlim_cur != RLIM_INFINITY) {
        info.fd_soft_limit = static_cast<std::size_t>(limit.rlim_cur);
    }
#endif

    return info;
}

std::size_t default_worker_cap(const PlatformInfo& info) {
    switch (info.platform) {
        case Platform::MacOS:
            return 64;
        case Platform::Linux:
            if (info.fd_soft_limit == 0) {
                return 256;
            }
            return std::clamp<std::size_t>(info.fd_soft_limit / 4, 64, 512);
        default:
            return 256;
    }
}

WorkerCapPolicy fixed_worker_cap(std::size_t cap) {
    return [cap](const PlatformInfo&) { return cap; };
}

} // namespace psync
