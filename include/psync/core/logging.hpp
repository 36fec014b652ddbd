#pragma once

#include "psync/core/result.hpp"

#include <filesystem>
#include <optional>

namespace psync {

struct LogSettings {
    int verbosity = 0;     ///< 0 info, 1 debug, 2+ trace
    bool quiet = false;    ///< only warnings and errors on the console
    std::optional<std::filesystem::path> log_file; ///< truncated at start
};

/**
 * @brief Install the process-wide spdlog logger
 *
 * Console sink always; file sink when a log file is requested. The file
 * receives every level the console would, plus debug lines when quiet.
 */
Result<void> init_logging(const LogSettings& settings);

} // namespace psync
