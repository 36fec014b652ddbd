#include "psync/core/logging.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <vector>

namespace psync {

namespace {

spdlog::level::level_enum level_for(int verbosity) {
    if (verbosity >= 2) {
        return spdlog::level::trace;
    }
    if (verbosity == 1) {
        return spdlog::level::debug;
    }
    return spdlog::level::info;
}

} // namespace

Result<void> init_logging(const LogSettings& settings) {
    const auto level = level_for(settings.verbosity);

    auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console->set_level(settings.quiet ? spdlog::level::warn : level);
    std::vector<spdlog::sink_ptr> sinks{console};

    if (settings.log_file) {
        try {
            auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(settings.log_file->string(), true);
            file->set_level(settings.quiet ? spdlog::level::debug : level);
            sinks.push_back(file);
        } catch (const spdlog::spdlog_ex& e) {
            return Err<void>(ErrorKind::ConfigurationError,
                             std::string("cannot open log file: ") + e.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>("psync", sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::trace);
    logger->set_pattern("[%H:%M:%S] [%^%l%$] %v");
    spdlog::set_default_logger(logger);
    return Ok();
}

} // namespace psync
