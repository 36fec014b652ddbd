#include "psync/core/config.hpp"
#include "psync/core/logging.hpp"
#include "psync/events/components.hpp"
#include "psync/events/event_bus.hpp"
#include "psync/events/progress.hpp"
#include "psync/sync/engine.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitPartialFailure = 1;
constexpr int kExitConfigError = 2;
constexpr int kExitCancelled = 3;

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " SOURCE DESTINATION [OPTIONS]\n\n";
    std::cout << "Copy options:\n";
    std::cout << "  --mir                 Mirror: copy and delete destination extras\n";
    std::cout << "  --purge               Delete destination entries missing from source\n";
    std::cout << "  --mov                 Remove source files after they are copied\n";
    std::cout << "  --copy FLAGS          What to copy (D=Data A=Attributes T=Timestamps\n";
    std::cout << "                        S=Security O=Owner U=aUditing, default DAT)\n";
    std::cout << "  --copyall, -a         Same as --copy DATSOU\n";
    std::cout << "  -c, --checksum        Compare by checksum instead of size and time\n";
    std::cout << "  -b, --block-size N    Delta block size in bytes (default 1024)\n";
    std::cout << "  -z, --compress        Compress delta literals with zstd\n";
    std::cout << "\nSelection:\n";
    std::cout << "  --xf PATTERN...       Exclude files matching the patterns\n";
    std::cout << "  --xd PATTERN...       Exclude directories matching the patterns\n";
    std::cout << "  --min N               Skip files smaller than N bytes\n";
    std::cout << "  --max N               Skip files larger than N bytes\n";
    std::cout << "\nRun control:\n";
    std::cout << "  -n, --dry-run, -l     List what would be done, change nothing\n";
    std::cout << "  --confirm             Show the plan and ask before copying\n";
    std::cout << "  -r, --retry N         Retries for transient failures (default 0)\n";
    std::cout << "  -w, --wait S          Seconds between retries (default 30)\n";
    std::cout << "  --mt N                Worker threads (default: hardware threads)\n";
    std::cout << "  --config FILE         Load options from a JSON file first\n";
    std::cout << "\nOutput:\n";
    std::cout << "  -v                    More output (repeat for trace)\n";
    std::cout << "  -q                    Only warnings and errors\n";
    std::cout << "  --log FILE            Also write the log to FILE (overwritten)\n";
    std::cout << "  --summary-json FILE   Write the run summary as JSON\n";
    std::cout << "  -h, --help            Show this help message\n";
    std::cout << "\nExit status: 0 success, 1 some tasks failed, 2 invalid options, 3 cancelled\n";
}

std::optional<std::uint64_t> parse_number(const std::string& text) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        return std::nullopt;
    }
    try {
        return std::stoull(text);
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

struct Arguments {
    psync::SyncOptions options;
    bool show_help = false;
};

psync::Result<Arguments> parse_arguments(int argc, char* argv[]) {
    Arguments args;
    auto& options = args.options;
    std::vector<std::string> positional;

    auto config_error = [](std::string message) {
        return psync::Err<Arguments>(psync::ErrorKind::ConfigurationError, std::move(message));
    };

    // A config file is the base layer; flags below override it
    for (int i = 1; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == "--config") {
            if (auto loaded = psync::load_options_file(argv[i + 1], options); loaded.is_error()) {
                return psync::Err<Arguments>(loaded.error());
            }
        }
    }

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        auto next_value = [&](const std::string& flag) -> std::optional<std::string> {
            if (i + 1 < argc) {
                return std::string(argv[++i]);
            }
            spdlog::error("{} requires a value", flag);
            return std::nullopt;
        };
        auto next_number = [&](const std::string& flag) -> std::optional<std::uint64_t> {
            auto value = next_value(flag);
            if (!value) {
                return std::nullopt;
            }
            auto number = parse_number(*value);
            if (!number) {
                spdlog::error("Invalid number for {}: {}", flag, *value);
            }
            return number;
        };
        auto patterns = [&](std::vector<std::string>& out) {
            while (i + 1 < argc && argv[i + 1][0] != '-') {
                out.emplace_back(argv[++i]);
            }
        };

        if (arg == "-h" || arg == "--help") {
            args.show_help = true;
            return psync::Ok(std::move(args));
        } else if (arg == "--mir") {
            options.mirror = true;
        } else if (arg == "--purge") {
            options.purge = true;
        } else if (arg == "--mov") {
            options.move_files = true;
        } else if (arg == "-n" || arg == "--dry-run" || arg == "-l") {
            options.dry_run = true;
        } else if (arg == "--confirm") {
            options.confirm = true;
        } else if (arg == "-c" || arg == "--checksum") {
            options.compare_mode = psync::CompareMode::Checksum;
        } else if (arg == "-z" || arg == "--compress") {
            options.compression.enabled = true;
        } else if (arg == "--copyall" || arg == "-a" || arg == "--archive") {
            options.copy_flags = psync::CopyFlags::all();
        } else if (arg == "--copy") {
            auto value = next_value(arg);
            if (!value) {
                return config_error("missing copy flags");
            }
            options.copy_flags = psync::CopyFlags::parse(*value);
        } else if (arg == "--xf") {
            patterns(options.exclude_files);
        } else if (arg == "--xd") {
            patterns(options.exclude_dirs);
        } else if (arg == "--min" || arg == "--max") {
            auto value = next_number(arg);
            if (!value) {
                return config_error("invalid " + arg);
            }
            (arg == "--min" ? options.min_size : options.max_size) = *value;
        } else if (arg == "-r" || arg == "--retry") {
            auto value = next_number(arg);
            if (!value) {
                return config_error("invalid retry count");
            }
            options.retry_count = static_cast<std::uint32_t>(*value);
        } else if (arg == "-w" || arg == "--wait") {
            auto value = next_number(arg);
            if (!value) {
                return config_error("invalid wait time");
            }
            options.retry_wait = std::chrono::seconds(*value);
        } else if (arg == "--mt") {
            auto value = next_number(arg);
            if (!value || *value == 0) {
                return config_error("thread count must be a positive number");
            }
            options.workers = static_cast<std::size_t>(*value);
        } else if (arg == "-b" || arg == "--block-size") {
            auto value = next_number(arg);
            if (!value) {
                return config_error("invalid block size");
            }
            options.block_size = static_cast<std::size_t>(*value);
        } else if (arg == "-v" || arg == "-vv") {
            options.verbosity += arg == "-vv" ? 2 : 1;
        } else if (arg == "-q") {
            options.quiet = true;
        } else if (arg == "--log") {
            auto value = next_value(arg);
            if (!value) {
                return config_error("missing log file");
            }
            options.log_file = fs::path(*value);
        } else if (arg == "--summary-json") {
            auto value = next_value(arg);
            if (!value) {
                return config_error("missing summary file");
            }
            options.summary_json = fs::path(*value);
        } else if (arg == "--config") {
            ++i;
        } else if (!arg.empty() && arg[0] == '-') {
            return config_error("unknown option: " + arg);
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() > 2) {
        return config_error("too many paths given");
    }
    if (positional.size() >= 1) {
        options.source = positional[0];
    }
    if (positional.size() == 2) {
        options.destination = positional[1];
    }
    return psync::Ok(std::move(args));
}

bool ask_confirmation(const psync::sync::SyncPlan& plan) {
    std::cout << "Proceed with " << plan.tasks.size() << " task(s)? [y/N] " << std::flush;
    std::string answer;
    if (!std::getline(std::cin, answer)) {
        return false;
    }
    return answer == "y" || answer == "Y" || answer == "yes";
}

bool write_summary(const fs::path& path, const psync::sync::RunSummary& summary) {
    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        spdlog::error("Cannot write summary to {}", path.string());
        return false;
    }
    out << psync::sync::summary_to_json(summary) << '\n';
    return static_cast<bool>(out);
}

} // namespace

int main(int argc, char* argv[]) {
    auto parsed = parse_arguments(argc, argv);
    if (parsed.is_error()) {
        spdlog::error("{}", parsed.error().describe());
        print_usage(argv[0]);
        return kExitConfigError;
    }
    if (parsed.value().show_help) {
        print_usage(argv[0]);
        return kExitOk;
    }

    const auto& options = parsed.value().options;
    if (auto logging = psync::init_logging({options.verbosity, options.quiet, options.log_file}); logging.is_error()) {
        spdlog::error("{}", logging.error().describe());
        return kExitConfigError;
    }
    spdlog::debug("Effective options:\n{}", psync::options_to_json(options));

    psync::events::EventBus bus;
    psync::events::LoggerComponent logger(bus);
    psync::events::ProgressTallyComponent tally(bus);
    psync::events::AsyncProgressReporter reporter(bus);

    psync::sync::SyncEnvironment environment;
    environment.reporter = &reporter;
    environment.confirm = ask_confirmation;

    psync::sync::SyncEngine engine(options, std::move(environment));
    auto result = engine.run();
    reporter.flush();

    if (result.is_error()) {
        const auto& error = result.error();
        switch (error.kind) {
            case psync::ErrorKind::ConfigurationError:
                spdlog::error("Invalid options: {}", error.describe());
                return kExitConfigError;
            case psync::ErrorKind::Cancellation:
                spdlog::warn("{}", error.describe());
                return kExitCancelled;
            default:
                spdlog::error("Run aborted: {}", error.describe());
                return kExitPartialFailure;
        }
    }

    const auto& summary = result.value();
    if (options.summary_json && !write_summary(*options.summary_json, summary)) {
        return kExitPartialFailure;
    }
    if (reporter.dropped() > 0) {
        spdlog::debug("{} progress event(s) dropped under load", reporter.dropped());
    }
    return summary.any_failures() ? kExitPartialFailure : kExitOk;
}
