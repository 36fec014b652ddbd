#include "psync/core/config.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <system_error>

namespace psync {
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

Result<void> config_error(std::string message) {
    return Err<void>(Error{ErrorKind::ConfigurationError, std::move(message)});
}

bool is_nested_within(const fs::path& child, const fs::path& parent) {
    auto child_it = child.begin();
    for (auto parent_it = parent.begin(); parent_it != parent.end(); ++parent_it, ++child_it) {
        if (parent_it->empty()) {
            continue;
        }
        if (child_it == child.end() || *child_it != *parent_it) {
            return false;
        }
    }
    return true;
}

fs::path normalized(const fs::path& path) {
    std::error_code ec;
    auto canonical = fs::weakly_canonical(path, ec);
    if (ec) {
        return path.lexically_normal();
    }
    return canonical.lexically_normal();
}

std::vector<std::string> string_list(const json& value) {
    std::vector<std::string> items;
    if (value.is_string()) {
        items.push_back(value.get<std::string>());
        return items;
    }
    for (const auto& item : value) {
        items.push_back(item.get<std::string>());
    }
    return items;
}

} // namespace

CopyFlags CopyFlags::parse(std::string_view flags) {
    CopyFlags result{false, false, false, false, false, false};
    for (char raw : flags) {
        switch (std::toupper(static_cast<unsigned char>(raw))) {
            case 'D': result.data = true; break;
            case 'A': result.attributes = true; break;
            case 'T': result.timestamps = true; break;
            case 'S': result.security = true; break;
            case 'O': result.owner = true; break;
            case 'U': result.auditing = true; break;
            default: break;
        }
    }
    return result;
}

std::string CopyFlags::to_string() const {
    std::string out;
    if (data) out += 'D';
    if (attributes) out += 'A';
    if (timestamps) out += 'T';
    if (security) out += 'S';
    if (owner) out += 'O';
    if (auditing) out += 'U';
    return out;
}

bool CopyFlags::operator==(const CopyFlags& other) const {
    return data == other.data && attributes == other.attributes && timestamps == other.timestamps &&
           security == other.security && owner == other.owner && auditing == other.auditing;
}

std::size_t resolve_worker_count(const SyncOptions& options, const PlatformInfo& platform, std::size_t cap) {
    if (options.workers != 0) {
        return options.workers;
    }
    const auto workers = std::max<std::size_t>(1, platform.hardware_threads);
    return cap != 0 ? std::min(workers, cap) : workers;
}

Result<void> validate_options(const SyncOptions& options,
                              const PlatformInfo& platform,
                              const WorkerCapPolicy& worker_cap) {
    if (!options.copy_flags.data) {
        return config_error("Data flag (D) must be set for file copying");
    }
    if (options.block_size == 0) {
        return config_error("block size must be > 0");
    }
    if (options.batching.batch_size == 0) {
        return config_error("batch size must be > 0");
    }
    if (options.batching.small_file_threshold > options.batching.large_file_threshold) {
        return config_error("small-file threshold exceeds large-file threshold");
    }
    if (options.min_size && options.max_size && *options.min_size > *options.max_size) {
        return config_error("minimum size exceeds maximum size");
    }
    if (options.compression.enabled &&
        (options.compression.max_ratio <= 0.0 || options.compression.max_ratio > 1.0)) {
        return config_error("compression ratio must be in (0, 1]");
    }

    const auto cap = worker_cap ? worker_cap(platform) : default_worker_cap(platform);
    if (cap == 0) {
        return config_error("worker cap policy returned 0");
    }
    const auto workers = resolve_worker_count(options, platform, cap);
    if (workers > cap) {
        return config_error("Maximum thread count is " + std::to_string(cap) +
                            " to avoid system file handle limits (requested " +
                            std::to_string(workers) + ")");
    }

    if (options.source.empty() || options.destination.empty()) {
        return config_error("source and destination are required");
    }

    std::error_code ec;
    if (!fs::is_directory(options.source, ec)) {
        return config_error("source is not a directory: " + options.source.string());
    }
    if (fs::exists(options.destination, ec) && !fs::is_directory(options.destination, ec)) {
        return config_error("destination exists and is not a directory: " +
                            options.destination.string());
    }

    const auto source = normalized(options.source);
    const auto destination = normalized(options.destination);
    if (source == destination) {
        return config_error("source and destination are the same directory");
    }
    if (is_nested_within(destination, source)) {
        return config_error("destination lies inside the source tree");
    }

    return Ok();
}

Result<void> merge_options_json(std::string_view json_text, SyncOptions& options) {
    const auto doc = json::parse(json_text.begin(), json_text.end(), nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return config_error("configuration is not a JSON object");
    }

    try {
        if (doc.contains("source")) options.source = doc["source"].get<std::string>();
        if (doc.contains("destination")) options.destination = doc["destination"].get<std::string>();
        if (doc.contains("purge")) options.purge = doc["purge"].get<bool>();
        if (doc.contains("mirror")) options.mirror = doc["mirror"].get<bool>();
        if (doc.contains("dry_run")) options.dry_run = doc["dry_run"].get<bool>();
        if (doc.contains("confirm")) options.confirm = doc["confirm"].get<bool>();
        if (doc.contains("move_files")) options.move_files = doc["move_files"].get<bool>();
        if (doc.contains("checksum")) {
            options.compare_mode = doc["checksum"].get<bool>() ? CompareMode::Checksum
                                                                : CompareMode::SizeAndTime;
        }
        if (doc.contains("exclude_files")) options.exclude_files = string_list(doc["exclude_files"]);
        if (doc.contains("exclude_dirs")) options.exclude_dirs = string_list(doc["exclude_dirs"]);
        if (doc.contains("min_size")) options.min_size = doc["min_size"].get<std::uint64_t>();
        if (doc.contains("max_size")) options.max_size = doc["max_size"].get<std::uint64_t>();
        if (doc.contains("copy_flags")) options.copy_flags = CopyFlags::parse(doc["copy_flags"].get<std::string>());
        if (doc.value("archive", false)) options.copy_flags = CopyFlags::all();
        if (doc.contains("retry_count")) options.retry_count = doc["retry_count"].get<std::uint32_t>();
        if (doc.contains("retry_wait_seconds")) {
            options.retry_wait = std::chrono::seconds(doc["retry_wait_seconds"].get<std::uint32_t>());
        }
        if (doc.contains("block_size")) options.block_size = doc["block_size"].get<std::size_t>();
        if (doc.contains("delta_threshold")) options.delta_threshold = doc["delta_threshold"].get<std::uint64_t>();
        if (doc.contains("workers")) options.workers = doc["workers"].get<std::size_t>();
        if (doc.contains("queue_capacity")) options.queue_capacity = doc["queue_capacity"].get<std::size_t>();

        if (doc.contains("batching")) {
            const auto& batching = doc["batching"];
            auto& policy = options.batching;
            policy.small_file_threshold = batching.value("small_file_threshold", policy.small_file_threshold);
            policy.batch_size = batching.value("batch_size", policy.batch_size);
            policy.large_file_threshold = batching.value("large_file_threshold", policy.large_file_threshold);
            policy.large_buffer_size = batching.value("large_buffer_size", policy.large_buffer_size);
            policy.default_buffer_size = batching.value("default_buffer_size", policy.default_buffer_size);
        }

        if (doc.contains("compression")) {
            const auto& compression = doc["compression"];
            auto& settings = options.compression;
            if (compression.is_boolean()) {
                settings.enabled = compression.get<bool>();
            } else {
                settings.enabled = compression.value("enabled", settings.enabled);
                settings.level = compression.value("level", settings.level);
                settings.max_ratio = compression.value("max_ratio", settings.max_ratio);
                settings.min_literal = compression.value("min_literal", settings.min_literal);
            }
        }

        if (doc.contains("verbosity")) options.verbosity = doc["verbosity"].get<int>();
        if (doc.contains("log_file")) options.log_file = fs::path(doc["log_file"].get<std::string>());
        if (doc.contains("summary_json")) options.summary_json = fs::path(doc["summary_json"].get<std::string>());
    } catch (const json::exception& e) {
        return config_error(std::string("invalid configuration value: ") + e.what());
    }

    return Ok();
}

Result<void> load_options_file(const fs::path& path, SyncOptions& options) {
    std::ifstream input(path);
    if (!input) {
        return config_error("cannot open configuration file: " + path.string());
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return merge_options_json(buffer.str(), options);
}

std::string options_to_json(const SyncOptions& options) {
    json j;
    j["source"] = options.source.string();
    j["destination"] = options.destination.string();
    j["purge"] = options.purge_enabled();
    j["mirror"] = options.mirror;
    j["dry_run"] = options.dry_run;
    j["confirm"] = options.confirm;
    j["move_files"] = options.move_files;
    j["checksum"] = options.compare_mode == CompareMode::Checksum;
    j["exclude_files"] = options.exclude_files;
    j["exclude_dirs"] = options.exclude_dirs;
    if (options.min_size) j["min_size"] = *options.min_size;
    if (options.max_size) j["max_size"] = *options.max_size;
    j["copy_flags"] = options.copy_flags.to_string();
    j["retry_count"] = options.retry_count;
    j["retry_wait_seconds"] =
        std::chrono::duration_cast<std::chrono::seconds>(options.retry_wait).count();
    j["block_size"] = options.block_size;
    j["delta_threshold"] = options.delta_threshold;
    j["workers"] = options.workers;
    j["queue_capacity"] = options.queue_capacity;
    j["batching"] = {
        {"small_file_threshold", options.batching.small_file_threshold},
        {"batch_size", options.batching.batch_size},
        {"large_file_threshold", options.batching.large_file_threshold},
        {"large_buffer_size", options.batching.large_buffer_size},
        {"default_buffer_size", options.batching.default_buffer_size},
    };
    j["compression"] = {
        {"enabled", options.compression.enabled},
        {"level", options.compression.level},
        {"max_ratio", options.compression.max_ratio},
        {"min_literal", options.compression.min_literal},
    };
    return j.dump(2);
}

} // namespace psync
